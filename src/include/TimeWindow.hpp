#ifndef TIMEWINDOW_HPP
#define TIMEWINDOW_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dcmtk/config/osconfig.h"
#include "dcmtk/ofstd/ofcond.h"

#include "StudyRecord.hpp"

constexpr unsigned int DEFAULT_WINDOW_HOURS = 3;

struct QueryDateRange {
	std::string m_from{}; // YYYYMMDD
	std::string m_to{};   // YYYYMMDD

	// DICOM range matching value "from-to"
	std::string dicomRange() const { return m_from + "-" + m_to; }
};

// combines StudyDate (YYYYMMDD) and StudyTime (HHMMSS.FFFFFF, HH:MM:SS, HHMM, HH) in local time
std::optional<SyncClock::time_point> parseStudyDateTime(std::string_view study_date,
                                                        std::string_view study_time);

// studies created within [now - window_hours, now]; unparsable timestamps are kept
std::vector<StudyRecord> filterStudiesByWindow(const std::vector<StudyRecord> &studies,
                                               SyncClock::time_point           now,
                                               unsigned int                    window_hours = DEFAULT_WINDOW_HOURS);

// [min(yesterday, day of now - window_hours), today]
QueryDateRange queryDateRange(SyncClock::time_point now, unsigned int window_hours = DEFAULT_WINDOW_HOURS);

// "today", "yesterday" or YYYYMMDD, resolved to a single day range
OFCondition parseDownloadDay(std::string_view day_keyword, SyncClock::time_point now, QueryDateRange &range);

std::string toDicomDate(SyncClock::time_point time);

#endif //TIMEWINDOW_HPP
