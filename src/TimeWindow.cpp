#include "TimeWindow.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iterator>

#include "fmt/chrono.h"
#include "fmt/format.h"

#include "SyncConditions.hpp"

static auto allDigits = [](std::string_view text) {
	return !text.empty() && std::ranges::all_of(text, [](const char c) { return c >= '0' && c <= '9'; });
};

// "123456.789", "12:34:56", "1234" -> "123456", "123400"
static std::optional<std::string> normalizeStudyTime(std::string_view study_time) {
	std::string time{study_time.substr(0, study_time.find('.'))};
	std::erase(time, ':');
	std::erase_if(time, [](const unsigned char c) { return std::isspace(c) != 0; });

	if (!allDigits(time) || time.length() % 2 != 0)
		return std::nullopt;

	if (time.length() > 6)
		time.resize(6);
	time.append(6 - time.length(), '0');
	return time;
}

std::optional<SyncClock::time_point> parseStudyDateTime(std::string_view study_date,
                                                        std::string_view study_time) {
	if (study_date.length() != 8 || !allDigits(study_date))
		return std::nullopt;

	const auto time = normalizeStudyTime(study_time);
	if (!time)
		return std::nullopt;

	const int year  = std::stoi(std::string{study_date.substr(0, 4)});
	const int month = std::stoi(std::string{study_date.substr(4, 2)});
	const int day   = std::stoi(std::string{study_date.substr(6, 2)});
	const int hour  = std::stoi(time->substr(0, 2));
	const int min   = std::stoi(time->substr(2, 2));
	const int sec   = std::stoi(time->substr(4, 2));

	if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || min > 59 || sec > 60)
		return std::nullopt;

	std::tm tm{};
	tm.tm_year  = year - 1900;
	tm.tm_mon   = month - 1;
	tm.tm_mday  = day;
	tm.tm_hour  = hour;
	tm.tm_min   = min;
	tm.tm_sec   = sec;
	tm.tm_isdst = -1;

	const std::time_t tt = std::mktime(&tm);
	if (tt == static_cast<std::time_t>(-1))
		return std::nullopt;

	// mktime normalizes 20250230 to March 2nd
	if (tm.tm_mday != day || tm.tm_mon != month - 1)
		return std::nullopt;

	return SyncClock::from_time_t(tt);
}

std::vector<StudyRecord> filterStudiesByWindow(const std::vector<StudyRecord> &studies,
                                               const SyncClock::time_point     now,
                                               const unsigned int              window_hours) {
	// study times carry whole seconds only
	const SyncClock::time_point windowStart = std::chrono::floor<std::chrono::seconds>(now - std::chrono::hours{window_hours});

	std::vector<StudyRecord> inWindow{};
	std::ranges::copy_if(studies,
	                     std::back_inserter(inWindow),
	                     [&](const StudyRecord &study) {
		                     const auto created = parseStudyDateTime(study.m_study_date, study.m_study_time);
		                     if (!created)
			                     return true;
		                     return *created >= windowStart && *created <= now;
	                     });
	return inWindow;
}

std::string toDicomDate(const SyncClock::time_point time) {
	const std::time_t tt = SyncClock::to_time_t(time);
	const std::tm     tm = *std::localtime(&tt);
	return fmt::format("{:%Y%m%d}", tm);
}

QueryDateRange queryDateRange(const SyncClock::time_point now, const unsigned int window_hours) {
	const std::string yesterday   = toDicomDate(now - std::chrono::hours{24});
	const std::string windowStart = toDicomDate(now - std::chrono::hours{window_hours});

	return QueryDateRange{std::min(yesterday, windowStart), toDicomDate(now)};
}

OFCondition parseDownloadDay(std::string_view day_keyword, const SyncClock::time_point now, QueryDateRange &range) {
	std::string keyword{day_keyword};
	std::ranges::transform(keyword, keyword.begin(), [](const unsigned char c) { return std::tolower(c); });

	std::string day{};
	if (keyword == "today")
		day = toDicomDate(now);
	else if (keyword == "yesterday")
		day = toDicomDate(now - std::chrono::hours{24});
	else if (parseStudyDateTime(keyword, "000000"))
		day = keyword;
	else
		return SYNC_EC_InvalidDownloadDay;

	range = QueryDateRange{day, day};
	return EC_Normal;
}
