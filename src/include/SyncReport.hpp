#ifndef SYNCREPORT_HPP
#define SYNCREPORT_HPP

#include <string_view>
#include <vector>

#include "StudyRecord.hpp"
#include "SyncConfig.hpp"

// running totals over all cycles, display only
struct SyncTotals {
	unsigned long m_cycles{0};
	unsigned long m_failed_cycles{0};
	unsigned long m_series_transferred{0};
	unsigned long m_series_failed{0};
	unsigned long m_images_transferred{0};

	void add(const SyncCycleStats &stats);
};

void printSectionHeader(std::string_view title);

void printBanner(const SyncConfig &config);

void printCycleHeader(unsigned long cycle, SyncClock::time_point now, const SyncOptions &options);

void printStudyTable(const std::vector<StudyRecord> &studies, std::string_view title);

void printCycleStats(const SyncCycleStats &stats);

void printShutdown(const SyncTotals &totals);

#endif //SYNCREPORT_HPP
