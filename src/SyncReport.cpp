#include "SyncReport.hpp"

#include <ctime>
#include <string>

#include "fmt/chrono.h"
#include "fmt/color.h"
#include "fmt/format.h"

#include "TimeWindow.hpp"

constexpr std::size_t REPORT_WIDTH = 100;

static std::string truncated(const std::string &text, const std::size_t width) {
	if (text.length() <= width)
		return text;
	return text.substr(0, width - 3) + "...";
}

static std::string localTimestamp(const SyncClock::time_point time) {
	const std::time_t tt = SyncClock::to_time_t(time);
	const std::tm     tm = *std::localtime(&tt);
	return fmt::format("{:%Y-%m-%d %H:%M:%S}", tm);
}

void SyncTotals::add(const SyncCycleStats &stats) {
	++m_cycles;
	if (stats.failed())
		++m_failed_cycles;
	m_series_transferred += stats.m_series_transferred;
	m_series_failed += stats.m_series_failed;
	m_images_transferred += stats.m_images_transferred;
}

void printSectionHeader(std::string_view title) {
	fmt::print("\n{}\n{}\n{}\n", std::string(80, '='), title, std::string(80, '='));
}

void printBanner(const SyncConfig &config) {
	const SyncOptions &options = config.m_options;

	fmt::print("{}\n", std::string(80, '='));
	fmt::print("DICOM Automatic Synchronization\n");
	fmt::print("{}\n\n", std::string(80, '='));

	if (options.m_downloadDay)
		fmt::print("Mode: DOWNLOAD ALL from day '{}'\n", *options.m_downloadDay);
	else
		fmt::print("Time window: Last {} hours\n", options.m_windowHours);
	fmt::print("Transfer mode: {}\n\n", options.m_policy.describe());

	fmt::print("Configuration:\n");
	fmt::print("  Remote:           {}\n", config.m_remote.describe());
	fmt::print("  Local:            {}\n", config.m_local.describe());
	fmt::print("  Calling AE title: {}\n", config.m_callingAETitle);
	fmt::print("  Move destination: {}\n", config.moveDestination());
	if (!options.m_downloadDay)
		fmt::print("  Cycle interval:   {} seconds\n", config.m_interval.count());
}

void printCycleHeader(const unsigned long cycle, const SyncClock::time_point now, const SyncOptions &options) {
	const std::string hashes(REPORT_WIDTH, '#');
	fmt::print("\n\n{}\nCYCLE {}\n{}\n", hashes, cycle, hashes);
	fmt::print("Starting sync cycle at {}\n", localTimestamp(now));

	if (options.m_downloadDay) {
		QueryDateRange range{};
		if (parseDownloadDay(*options.m_downloadDay, now, range).good())
			fmt::print("Searching for ALL studies from day: {}\n", range.m_from);
	} else {
		const QueryDateRange range = queryDateRange(now, options.m_windowHours);
		fmt::print("Searching for studies from {} to {}\n", range.m_from, range.m_to);
		fmt::print("Filtering studies within last {} hours\n", options.m_windowHours);
	}
}

void printStudyTable(const std::vector<StudyRecord> &studies, std::string_view title) {
	const std::string rule(REPORT_WIDTH, '=');
	fmt::print("\n{}\n{}\n{}\n", rule, title, rule);

	if (studies.empty()) {
		fmt::print("No studies found\n");
		return;
	}

	fmt::print("{:<12} {:<10} {:<25} {:<35} {:<8}\n", "Study Date", "Time", "Patient Name", "Study Description",
	           "Images");
	fmt::print("{}\n", std::string(REPORT_WIDTH, '-'));

	for (const auto &study : studies) {
		fmt::print("{:<12} {:<10} {:<25} {:<35} {:<8}\n",
		           formatDicomDate(study.m_study_date),
		           formatDicomTime(study.m_study_time),
		           truncated(study.m_patient_name, 25),
		           truncated(study.m_description, 35),
		           study.m_image_count);
	}
}

void printCycleStats(const SyncCycleStats &stats) {
	const std::string rule(REPORT_WIDTH, '=');
	fmt::print("\n{}\n", rule);

	if (stats.failed()) {
		fmt::print("Sync cycle {} {} during {}\n",
		           stats.m_cycle,
		           fmt::format(fg(fmt::color::red), "FAILED"),
		           cycleStateName(stats.m_failed_step));
		fmt::print("  Error: {}\n", stats.m_error);
	} else {
		fmt::print("Transfer statistics (cycle {}):\n", stats.m_cycle);
		fmt::print("  Remote studies: {} ({} in window), local studies: {}, missing locally: {}\n",
		           stats.m_remote_studies,
		           stats.m_remote_studies_in_window,
		           stats.m_local_studies,
		           stats.m_missing_studies);
		fmt::print("  Series considered: {}, selected: {}\n", stats.m_series_considered, stats.m_series_selected);
		fmt::print("  Successfully transferred: {}/{} series ({} images)\n",
		           stats.m_series_transferred,
		           stats.m_series_selected,
		           stats.m_images_transferred);
		if (stats.m_series_failed > 0)
			fmt::print("  {}: {} series\n", fmt::format(fg(fmt::color::red), "Failed"), stats.m_series_failed);
		fmt::print("  Total time: {:.1f} seconds ({:.1f} minutes)\n",
		           stats.m_elapsed.count(),
		           stats.m_elapsed.count() / 60.0);
		fmt::print("  Average transfer rate: {:.1f} images/minute\n", stats.throughput());
	}

	fmt::print("Sync cycle completed at {}\n", localTimestamp(stats.m_started_at + std::chrono::duration_cast<
		           SyncClock::duration>(stats.m_elapsed)));
	fmt::print("{}\n", rule);
}

void printShutdown(const SyncTotals &totals) {
	const std::string rule(80, '=');
	fmt::print("\n\n{}\n", rule);
	fmt::print("Synchronization stopped by user\n");
	fmt::print("Total cycles completed: {} ({} failed)\n", totals.m_cycles, totals.m_failed_cycles);
	fmt::print("Total transferred: {} series, {} images\n", totals.m_series_transferred, totals.m_images_transferred);
	if (totals.m_series_failed > 0)
		fmt::print("Total failed transfers: {} series\n", totals.m_series_failed);
	fmt::print("{}\n", rule);
}
