#include "SyncCycle.hpp"

#include <algorithm>

#include "dcmtk/oflog/oflog.h"

#include "fmt/color.h"
#include "fmt/format.h"

#include "SelectionPolicy.hpp"
#include "StudyComparator.hpp"
#include "SyncReport.hpp"
#include "TimeWindow.hpp"
#include "TransferSequencer.hpp"

static OFLogger cycleLogger = OFLog::getLogger("fno.apps.fnostudysync.cycle");

SyncCycle::SyncCycle(DirectoryService &       remote,
                     DirectoryService &       local,
                     TransferService &        transfer,
                     const SyncOptions &      options,
                     const std::atomic<bool> &cancel_requested,
                     TransferCallback *       callback) : m_remote(remote),
                                                          m_local(local),
                                                          m_transfer(transfer),
                                                          m_options(options),
                                                          m_cancelRequested(cancel_requested),
                                                          m_callback(callback) {}

void SyncCycle::enter(const CycleState state, SyncCycleStats &stats) {
	OFLOG_DEBUG(cycleLogger, "Cycle " << stats.m_cycle << ": " << cycleStateName(m_state) << " -> "
	            << cycleStateName(state));
	m_state       = state;
	stats.m_state = state;
}

void SyncCycle::fail(const OFCondition &cond, SyncCycleStats &stats) {
	stats.m_failed_step = m_state;
	stats.m_error       = cond.text();
	OFLOG_ERROR(cycleLogger,
	            "Cycle " << stats.m_cycle << " aborted during " << cycleStateName(m_state) << ": " << cond.text());
	enter(CycleState::CycleFailed, stats);
}

void SyncCycle::finish(SyncCycleStats &stats, const SyncClock::time_point started) {
	stats.m_elapsed = SyncClock::now() - started;
	if (stats.failed())
		return;

	enter(CycleState::Reporting, stats);
	OFLOG_INFO(cycleLogger,
	           fmt::format("Cycle {}: {} remote studies ({} in window), {} local, {} missing, "
		           "{} series considered, {}/{} transferred, {} images",
		           stats.m_cycle,
		           stats.m_remote_studies,
		           stats.m_remote_studies_in_window,
		           stats.m_local_studies,
		           stats.m_missing_studies,
		           stats.m_series_considered,
		           stats.m_series_transferred,
		           stats.m_series_selected,
		           stats.m_images_transferred));
	enter(CycleState::Done, stats);
}

SyncCycleStats SyncCycle::run(const unsigned long cycle_number, const SyncClock::time_point now) {
	const auto     started = SyncClock::now();
	SyncCycleStats stats{};
	stats.m_cycle      = cycle_number;
	stats.m_started_at = started;
	m_state            = CycleState::QueryingRemote;
	stats.m_state      = m_state;

	QueryDateRange range{};
	if (m_options.m_downloadDay) {
		const OFCondition cond = parseDownloadDay(*m_options.m_downloadDay, now, range);
		if (cond.bad()) {
			fail(cond, stats);
			finish(stats, started);
			return stats;
		}
	} else {
		range = queryDateRange(now, m_options.m_windowHours);
	}
	stats.m_date_from = range.m_from;
	stats.m_date_to   = range.m_to;

	printSectionHeader("Querying Remote Server");
	std::vector<StudyRecord> remoteStudies{};
	OFCondition              cond = m_remote.findStudies(range.m_from, range.m_to, remoteStudies);
	if (cond.bad()) {
		fail(cond, stats);
		finish(stats, started);
		return stats;
	}
	stats.m_remote_studies = static_cast<unsigned int>(remoteStudies.size());
	fmt::print("Found {} studies on remote\n", remoteStudies.size());

	if (remoteStudies.empty()) {
		fmt::print("No remote studies found between {} and {}\n", range.m_from, range.m_to);
		finish(stats, started);
		return stats;
	}

	enter(CycleState::QueryingLocal, stats);
	printSectionHeader("Querying Local Server");
	std::vector<StudyRecord> localStudies{};
	cond = m_local.findStudies(range.m_from, range.m_to, localStudies);
	if (cond.bad()) {
		fail(cond, stats);
		finish(stats, started);
		return stats;
	}
	stats.m_local_studies = static_cast<unsigned int>(localStudies.size());
	fmt::print("Found {} studies on local\n", localStudies.size());

	enter(CycleState::Filtering, stats);
	std::vector<StudyRecord> inWindow{};
	if (m_options.m_downloadDay) {
		inWindow = remoteStudies;
		fmt::print("Download day {}: keeping all {} studies\n", range.m_from, inWindow.size());
	} else {
		inWindow = filterStudiesByWindow(remoteStudies, now, m_options.m_windowHours);
		fmt::print("Filtered to {} studies within last {} hours (from {} total)\n",
		           inWindow.size(),
		           m_options.m_windowHours,
		           remoteStudies.size());
	}
	stats.m_remote_studies_in_window = static_cast<unsigned int>(inWindow.size());

	if (inWindow.empty()) {
		fmt::print("No remote studies found within last {} hours\n", m_options.m_windowHours);
		finish(stats, started);
		return stats;
	}
	printStudyTable(inWindow, "Remote studies");

	enter(CycleState::Comparing, stats);
	std::vector<StudyComparison> comparisons{};
	cond = StudyComparator{m_remote, m_local}.compare(inWindow, localStudies, comparisons);
	if (cond.bad()) {
		fail(cond, stats);
		finish(stats, started);
		return stats;
	}

	unsigned int eligible{0};
	for (const auto &comparison : comparisons) {
		if (comparison.m_missing_locally)
			++stats.m_missing_studies;
		stats.m_series_considered += static_cast<unsigned int>(comparison.m_series.size());
		eligible += static_cast<unsigned int>(std::ranges::count_if(comparison.m_series,
		                                                            [](const CompletenessResult &result) {
			                                                            return result.eligible();
		                                                            }));
	}

	if (eligible == 0) {
		fmt::print("{}\n",
		           fmt::format(fg(fmt::color::green),
		                       "No series found to transfer, all relevant series are present on local server"));
		finish(stats, started);
		return stats;
	}

	enter(CycleState::Selecting, stats);
	std::vector<TransferJob> jobs = selectTransferJobs(comparisons, m_options.m_policy);
	stats.m_series_selected       = static_cast<unsigned int>(jobs.size());
	fmt::print("Found {} series to transfer ({})\n", jobs.size(), m_options.m_policy.describe());

	if (jobs.empty()) {
		finish(stats, started);
		return stats;
	}

	enter(CycleState::Transferring, stats);
	printSectionHeader("Transferring");
	TransferSequencer{m_transfer, m_cancelRequested, m_callback}.run(jobs, stats);

	finish(stats, started);
	return stats;
}
