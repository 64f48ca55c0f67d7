#include "SyncScheduler.hpp"

#include <algorithm>
#include <thread>

#include "dcmtk/config/osconfig.h"
#include "dcmtk/oflog/oflog.h"

#include "fmt/format.h"

static OFLogger schedulerLogger = OFLog::getLogger("fno.apps.fnostudysync.scheduler");

constexpr std::chrono::milliseconds CANCEL_POLL_INTERVAL{200};

SyncScheduler::SyncScheduler(SyncCycle &               cycle,
                             const SyncOptions &       options,
                             std::chrono::milliseconds interval,
                             const std::atomic<bool> & cancel_requested) : m_cycle(cycle),
                                                                           m_options(options),
                                                                           m_interval(interval),
                                                                           m_cancelRequested(cancel_requested) {}

SyncCycleStats SyncScheduler::runOnce() {
	++m_cycleNumber;
	const auto now = SyncClock::now();
	printCycleHeader(m_cycleNumber, now, m_options);

	SyncCycleStats stats = m_cycle.run(m_cycleNumber, now);
	printCycleStats(stats);
	m_totals.add(stats);
	return stats;
}

bool SyncScheduler::pause() const {
	const auto until = std::chrono::steady_clock::now() + m_interval;
	while (!m_cancelRequested.load()) {
		const auto now = std::chrono::steady_clock::now();
		if (now >= until)
			return true;
		std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(until - now, CANCEL_POLL_INTERVAL));
	}
	return false;
}

void SyncScheduler::run() {
	OFLOG_INFO(schedulerLogger,
	           fmt::format("Starting automatic synchronization, one cycle every {} ms, {} selection",
		           m_interval.count(),
		           selectionModeName(m_options.m_policy.m_mode)));

	while (!m_cancelRequested.load()) {
		const SyncCycleStats stats = runOnce();
		if (stats.failed()) {
			OFLOG_WARN(schedulerLogger,
			           "Cycle " << stats.m_cycle << " failed, retrying after the normal interval");
		}

		if (m_cancelRequested.load())
			break;

		fmt::print("\nWaiting {} seconds before next sync cycle...\n",
		           std::chrono::duration_cast<std::chrono::seconds>(m_interval).count());
		if (!pause())
			break;
	}

	OFLOG_INFO(schedulerLogger, "Cancellation requested after " << m_totals.m_cycles << " cycle(s)");
}
