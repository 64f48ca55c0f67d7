#ifndef SYNCSCHEDULER_HPP
#define SYNCSCHEDULER_HPP

#include <atomic>
#include <chrono>

#include "StudyRecord.hpp"
#include "SyncCycle.hpp"
#include "SyncReport.hpp"

/*
 * Runs sync cycles back to back with a fixed pause in between until
 * cancellation is requested. Cancellation is checked before a cycle starts
 * and while pausing; a running cycle is always completed first.
 */
class SyncScheduler {
public:
	SyncScheduler(SyncCycle &               cycle,
	              const SyncOptions &       options,
	              std::chrono::milliseconds interval,
	              const std::atomic<bool> & cancel_requested);

	void run();

	// one cycle with header and statistics, used for download-day mode
	SyncCycleStats runOnce();

	const SyncTotals &totals() const { return m_totals; }

private:
	// false when cancellation interrupted the pause
	bool pause() const;

	SyncCycle &               m_cycle;
	const SyncOptions &       m_options;
	std::chrono::milliseconds m_interval;
	const std::atomic<bool> & m_cancelRequested;
	unsigned long             m_cycleNumber{0};
	SyncTotals                m_totals{};
};

#endif //SYNCSCHEDULER_HPP
