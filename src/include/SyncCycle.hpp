#ifndef SYNCCYCLE_HPP
#define SYNCCYCLE_HPP

#include <atomic>

#include "dcmtk/config/osconfig.h"
#include "dcmtk/ofstd/ofcond.h"

#include "Callbacks.hpp"
#include "DicomServices.hpp"
#include "StudyRecord.hpp"
#include "SyncConfig.hpp"

/*
 * One reconciliation pass:
 * QueryingRemote -> QueryingLocal -> Filtering -> Comparing -> Selecting
 * -> Transferring -> Reporting -> Done
 *
 * An empty remote result, an empty time window or nothing left to transfer
 * jumps straight to Reporting. A query failure ends the pass in CycleFailed;
 * the returned stats then name the failing step and the error.
 */
class SyncCycle {
public:
	SyncCycle(DirectoryService &       remote,
	          DirectoryService &       local,
	          TransferService &        transfer,
	          const SyncOptions &      options,
	          const std::atomic<bool> &cancel_requested,
	          TransferCallback *       callback = nullptr);

	SyncCycleStats run(unsigned long cycle_number, SyncClock::time_point now);

	CycleState state() const { return m_state; }

private:
	void enter(CycleState state, SyncCycleStats &stats);

	void fail(const OFCondition &cond, SyncCycleStats &stats);

	void finish(SyncCycleStats &stats, SyncClock::time_point started);

	DirectoryService &       m_remote;
	DirectoryService &       m_local;
	TransferService &        m_transfer;
	const SyncOptions &      m_options;
	const std::atomic<bool> &m_cancelRequested;
	TransferCallback *       m_callback{nullptr};
	CycleState               m_state{CycleState::Done};
};

#endif //SYNCCYCLE_HPP
