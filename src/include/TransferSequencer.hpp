#ifndef TRANSFERSEQUENCER_HPP
#define TRANSFERSEQUENCER_HPP

#include <atomic>
#include <vector>

#include "Callbacks.hpp"
#include "DicomServices.hpp"
#include "StudyRecord.hpp"

/*
 * Executes a transfer batch strictly one job at a time.
 *
 * A failed move marks its job failed and the batch continues with the next
 * job. Cancellation is honoured only before a job is started, never while a
 * move is in progress. Jobs are not retried, the next cycle re-detects
 * whatever is still missing.
 */
class TransferSequencer {
public:
	TransferSequencer(TransferService &        service,
	                  const std::atomic<bool> &cancel_requested,
	                  TransferCallback *       callback = nullptr);

	// returns the number of jobs that were started
	std::size_t run(std::vector<TransferJob> &jobs, SyncCycleStats &stats);

private:
	TransferService &        m_service;
	const std::atomic<bool> &m_cancelRequested;
	TransferCallback *       m_callback{nullptr};
};

#endif //TRANSFERSEQUENCER_HPP
