#ifndef CALLBACKS_HPP
#define CALLBACKS_HPP

#include <chrono>
#include <cstddef>

#include "dcmtk/config/osconfig.h"
#include "dcmtk/dcmnet/dimse.h"

#include "StudyRecord.hpp"

typedef struct
{
	T_ASC_Association *assoc;
	T_ASC_PresentationContextID presID;
	MoveProgress *progress;
} MoveCallbackInfo;

// DIMSE_MoveUserCallback, records sub-operation counters of pending C-MOVE responses
void moveCallback(void *move_callback_data,
				  T_DIMSE_C_MoveRQ *request,
				  int response_count,
				  T_DIMSE_C_MoveRSP *response);

struct TransferProgressEvent {
	std::size_t                   m_index{0}; // 1-based position in the batch
	std::size_t                   m_total{0};
	const TransferJob *           m_job{nullptr};
	std::chrono::duration<double> m_elapsed{0.0};
	double                        m_series_rate{0.0};  // images/s of this job
	double                        m_average_rate{0.0}; // images/s since the batch started
};

class TransferCallback {
public:
	virtual ~TransferCallback() = default;

	virtual void transferStarted(const TransferProgressEvent &event) = 0;

	virtual void transferFinished(const TransferProgressEvent &event) = 0;
};

// prints one block per job to stdout
class TransferConsoleCallback final : public TransferCallback {
public:
	TransferConsoleCallback() = default;

	~TransferConsoleCallback() override = default;

	void transferStarted(const TransferProgressEvent &event) override;

	void transferFinished(const TransferProgressEvent &event) override;
};

#endif //CALLBACKS_HPP
