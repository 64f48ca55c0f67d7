#include "Callbacks.hpp"

#include <ctime>

#include "dcmtk/dcmnet/diutil.h"

#include "fmt/chrono.h"
#include "fmt/color.h"
#include "fmt/format.h"

void moveCallback(void *             move_callback_data,
                  T_DIMSE_C_MoveRQ * request,
                  int                response_count,
                  T_DIMSE_C_MoveRSP *response) {
	MoveCallbackInfo *moveCallbackInfo = OFstatic_cast(MoveCallbackInfo*, move_callback_data);
	OFString          temp_string;

	if (moveCallbackInfo != nullptr && moveCallbackInfo->progress != nullptr) {
		moveCallbackInfo->progress->m_remaining = response->NumberOfRemainingSubOperations;
		moveCallbackInfo->progress->m_completed = response->NumberOfCompletedSubOperations;
		moveCallbackInfo->progress->m_failed    = response->NumberOfFailedSubOperations;
		moveCallbackInfo->progress->m_warning   = response->NumberOfWarningSubOperations;
	}

	if (DCM_dcmnetLogger.isEnabledFor(OFLogger::DEBUG_LOG_LEVEL)) {
		DCMNET_INFO("Received Move Response " << response_count << " (" << DU_cmoveStatusString(response->DimseStatus)
		            << ")");
		DCMNET_DEBUG(DIMSE_dumpMessage(temp_string, *response, DIMSE_INCOMING));
	} else {
		DCMNET_DEBUG(fmt::format("Move Response {} (MsgID {}): {} remaining, {} completed, {} failed, {} warning",
			             response_count,
			             request->MessageID,
			             response->NumberOfRemainingSubOperations,
			             response->NumberOfCompletedSubOperations,
			             response->NumberOfFailedSubOperations,
			             response->NumberOfWarningSubOperations));
	}
}

static std::string clockTime() {
	const std::time_t tt = SyncClock::to_time_t(SyncClock::now());
	const std::tm     tm = *std::localtime(&tt);
	return fmt::format("{:%H:%M:%S}", tm);
}

void TransferConsoleCallback::transferStarted(const TransferProgressEvent &event) {
	const TransferJob &job = *event.m_job;

	fmt::print("[{}] [{}/{}] C-MOVE START\n", clockTime(), event.m_index, event.m_total);
	fmt::print("  Patient: {}\n", job.m_study.m_patient_name);
	fmt::print("  Date: {}\n", formatDicomDate(job.m_study.m_study_date));
	fmt::print("  Series: {} ({}) - {} ({} img)\n",
	           job.m_series.m_series_number,
	           job.m_series.m_modality,
	           job.classificationLabel(),
	           job.m_series.m_image_count);
	fmt::print("  Description: {}\n", job.m_series.m_description.substr(0, 60));
}

void TransferConsoleCallback::transferFinished(const TransferProgressEvent &event) {
	const TransferJob &job = *event.m_job;

	if (job.m_succeeded) {
		fmt::print("[{}] C-MOVE {}\n", clockTime(), fmt::format(fg(fmt::color::green), "COMPLETE"));
		fmt::print("  Speed: {:.1f} img/s (this series) | Average: {:.1f} img/s | Time: {:.1f}s\n",
		           event.m_series_rate,
		           event.m_average_rate,
		           event.m_elapsed.count());
	} else {
		fmt::print("[{}] C-MOVE {}\n", clockTime(), fmt::format(fg(fmt::color::red), "FAILED"));
		fmt::print("  Error: {}\n", job.m_error);
	}
	fmt::print("\n");
}
