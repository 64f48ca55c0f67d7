#include "TransferSequencer.hpp"

#include "dcmtk/config/osconfig.h"
#include "dcmtk/oflog/oflog.h"

#include "fmt/format.h"

static OFLogger transferLogger = OFLog::getLogger("fno.apps.fnostudysync.transfer");

static double imagesPerSecond(const unsigned int images, const std::chrono::duration<double> elapsed) {
	return elapsed.count() > 0.0 ? images / elapsed.count() : 0.0;
}

TransferSequencer::TransferSequencer(TransferService &        service,
                                     const std::atomic<bool> &cancel_requested,
                                     TransferCallback *       callback) : m_service(service),
                                                                          m_cancelRequested(cancel_requested),
                                                                          m_callback(callback) {}

std::size_t TransferSequencer::run(std::vector<TransferJob> &jobs, SyncCycleStats &stats) {
	const auto  batchStart = SyncClock::now();
	std::size_t started{0};

	unsigned int totalImages{0};
	for (const auto &job : jobs)
		totalImages += job.m_series.m_image_count;
	OFLOG_INFO(transferLogger, fmt::format("Starting transfer: {} series, {} images", jobs.size(), totalImages));

	for (auto &job : jobs) {
		if (m_cancelRequested.load()) {
			OFLOG_WARN(transferLogger,
			           fmt::format("Cancellation requested, {} of {} transfers not started",
				           jobs.size() - started,
				           jobs.size()));
			break;
		}
		++started;

		TransferProgressEvent event{};
		event.m_index = started;
		event.m_total = jobs.size();
		event.m_job   = &job;
		if (m_callback)
			m_callback->transferStarted(event);

		job.m_started_at = SyncClock::now();
		const OFCondition cond = m_service.moveSeries(job.m_series.m_series_uid, job.m_study.m_study_uid,
		                                              job.m_progress);
		job.m_completed_at = SyncClock::now();
		job.m_succeeded    = cond.good();

		if (job.m_succeeded) {
			const unsigned int images = job.m_progress.m_completed > 0
				                            ? job.m_progress.m_completed
				                            : job.m_series.m_image_count;
			++stats.m_series_transferred;
			stats.m_images_transferred += images;

			event.m_series_rate  = imagesPerSecond(images, job.duration());
			event.m_average_rate = imagesPerSecond(stats.m_images_transferred, *job.m_completed_at - batchStart);
			OFLOG_INFO(transferLogger,
			           fmt::format("Series {} of study {} transferred ({} images)",
				           job.m_series.m_series_uid,
				           job.m_study.m_study_uid,
				           images));
		} else {
			job.m_error = cond.text();
			++stats.m_series_failed;
			OFLOG_ERROR(transferLogger,
			            fmt::format("Transfer of series {} ({} {}) for {} failed: {}",
				            job.m_series.m_series_uid,
				            job.m_series.m_series_number,
				            job.m_series.m_modality,
				            job.m_study.m_patient_name,
				            job.m_error));
		}

		event.m_elapsed = job.duration();
		if (m_callback)
			m_callback->transferFinished(event);

		stats.m_jobs.push_back(JobTiming{job.m_series.m_series_uid,
		                                 *job.m_started_at,
		                                 *job.m_completed_at,
		                                 job.m_succeeded});
	}

	stats.m_transfer_elapsed = SyncClock::now() - batchStart;
	return started;
}
