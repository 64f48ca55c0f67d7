#include "SelectionPolicy.hpp"

#include <algorithm>

#include "dcmtk/config/osconfig.h"
#include "dcmtk/oflog/oflog.h"

#include "fmt/format.h"

static OFLogger selectLogger = OFLog::getLogger("fno.apps.fnostudysync.select");

// image count, then series number, then series instance uid
static bool transferOrder(const CompletenessResult *lhs, const CompletenessResult *rhs) {
	if (lhs->m_remote.m_image_count != rhs->m_remote.m_image_count)
		return lhs->m_remote.m_image_count < rhs->m_remote.m_image_count;
	if (lhs->m_remote.m_series_number != rhs->m_remote.m_series_number)
		return lhs->m_remote.m_series_number < rhs->m_remote.m_series_number;
	return lhs->m_remote.m_series_uid < rhs->m_remote.m_series_uid;
}

static TransferJob makeTransferJob(const StudyRecord &study, const CompletenessResult &result) {
	TransferJob job{};
	job.m_study             = study;
	job.m_series            = result.m_remote;
	job.m_state             = result.m_state;
	job.m_local_image_count = result.localImageCount();
	return job;
}

const char *selectionModeName(const SelectionMode mode) {
	switch (mode) {
		case SelectionMode::Smallest:
			return "smallest";
		case SelectionMode::Threshold:
			return "threshold";
		case SelectionMode::All:
			return "all";
	}
	return "unknown";
}

std::string SelectionPolicy::describe() const {
	std::string text{};
	switch (m_mode) {
		case SelectionMode::Smallest:
			text = "Smallest series only per study";
			break;
		case SelectionMode::Threshold:
			text = fmt::format("Series with fewer than {} images", m_min_images);
			break;
		case SelectionMode::All:
			text = "All incomplete series";
			break;
	}

	if (m_min_missing_images > 1)
		text += fmt::format(", at least {} images missing", m_min_missing_images);
	return text;
}

std::vector<TransferJob> selectTransferJobs(const std::vector<StudyComparison> &comparisons,
                                            const SelectionPolicy &              policy) {
	std::vector<TransferJob> jobs{};

	for (const auto &comparison : comparisons) {
		std::vector<const CompletenessResult *> candidates{};

		for (const auto &result : comparison.m_series) {
			if (!result.eligible())
				continue;

			// nothing to move, and smallest-first would pick it every cycle
			if (result.m_remote.m_image_count == 0) {
				OFLOG_DEBUG(selectLogger,
				            fmt::format("Series {}: EMPTY - SKIP", result.m_remote.m_series_number));
				continue;
			}

			if (result.missingImageCount() < policy.m_min_missing_images) {
				OFLOG_DEBUG(selectLogger,
				            fmt::format("Series {}: only {} image(s) missing - SKIP",
					            result.m_remote.m_series_number,
					            result.missingImageCount()));
				continue;
			}

			if (policy.m_mode == SelectionMode::Threshold && result.m_remote.m_image_count >= policy.m_min_images) {
				OFLOG_DEBUG(selectLogger,
				            fmt::format("Series {}: {} images, limit {} - SKIP",
					            result.m_remote.m_series_number,
					            result.m_remote.m_image_count,
					            policy.m_min_images));
				continue;
			}

			candidates.push_back(&result);
		}

		if (candidates.empty())
			continue;

		std::ranges::sort(candidates, transferOrder);

		if (policy.m_mode == SelectionMode::Smallest)
			candidates.resize(1);

		for (const auto *candidate : candidates) {
			OFLOG_DEBUG(selectLogger,
			            fmt::format("Series {} ({}): {} images - SELECTED",
				            candidate->m_remote.m_series_number,
				            completenessName(candidate->m_state),
				            candidate->m_remote.m_image_count));
			jobs.push_back(makeTransferJob(comparison.m_study, *candidate));
		}
	}

	OFLOG_INFO(selectLogger,
	           fmt::format("Selected {} series for transfer ({})", jobs.size(), policy.describe()));
	return jobs;
}
