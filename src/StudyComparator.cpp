#include "StudyComparator.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "dcmtk/oflog/oflog.h"

#include "fmt/format.h"

static OFLogger compareLogger = OFLog::getLogger("fno.apps.fnostudysync.compare");

std::vector<StudyRecord> findMissingStudies(const std::vector<StudyRecord> &remote_studies,
                                            const std::vector<StudyRecord> &local_studies) {
	std::unordered_set<std::string> localUIDs{};
	for (const auto &study : local_studies)
		localUIDs.insert(study.m_study_uid);

	std::vector<StudyRecord> missing{};
	for (const auto &study : remote_studies) {
		if (!localUIDs.contains(study.m_study_uid))
			missing.push_back(study);
	}
	return missing;
}

Completeness classifySeries(const SeriesRecord &remote, const SeriesRecord *local) {
	if (local == nullptr)
		return Completeness::Missing;
	if (local->m_image_count < remote.m_image_count)
		return Completeness::Incomplete;
	return Completeness::Complete;
}

std::vector<CompletenessResult> compareSeries(const std::vector<SeriesRecord> &remote_series,
                                              const std::vector<SeriesRecord> &local_series) {
	std::unordered_map<std::string, const SeriesRecord *> localIndex{};
	for (const auto &series : local_series)
		localIndex.emplace(series.m_series_uid, &series);

	std::vector<CompletenessResult> results{};
	results.reserve(remote_series.size());

	for (const auto &remote : remote_series) {
		CompletenessResult result{};
		result.m_remote = remote;

		const auto found = localIndex.find(remote.m_series_uid);
		if (found != localIndex.end())
			result.m_local = *found->second;

		result.m_state = classifySeries(remote, found != localIndex.end() ? found->second : nullptr);
		results.push_back(std::move(result));
	}

	std::ranges::sort(results,
	                  [](const CompletenessResult &lhs, const CompletenessResult &rhs) {
		                  return lhs.m_remote.m_series_uid < rhs.m_remote.m_series_uid;
	                  });
	return results;
}

static void logSeriesResult(const CompletenessResult &result) {
	const SeriesRecord &series = result.m_remote;
	switch (result.m_state) {
		case Completeness::Complete:
			OFLOG_INFO(compareLogger,
			           fmt::format("Series {}: {} images - COMPLETE", series.m_series_number, series.m_image_count));
			break;
		case Completeness::Incomplete:
			OFLOG_INFO(compareLogger,
			           fmt::format("Series {}: {} images ({} local) - INCOMPLETE",
				           series.m_series_number,
				           series.m_image_count,
				           result.localImageCount()));
			break;
		case Completeness::Missing:
			OFLOG_INFO(compareLogger,
			           fmt::format("Series {}: {} images - NEW", series.m_series_number, series.m_image_count));
			break;
	}
}

StudyComparator::StudyComparator(DirectoryService &remote, DirectoryService &local) : m_remote(remote),
	m_local(local) {}

OFCondition StudyComparator::compare(const std::vector<StudyRecord> &remote_studies,
                                     const std::vector<StudyRecord> &local_studies,
                                     std::vector<StudyComparison> &  comparisons) const {
	comparisons.clear();

	const std::vector<StudyRecord>  missingStudies = findMissingStudies(remote_studies, local_studies);
	std::unordered_set<std::string> missingUIDs{};
	for (const auto &study : missingStudies)
		missingUIDs.insert(study.m_study_uid);

	OFLOG_INFO(compareLogger,
	           fmt::format("Analyzing series in {} studies ({} missing locally)",
		           remote_studies.size(),
		           missingStudies.size()));

	std::size_t index{0};
	for (const auto &study : remote_studies) {
		++index;
		OFLOG_INFO(compareLogger,
		           fmt::format("[{}/{}] Checking series for {} ({})",
			           index,
			           remote_studies.size(),
			           study.m_patient_name,
			           study.m_study_date));

		StudyComparison comparison{};
		comparison.m_study           = study;
		comparison.m_missing_locally = missingUIDs.contains(study.m_study_uid);

		std::vector<SeriesRecord> remoteSeries{};
		OFCondition               cond = m_remote.findSeries(study.m_study_uid, remoteSeries);
		if (cond.bad()) {
			OFLOG_ERROR(compareLogger,
			            "Remote series query failed for study " << study.m_study_uid.c_str() << ": " << cond.text());
			return cond;
		}
		OFLOG_DEBUG(compareLogger, fmt::format("Found {} series on remote", remoteSeries.size()));

		std::vector<SeriesRecord> localSeries{};
		if (!comparison.m_missing_locally && !remoteSeries.empty()) {
			cond = m_local.findSeries(study.m_study_uid, localSeries);
			if (cond.bad()) {
				OFLOG_ERROR(compareLogger,
				            "Local series query failed for study " << study.m_study_uid.c_str() << ": " << cond.text());
				return cond;
			}
			OFLOG_DEBUG(compareLogger, fmt::format("Found {} series on local", localSeries.size()));
		}

		comparison.m_series = compareSeries(remoteSeries, localSeries);
		for (const auto &result : comparison.m_series)
			logSeriesResult(result);

		comparisons.push_back(std::move(comparison));
	}

	return EC_Normal;
}
