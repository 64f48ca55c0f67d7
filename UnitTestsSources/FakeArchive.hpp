#ifndef FAKEARCHIVE_HPP
#define FAKEARCHIVE_HPP

#include <atomic>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "DicomServices.hpp"
#include "StudyRecord.hpp"
#include "SyncConditions.hpp"
#include "TimeWindow.hpp"

/*
 * In-memory archive. Moves copy the remote series into m_destination with
 * its full image count, like a storage SCP receiving every instance.
 */
class FakeArchive final : public DirectoryService, public TransferService {
public:
	FakeArchive *m_destination{nullptr};

	bool                  m_failStudyQuery{false};
	std::set<std::string> m_failingSeriesQueries{}; // study uids
	std::set<std::string> m_failingMoves{};         // series uids

	// raises *m_cancelFlag once m_cancelAfterMoves moves were performed
	std::atomic<bool> *m_cancelFlag{nullptr};
	std::size_t        m_cancelAfterMoves{0};

	unsigned int             m_studyQueries{0};
	std::vector<std::string> m_seriesQueries{};
	std::vector<std::string> m_moves{};

	static StudyRecord study(const std::string &uid, const std::string &date, const std::string &time) {
		StudyRecord record{uid, "DOE^" + uid, date, time};
		record.m_patient_id = "ID-" + uid;
		return record;
	}

	static SeriesRecord series(const std::string &uid, const std::string &study_uid, int number, unsigned int images) {
		SeriesRecord record{uid, study_uid, number, images};
		record.m_modality = "CT";
		return record;
	}

	void addStudy(const StudyRecord &study, const std::vector<SeriesRecord> &series) {
		m_studies[study.m_study_uid] = study;
		m_series[study.m_study_uid]  = series;
	}

	const SeriesRecord *findLocalSeries(const std::string &study_uid, const std::string &series_uid) const {
		const auto found = m_series.find(study_uid);
		if (found == m_series.end())
			return nullptr;
		for (const auto &record : found->second) {
			if (record.m_series_uid == series_uid)
				return &record;
		}
		return nullptr;
	}

	OFCondition findStudies(const std::string &       date_from,
	                        const std::string &       date_to,
	                        std::vector<StudyRecord> &studies) override {
		++m_studyQueries;
		studies.clear();
		if (m_failStudyQuery)
			return makeQueryFailure("fake study query failure");

		for (const auto &[uid, record] : m_studies) {
			if (record.m_study_date >= date_from && record.m_study_date <= date_to)
				studies.push_back(record);
		}
		return EC_Normal;
	}

	OFCondition findSeries(const std::string &study_uid, std::vector<SeriesRecord> &series) override {
		m_seriesQueries.push_back(study_uid);
		series.clear();
		if (m_failingSeriesQueries.contains(study_uid))
			return makeQueryFailure("fake series query failure");

		const auto found = m_series.find(study_uid);
		if (found != m_series.end())
			series = found->second;
		return EC_Normal;
	}

	OFCondition moveSeries(const std::string &series_uid,
	                       const std::string &study_uid,
	                       MoveProgress &     progress) override {
		m_moves.push_back(series_uid);
		progress = MoveProgress{};

		OFCondition cond = EC_Normal;
		if (m_failingMoves.contains(series_uid)) {
			cond = makeTransferFailure("fake move failure");
		} else {
			const SeriesRecord *source = findLocalSeries(study_uid, series_uid);
			if (source == nullptr) {
				cond = makeTransferFailure("unknown series");
			} else {
				progress.m_completed = source->m_image_count;
				if (m_destination != nullptr)
					m_destination->store(m_studies.at(study_uid), *source);
			}
		}

		if (m_cancelFlag != nullptr && m_moves.size() >= m_cancelAfterMoves)
			m_cancelFlag->store(true);
		return cond;
	}

private:
	void store(const StudyRecord &study, const SeriesRecord &series) {
		if (!m_studies.contains(study.m_study_uid))
			m_studies[study.m_study_uid] = study;

		auto &stored = m_series[study.m_study_uid];
		for (auto &record : stored) {
			if (record.m_series_uid == series.m_series_uid) {
				record.m_image_count = series.m_image_count;
				return;
			}
		}
		stored.push_back(series);
	}

	std::map<std::string, StudyRecord>               m_studies{};
	std::map<std::string, std::vector<SeriesRecord>> m_series{};
};

#endif //FAKEARCHIVE_HPP
