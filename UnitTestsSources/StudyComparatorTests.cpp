#include <algorithm>

#include "gtest/gtest.h"

#include "FakeArchive.hpp"
#include "StudyComparator.hpp"

TEST(StudyComparator, MissingStudies) {
	const std::vector<StudyRecord> remote{
		FakeArchive::study("1.1", "20250115", "100000"),
		FakeArchive::study("1.2", "20250115", "100000"),
		FakeArchive::study("1.3", "20250115", "100000")
	};
	const std::vector<StudyRecord> local{
		FakeArchive::study("1.2", "20250115", "100000"),
		FakeArchive::study("9.9", "20250115", "100000")
	};

	const auto missing = findMissingStudies(remote, local);
	ASSERT_EQ(2u, missing.size());
	ASSERT_EQ("1.1", missing[0].m_study_uid);
	ASSERT_EQ("1.3", missing[1].m_study_uid);

	// every missing study is remote and absent locally, every other remote study exists locally
	for (const auto &study : remote) {
		const bool isMissing = std::find(missing.begin(), missing.end(), study) != missing.end();
		const bool isLocal   = std::find(local.begin(), local.end(), study) != local.end();
		ASSERT_NE(isMissing, isLocal);
	}

	ASSERT_TRUE(findMissingStudies(remote, remote).empty());
	ASSERT_EQ(3u, findMissingStudies(remote, {}).size());
	ASSERT_TRUE(findMissingStudies({}, local).empty());
}

TEST(StudyComparator, ClassifySeries) {
	const SeriesRecord remote{"1.1.1", "1.1", 1, 120};
	const SeriesRecord fewer{"1.1.1", "1.1", 1, 80};
	const SeriesRecord equal{"1.1.1", "1.1", 1, 120};
	const SeriesRecord more{"1.1.1", "1.1", 1, 130};
	const SeriesRecord emptyRemote{"1.1.2", "1.1", 2, 0};

	ASSERT_EQ(Completeness::Missing, classifySeries(remote, nullptr));
	ASSERT_EQ(Completeness::Incomplete, classifySeries(remote, &fewer));
	ASSERT_EQ(Completeness::Complete, classifySeries(remote, &equal));
	ASSERT_EQ(Completeness::Complete, classifySeries(remote, &more));
	ASSERT_EQ(Completeness::Missing, classifySeries(emptyRemote, nullptr));
}

TEST(StudyComparator, CompareSeriesOrdersByUID) {
	const std::vector<SeriesRecord> remote{
		{"1.1.3", "1.1", 3, 40},
		{"1.1.1", "1.1", 1, 120},
		{"1.1.2", "1.1", 2, 60}
	};
	const std::vector<SeriesRecord> local{
		{"1.1.1", "1.1", 1, 120},
		{"1.1.2", "1.1", 2, 10},
		{"1.1.7", "1.1", 7, 5}
	};

	const auto results = compareSeries(remote, local);
	ASSERT_EQ(3u, results.size());

	ASSERT_EQ("1.1.1", results[0].m_remote.m_series_uid);
	ASSERT_EQ(Completeness::Complete, results[0].m_state);
	ASSERT_FALSE(results[0].eligible());

	ASSERT_EQ("1.1.2", results[1].m_remote.m_series_uid);
	ASSERT_EQ(Completeness::Incomplete, results[1].m_state);
	ASSERT_EQ(10u, results[1].localImageCount());
	ASSERT_EQ(50u, results[1].missingImageCount());

	ASSERT_EQ("1.1.3", results[2].m_remote.m_series_uid);
	ASSERT_EQ(Completeness::Missing, results[2].m_state);
	ASSERT_FALSE(results[2].m_local.has_value());
	ASSERT_EQ(40u, results[2].missingImageCount());
}

TEST(StudyComparator, CompareQueriesOnlyWhatIsNeeded) {
	FakeArchive remote;
	FakeArchive local;

	const auto missingStudy  = FakeArchive::study("1.1", "20250115", "100000");
	const auto presentStudy  = FakeArchive::study("1.2", "20250115", "103000");
	const auto noSeriesStudy = FakeArchive::study("1.3", "20250115", "110000");

	remote.addStudy(missingStudy, {FakeArchive::series("1.1.1", "1.1", 1, 20)});
	remote.addStudy(presentStudy, {
		                FakeArchive::series("1.2.1", "1.2", 1, 20),
		                FakeArchive::series("1.2.2", "1.2", 2, 30)
	                });
	remote.addStudy(noSeriesStudy, {});
	local.addStudy(presentStudy, {FakeArchive::series("1.2.1", "1.2", 1, 20)});
	local.addStudy(noSeriesStudy, {});

	std::vector<StudyRecord> remoteStudies;
	std::vector<StudyRecord> localStudies;
	ASSERT_TRUE(remote.findStudies("20250115", "20250115", remoteStudies).good());
	ASSERT_TRUE(local.findStudies("20250115", "20250115", localStudies).good());

	std::vector<StudyComparison> comparisons;
	ASSERT_TRUE(StudyComparator(remote, local).compare(remoteStudies, localStudies, comparisons).good());

	ASSERT_EQ(3u, comparisons.size());
	ASSERT_EQ("1.1", comparisons[0].m_study.m_study_uid);
	ASSERT_TRUE(comparisons[0].m_missing_locally);
	ASSERT_EQ(1u, comparisons[0].m_series.size());
	ASSERT_EQ(Completeness::Missing, comparisons[0].m_series[0].m_state);

	ASSERT_FALSE(comparisons[1].m_missing_locally);
	ASSERT_EQ(Completeness::Complete, comparisons[1].m_series[0].m_state);
	ASSERT_EQ(Completeness::Missing, comparisons[1].m_series[1].m_state);

	ASSERT_TRUE(comparisons[2].m_series.empty());

	ASSERT_EQ((std::vector<std::string>{"1.1", "1.2", "1.3"}), remote.m_seriesQueries);
	// neither the locally missing study nor the study without remote series are queried locally
	ASSERT_EQ((std::vector<std::string>{"1.2"}), local.m_seriesQueries);
}

TEST(StudyComparator, QueryFailureAborts) {
	FakeArchive remote;
	FakeArchive local;

	remote.addStudy(FakeArchive::study("1.1", "20250115", "100000"), {FakeArchive::series("1.1.1", "1.1", 1, 5)});
	remote.addStudy(FakeArchive::study("1.2", "20250115", "100000"), {FakeArchive::series("1.2.1", "1.2", 1, 5)});
	remote.m_failingSeriesQueries.insert("1.1");

	std::vector<StudyRecord> remoteStudies;
	ASSERT_TRUE(remote.findStudies("20250115", "20250115", remoteStudies).good());

	std::vector<StudyComparison> comparisons;
	const OFCondition cond = StudyComparator(remote, local).compare(remoteStudies, {}, comparisons);
	ASSERT_TRUE(cond.bad());
	ASSERT_TRUE(isSyncCondition(cond, SYNC_EC_CODE_QueryFailure));
	ASSERT_EQ(1u, remote.m_seriesQueries.size());
}
