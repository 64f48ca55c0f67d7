#include "gtest/gtest.h"

#include "dcmtk/config/osconfig.h"
#include "dcmtk/dcmdata/dcdatset.h"
#include "dcmtk/dcmdata/dcdeftag.h"

#include "StudyQueryRetriever.hpp"
#include "SyncConditions.hpp"

TEST(StudyQueryRetriever, StudyRecordFromDataset) {
	DcmDataset dataset;
	dataset.putAndInsertString(DCM_StudyInstanceUID, "1.2.840.113619.2.1");
	dataset.putAndInsertString(DCM_PatientID, "12345");
	dataset.putAndInsertString(DCM_PatientName, "DOE^JANE");
	dataset.putAndInsertString(DCM_StudyDate, "20250115");
	dataset.putAndInsertString(DCM_StudyTime, "093000.000");
	dataset.putAndInsertString(DCM_StudyDescription, "CT THORAX");
	dataset.putAndInsertString(DCM_NumberOfStudyRelatedInstances, "412");

	const StudyRecord study = studyRecordFromDataset(dataset);
	ASSERT_EQ("1.2.840.113619.2.1", study.m_study_uid);
	ASSERT_EQ("12345", study.m_patient_id);
	ASSERT_EQ("DOE^JANE", study.m_patient_name);
	ASSERT_EQ("20250115", study.m_study_date);
	ASSERT_EQ("093000.000", study.m_study_time);
	ASSERT_EQ("CT THORAX", study.m_description);
	ASSERT_EQ(412u, study.m_image_count);
}

TEST(StudyQueryRetriever, MissingAttributesAreEmpty) {
	DcmDataset dataset;
	dataset.putAndInsertString(DCM_StudyInstanceUID, "1.2.3");

	const StudyRecord study = studyRecordFromDataset(dataset);
	ASSERT_EQ("1.2.3", study.m_study_uid);
	ASSERT_TRUE(study.m_patient_name.empty());
	ASSERT_TRUE(study.m_study_time.empty());
	ASSERT_EQ(0u, study.m_image_count);
}

TEST(StudyQueryRetriever, SeriesRecordFromDataset) {
	DcmDataset dataset;
	dataset.putAndInsertString(DCM_SeriesInstanceUID, "1.2.3.4");
	dataset.putAndInsertString(DCM_SeriesNumber, "7");
	dataset.putAndInsertString(DCM_Modality, "MR");
	dataset.putAndInsertString(DCM_SeriesDescription, "T1 AX");
	dataset.putAndInsertString(DCM_NumberOfSeriesRelatedInstances, "36");

	// study uid falls back to the queried one when the response omits it
	const SeriesRecord series = seriesRecordFromDataset(dataset, "1.2.3");
	ASSERT_EQ("1.2.3.4", series.m_series_uid);
	ASSERT_EQ("1.2.3", series.m_study_uid);
	ASSERT_EQ(7, series.m_series_number);
	ASSERT_EQ("MR", series.m_modality);
	ASSERT_EQ("T1 AX", series.m_description);
	ASSERT_EQ(36u, series.m_image_count);

	dataset.putAndInsertString(DCM_StudyInstanceUID, "9.9");
	ASSERT_EQ("9.9", seriesRecordFromDataset(dataset, "1.2.3").m_study_uid);
}

TEST(StudyQueryRetriever, UnparsableCountsAreZero) {
	DcmDataset dataset;
	dataset.putAndInsertString(DCM_SeriesInstanceUID, "1.2.3.4");
	dataset.putAndInsertString(DCM_SeriesNumber, "abc");
	dataset.putAndInsertString(DCM_NumberOfSeriesRelatedInstances, "");

	SeriesRecord series = seriesRecordFromDataset(dataset, "1.2.3");
	ASSERT_EQ(0, series.m_series_number);
	ASSERT_EQ(0u, series.m_image_count);

	dataset.putAndInsertString(DCM_SeriesNumber, "-3");
	dataset.putAndInsertString(DCM_NumberOfSeriesRelatedInstances, "-5");
	series = seriesRecordFromDataset(dataset, "1.2.3");
	ASSERT_EQ(-3, series.m_series_number);
	ASSERT_EQ(0u, series.m_image_count);
}

TEST(StudyQueryRetriever, QueriesFailWithoutNetwork) {
	QueryRetriever retriever;
	retriever.m_nodeName      = "remote";
	retriever.m_calledIP      = "127.0.0.1";
	retriever.m_port          = 104;
	retriever.m_calledAETitle = "PACS";
	retriever.m_callerAETitle = "FNOSTUDYSYNC";

	std::vector<StudyRecord> studies{StudyRecord{"stale", "", "", ""}};
	const OFCondition        cond = retriever.findStudies("20250114", "20250115", studies);
	ASSERT_TRUE(isSyncCondition(cond, SYNC_EC_CODE_QueryFailure));
	ASSERT_TRUE(studies.empty());

	MoveProgress progress{};
	ASSERT_TRUE(isSyncCondition(retriever.moveSeries("1.2.3.4", "1.2.3", progress), SYNC_EC_CODE_TransferFailure));
}

TEST(StudyQueryRetriever, FindCallbacksCollectRecords) {
	T_DIMSE_C_FindRSP response{};
	response.DimseStatus = STATUS_FIND_Pending_MatchesAreContinuing;

	std::vector<StudyRecord> studies{};
	StudyQueryCallback       studyCallback{studies};

	DcmDataset study;
	study.putAndInsertString(DCM_StudyInstanceUID, "1.2.3");
	study.putAndInsertString(DCM_StudyDate, "20250115");
	studyCallback.callback(nullptr, 1, &response, &study);

	// responses without a uid are dropped
	DcmDataset anonymous;
	anonymous.putAndInsertString(DCM_StudyDate, "20250115");
	studyCallback.callback(nullptr, 2, &response, &anonymous);

	ASSERT_EQ(1u, studies.size());
	ASSERT_EQ("1.2.3", studies[0].m_study_uid);

	std::vector<SeriesRecord> series{};
	SeriesQueryCallback       seriesCallback{"1.2.3", series};

	DcmDataset first;
	first.putAndInsertString(DCM_SeriesInstanceUID, "1.2.3.1");
	first.putAndInsertString(DCM_NumberOfSeriesRelatedInstances, "12");
	seriesCallback.callback(nullptr, 1, &response, &first);
	seriesCallback.callback(nullptr, 2, &response, &anonymous);

	ASSERT_EQ(1u, series.size());
	ASSERT_EQ("1.2.3.1", series[0].m_series_uid);
	ASSERT_EQ("1.2.3", series[0].m_study_uid);
	ASSERT_EQ(12u, series[0].m_image_count);
}
