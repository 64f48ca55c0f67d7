#ifndef STUDYQUERYRETRIEVER_HPP
#define STUDYQUERYRETRIEVER_HPP

#include <string>
#include <vector>

#include "dcmtk/config/osconfig.h"
#include "dcmtk/ofstd/ofstd.h"
#include "dcmtk/ofstd/ofcond.h"
#include "dcmtk/dcmdata/dcxfer.h"
#include "dcmtk/dcmdata/dcfilefo.h"
#include "dcmtk/dcmdata/dcdeftag.h"
#include "dcmtk/dcmnet/dicom.h"
#include "dcmtk/dcmnet/dimse.h"
#include "dcmtk/dcmnet/diutil.h"
#include "dcmtk/oflog/oflog.h"

#include "fmt/format.h"

#include "Callbacks.hpp"
#include "DicomServices.hpp"
#include "StudyRecord.hpp"

class DcmDataset;
class DcmItem;
struct T_ASC_Association;
struct T_ASC_Parameters;
struct T_DIMSE_C_FindRQ;
struct T_DIMSE_C_FindRSP;
class QueryCallback;

struct QuerySyntax {
	const char *findSyntax;
	const char *moveSyntax;
};

StudyRecord studyRecordFromDataset(DcmItem &identifiers);

SeriesRecord seriesRecordFromDataset(DcmItem &identifiers, const std::string &study_uid);

/*
 * Study root C-FIND/C-MOVE SCU for one DICOM node.
 * Every operation runs on its own association.
 */
class QueryRetriever final : public DirectoryService, public TransferService {
public:
	QueryRetriever();

	~QueryRetriever() override;

	OFCondition initializeNetwork();

	OFCondition dropNetwork();

	OFCondition findStudies(const std::string &       date_from,
	                        const std::string &       date_to,
	                        std::vector<StudyRecord> &studies) override;

	OFCondition findSeries(const std::string &        study_uid,
	                       std::vector<SeriesRecord> &series) override;

	OFCondition moveSeries(const std::string &series_uid,
	                       const std::string &study_uid,
	                       MoveProgress &     progress) override;

	std::string      m_nodeName{};        // for messages only
	unsigned short   m_port{0};           // tcp/ip port of peer
	std::string      m_calledIP{};        // hostname of PACS (DICOM peer)
	std::string      m_callerAETitle{};   // aec
	std::string      m_calledAETitle{};   // aep
	std::string      m_receiverAETitle{}; // move destination
	int              m_acseTimeout{30};
	int              m_dimseTimeout{0};
	E_TransferSyntax m_networkTransferSyntax{EXS_LittleEndianExplicit};

private:
	OFCondition setupAssociation();

	OFCondition removeAssociation(const OFCondition &queryCondition);

	OFCondition addPresentationContext(E_TransferSyntax            outNetworkTransferSyntax,
	                                   T_ASC_PresentationContextID presID,
	                                   const char *                abstractSyntax) const;

	OFCondition performFindRequest(DcmDataset *requestedDataset, QueryCallback *callback);

	OFCondition performMoveRequest(DcmDataset *requestedDataset, MoveProgress &progress);

	std::string describeFailure(const char *operation, const OFCondition &cond) const;

	T_ASC_Network *    m_net{nullptr};
	T_ASC_Association *m_assoc{nullptr};
	T_ASC_Parameters * m_params{nullptr};
	OFBool             m_secureConnection{OFFalse};
	QuerySyntax        m_abstractSyntax = {
		UID_FINDStudyRootQueryRetrieveInformationModel,
		UID_MOVEStudyRootQueryRetrieveInformationModel
	};
	T_DIMSE_BlockingMode m_blockMode{DIMSE_BLOCKING};
};

class QueryCallback {
public:
	QueryCallback();

	virtual ~QueryCallback() = default;

	virtual void callback(T_DIMSE_C_FindRQ * request,
	                      int                responseCount,
	                      T_DIMSE_C_FindRSP *response,
	                      DcmDataset *       responseIdentifiers) = 0;

	void setAssociation(T_ASC_Association *assoc);

	void setPresentationContextID(T_ASC_PresentationContextID pres_id);

protected:
	T_ASC_Association *         m_assoc;
	T_ASC_PresentationContextID m_presID;
};

class StudyQueryCallback final : public QueryCallback {
public:
	explicit StudyQueryCallback(std::vector<StudyRecord> &studies);

	~StudyQueryCallback() override = default;

	void callback(T_DIMSE_C_FindRQ * request,
	              int                response_count,
	              T_DIMSE_C_FindRSP *response,
	              DcmDataset *       response_identifiers) override;

private:
	std::vector<StudyRecord> &m_studies;
};

class SeriesQueryCallback final : public QueryCallback {
public:
	SeriesQueryCallback(std::string study_uid, std::vector<SeriesRecord> &series);

	~SeriesQueryCallback() override = default;

	void callback(T_DIMSE_C_FindRQ * request,
	              int                response_count,
	              T_DIMSE_C_FindRSP *response,
	              DcmDataset *       response_identifiers) override;

private:
	const std::string          m_studyUID;
	std::vector<SeriesRecord> &m_series;
};

#endif //STUDYQUERYRETRIEVER_HPP
