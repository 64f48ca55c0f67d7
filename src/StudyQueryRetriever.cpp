#include "StudyQueryRetriever.hpp"

#include <charconv>
#include <cstring>
#include <system_error>
#include <utility>

#include "SyncConditions.hpp"
#include "TimeWindow.hpp"

static OFLogger qrLogger = OFLog::getLogger("fno.apps.fnostudysync.qr");

static std::string stringValue(DcmItem &identifiers, const DcmTagKey &key) {
	OFString value;
	if (identifiers.findAndGetOFString(key, value).bad())
		return {};
	return value.c_str();
}

// IS/US counters, anything unparsable counts as 0
template<typename T>
static T numericValue(DcmItem &identifiers, const DcmTagKey &key) {
	std::string text = stringValue(identifiers, key);
	text.erase(0, text.find_first_not_of(' '));
	text.erase(text.find_last_not_of(' ') + 1);
	if (!text.empty() && text.front() == '+')
		text.erase(0, 1);

	T value{0};
	const char *end = text.data() + text.size();
	const auto [ptr, ec] = std::from_chars(text.data(), end, value);
	if (ec != std::errc() || ptr != end)
		return 0;
	return value;
}

StudyRecord studyRecordFromDataset(DcmItem &identifiers) {
	StudyRecord study{
		stringValue(identifiers, DCM_StudyInstanceUID),
		stringValue(identifiers, DCM_PatientName),
		stringValue(identifiers, DCM_StudyDate),
		stringValue(identifiers, DCM_StudyTime)
	};
	study.m_patient_id  = stringValue(identifiers, DCM_PatientID);
	study.m_description = stringValue(identifiers, DCM_StudyDescription);
	study.m_image_count = numericValue<unsigned int>(identifiers, DCM_NumberOfStudyRelatedInstances);
	return study;
}

SeriesRecord seriesRecordFromDataset(DcmItem &identifiers, const std::string &study_uid) {
	std::string responseStudyUID = stringValue(identifiers, DCM_StudyInstanceUID);
	if (responseStudyUID.empty())
		responseStudyUID = study_uid;

	SeriesRecord series{
		stringValue(identifiers, DCM_SeriesInstanceUID),
		responseStudyUID,
		numericValue<int>(identifiers, DCM_SeriesNumber),
		numericValue<unsigned int>(identifiers, DCM_NumberOfSeriesRelatedInstances)
	};
	series.m_modality    = stringValue(identifiers, DCM_Modality);
	series.m_description = stringValue(identifiers, DCM_SeriesDescription);
	return series;
}

static void progressCallback(void *             callback_data,
                             T_DIMSE_C_FindRQ * request,
                             int                response_count,
                             T_DIMSE_C_FindRSP *response,
                             DcmDataset *       response_identifiers) {
	QueryCallback *callback = OFreinterpret_cast(QueryCallback*, callback_data);
	if (callback)
		callback->callback(request, response_count, response, response_identifiers);
}

QueryRetriever::QueryRetriever() = default;

QueryRetriever::~QueryRetriever() {
	const OFCondition cond = this->dropNetwork();
	if (cond.bad()) {
		OFString temp_string;
		OFLOG_ERROR(qrLogger, "Dropping network failed: " << DimseCondition::dump(temp_string, cond));
	}
}

OFCondition QueryRetriever::initializeNetwork() {
	// SCU only, the move destination is an external storage SCP
	return ASC_initializeNetwork(NET_REQUESTOR, 0, this->m_acseTimeout, &this->m_net);
}

OFCondition QueryRetriever::dropNetwork() {
	if (this->m_net)
		return ASC_dropNetwork(&this->m_net);
	return EC_Normal;
}

std::string QueryRetriever::describeFailure(const char *operation, const OFCondition &cond) const {
	OFString temp_string;
	return fmt::format("{} on {} node {}@{}:{} failed: {}",
	                   operation,
	                   this->m_nodeName,
	                   this->m_calledAETitle,
	                   this->m_calledIP,
	                   this->m_port,
	                   DimseCondition::dump(temp_string, cond).c_str());
}

OFCondition QueryRetriever::setupAssociation() {
	OFString temp_string;

	if (this->m_net == nullptr)
		return ASC_NULLKEY;

	OFCondition cond = ASC_createAssociationParameters(&this->m_params, ASC_DEFAULTMAXPDU, dcmConnectionTimeout.get());
	if (cond.bad()) {
		OFLOG_ERROR(qrLogger, "Creating association parameters failed: " << DimseCondition::dump(temp_string, cond));
		return cond;
	}

	ASC_setAPTitles(this->m_params, this->m_callerAETitle.c_str(), this->m_calledAETitle.c_str(), nullptr);

	cond = ASC_setTransportLayerType(this->m_params, this->m_secureConnection);
	if (cond.bad()) {
		OFLOG_ERROR(qrLogger, "Setting transport layer type failed: " << DimseCondition::dump(temp_string, cond));
		(void) ASC_destroyAssociationParameters(&this->m_params);
		return cond;
	}

	cond = ASC_setPresentationAddresses(this->m_params,
	                                    OFStandard::getHostName().c_str(),
	                                    fmt::format("{}:{}", this->m_calledIP, this->m_port).c_str());
	if (cond.bad()) {
		OFLOG_ERROR(qrLogger, "Adding presentation addresses failed: " << DimseCondition::dump(temp_string, cond));
		(void) ASC_destroyAssociationParameters(&this->m_params);
		return cond;
	}

	cond = this->addPresentationContext(this->m_networkTransferSyntax, 1, this->m_abstractSyntax.findSyntax);
	if (cond.bad()) {
		OFLOG_ERROR(qrLogger,
		            "Adding C-FIND presentation contexts failed: " << DimseCondition::dump(temp_string, cond));
		(void) ASC_destroyAssociationParameters(&this->m_params);
		return cond;
	}

	cond = this->addPresentationContext(this->m_networkTransferSyntax, 3, this->m_abstractSyntax.moveSyntax);
	if (cond.bad()) {
		OFLOG_ERROR(qrLogger,
		            "Adding C-MOVE presentation contexts failed: " << DimseCondition::dump(temp_string, cond));
		(void) ASC_destroyAssociationParameters(&this->m_params);
		return cond;
	}

	OFLOG_DEBUG(qrLogger,
	            "Request parameters: " << OFendl << ASC_dumpParameters(temp_string, this->m_params, ASC_ASSOC_RQ));

	OFLOG_DEBUG(qrLogger, "Requesting association with " << this->m_calledAETitle << " (" << this->m_nodeName << ")");
	// the association takes ownership of the parameters, even when the request fails
	T_ASC_Parameters *params = this->m_params;
	this->m_params           = nullptr;
	cond                     = ASC_requestAssociation(this->m_net, params, &this->m_assoc);
	if (cond.bad()) {
		if (cond == DUL_ASSOCIATIONREJECTED) {
			T_ASC_RejectParameters rejectParams{};
			ASC_getRejectParameters(params, &rejectParams);
			OFLOG_ERROR(qrLogger, "Association rejected:");
			OFLOG_ERROR(qrLogger, ASC_printRejectParameters(temp_string, &rejectParams));
		} else {
			OFLOG_ERROR(qrLogger, "Association request failed: " << DimseCondition::dump(temp_string, cond));
		}
		(void) ASC_destroyAssociation(&this->m_assoc);
		return cond;
	}

	OFLOG_DEBUG(qrLogger,
	            "Association parameters negotiated: " << OFendl << ASC_dumpParameters(temp_string, params,
		            ASC_ASSOC_AC));

	if (ASC_countAcceptedPresentationContexts(params) == 0) {
		OFLOG_ERROR(qrLogger, "No acceptable presentation contexts");
		(void) ASC_abortAssociation(this->m_assoc);
		(void) ASC_destroyAssociation(&this->m_assoc);
		return NET_EC_NoAcceptablePresentationContexts;
	}

	OFLOG_DEBUG(qrLogger, "Association accepted (max send PDV: " << this->m_assoc->sendPDVLength << ")");
	return cond;
}

OFCondition QueryRetriever::removeAssociation(const OFCondition &queryCondition) {
	OFString    temp_string;
	OFCondition cond = EC_Normal;

	if (this->m_assoc == nullptr)
		return cond;

	if (queryCondition == EC_Normal || isSyncCondition(queryCondition, SYNC_EC_CODE_QueryFailure) ||
	    isSyncCondition(queryCondition, SYNC_EC_CODE_TransferFailure)) {
		// the DIMSE exchange itself completed, failure statuses included
		OFLOG_DEBUG(qrLogger, "Releasing association");
		cond = ASC_releaseAssociation(this->m_assoc);
		if (cond.bad()) {
			OFLOG_ERROR(qrLogger, "Association release failed: " << DimseCondition::dump(temp_string, cond));
			(void) ASC_abortAssociation(this->m_assoc);
		}
	} else if (queryCondition == DUL_PEERREQUESTEDRELEASE) {
		OFLOG_ERROR(qrLogger, "Protocol error: Peer requested release (Aborting)");
		cond = ASC_abortAssociation(this->m_assoc);
	} else if (queryCondition == DUL_PEERABORTEDASSOCIATION) {
		OFLOG_INFO(qrLogger, "Peer aborted association");
	} else {
		OFLOG_ERROR(qrLogger, "Find/Move SCU failed: " << DimseCondition::dump(temp_string, queryCondition));
		OFLOG_DEBUG(qrLogger, "Aborting association");
		cond = ASC_abortAssociation(this->m_assoc);
	}

	if (cond.bad())
		OFLOG_ERROR(qrLogger, "Association teardown failed: " << DimseCondition::dump(temp_string, cond));

	const OFCondition destroyCond = ASC_destroyAssociation(&this->m_assoc);
	if (destroyCond.bad()) {
		OFLOG_ERROR(qrLogger, "Destroying association failed: " << DimseCondition::dump(temp_string, destroyCond));
		return destroyCond;
	}
	return cond;
}

OFCondition QueryRetriever::addPresentationContext(const E_TransferSyntax            outNetworkTransferSyntax,
                                                   const T_ASC_PresentationContextID presID,
                                                   const char *                      abstractSyntax) const {
	const char *transferSyntaxes[]  = {nullptr, nullptr, nullptr};
	int         numTransferSyntaxes = 0;

	switch (outNetworkTransferSyntax) {
		case EXS_LittleEndianImplicit:
			transferSyntaxes[0] = UID_LittleEndianImplicitTransferSyntax;
			numTransferSyntaxes = 1;
			break;
		case EXS_BigEndianExplicit:
			transferSyntaxes[0] = UID_BigEndianExplicitTransferSyntax;
			transferSyntaxes[1] = UID_LittleEndianExplicitTransferSyntax;
			transferSyntaxes[2] = UID_LittleEndianImplicitTransferSyntax;
			numTransferSyntaxes = 3;
			break;
		case EXS_LittleEndianExplicit:
		default:
			transferSyntaxes[0] = UID_LittleEndianExplicitTransferSyntax;
			transferSyntaxes[1] = UID_BigEndianExplicitTransferSyntax;
			transferSyntaxes[2] = UID_LittleEndianImplicitTransferSyntax;
			numTransferSyntaxes = 3;
			break;
	}

	return ASC_addPresentationContext(this->m_params, presID, abstractSyntax, transferSyntaxes, numTransferSyntaxes);
}

OFCondition QueryRetriever::performFindRequest(DcmDataset *requestedDataset, QueryCallback *callback) {
	T_DIMSE_C_FindRQ  request{};
	T_DIMSE_C_FindRSP response{};
	OFString          temp_string;

	const T_ASC_PresentationContextID presID = ASC_findAcceptedPresentationContextID(
		 this->m_assoc,
		 this->m_abstractSyntax.findSyntax
		);
	if (presID == 0) {
		OFLOG_ERROR(qrLogger, "No presentation context for C-FIND");
		return DIMSE_NOVALIDPRESENTATIONCONTEXTID;
	}

	OFStandard::strlcpy(request.AffectedSOPClassUID,
	                    this->m_abstractSyntax.findSyntax,
	                    sizeof(request.AffectedSOPClassUID));
	request.DataSetType = DIMSE_DATASET_PRESENT;
	request.Priority    = DIMSE_PRIORITY_MEDIUM;
	request.MessageID   = this->m_assoc->nextMsgID++;

	callback->setAssociation(this->m_assoc);
	callback->setPresentationContextID(presID);

	int         responseCount{0};
	DcmDataset *statusDetail = nullptr;

	OFLOG_DEBUG(qrLogger, fmt::format("Sending FIND Request (MsgID {})", request.MessageID));
	OFLOG_TRACE(qrLogger, "Request Identifiers:" << OFendl << DcmObject::PrintHelper(*requestedDataset));

	OFCondition cond = DIMSE_findUser(this->m_assoc,
	                                  presID,
	                                  &request,
	                                  requestedDataset,
	                                  responseCount,
	                                  progressCallback,
	                                  callback,
	                                  this->m_blockMode,
	                                  this->m_dimseTimeout,
	                                  &response,
	                                  &statusDetail);

	if (statusDetail != nullptr) {
		OFLOG_DEBUG(qrLogger, "Status Detail:" << OFendl << DcmObject::PrintHelper(*statusDetail));
		delete statusDetail;
	}

	if (cond.bad()) {
		OFLOG_ERROR(qrLogger, "Find Request failed: " << DimseCondition::dump(temp_string, cond));
		return cond;
	}

	if (response.DimseStatus != STATUS_FIND_Success) {
		const std::string detail = fmt::format("C-FIND on {} node ended with status {:#06x} ({})",
		                                       this->m_nodeName,
		                                       response.DimseStatus,
		                                       DU_cfindStatusString(response.DimseStatus));
		OFLOG_ERROR(qrLogger, detail);
		return makeQueryFailure(detail);
	}

	OFLOG_DEBUG(qrLogger, "Received Final Find Response after " << responseCount << " response(s)");
	return cond;
}

OFCondition QueryRetriever::performMoveRequest(DcmDataset *requestedDataset, MoveProgress &progress) {
	T_DIMSE_C_MoveRQ  request{};
	T_DIMSE_C_MoveRSP response{};
	MoveCallbackInfo  moveCallbackInfo{};
	OFString          temp_string;

	const T_ASC_PresentationContextID presID = ASC_findAcceptedPresentationContextID(
		 this->m_assoc,
		 this->m_abstractSyntax.moveSyntax
		);
	if (presID == 0) {
		OFLOG_ERROR(qrLogger, "No presentation context for C-MOVE");
		return DIMSE_NOVALIDPRESENTATIONCONTEXTID;
	}

	moveCallbackInfo.assoc    = this->m_assoc;
	moveCallbackInfo.presID   = presID;
	moveCallbackInfo.progress = &progress;

	request.MessageID = this->m_assoc->nextMsgID++;
	OFStandard::strlcpy(request.AffectedSOPClassUID,
	                    this->m_abstractSyntax.moveSyntax,
	                    sizeof(request.AffectedSOPClassUID));
	OFStandard::strlcpy(request.MoveDestination, this->m_receiverAETitle.c_str(), sizeof(request.MoveDestination));
	request.Priority    = DIMSE_PRIORITY_MEDIUM;
	request.DataSetType = DIMSE_DATASET_PRESENT;

	if (qrLogger.isEnabledFor(OFLogger::DEBUG_LOG_LEVEL)) {
		OFLOG_DEBUG(qrLogger, DIMSE_dumpMessage(temp_string, request, DIMSE_OUTGOING, nullptr, presID));
		OFLOG_DEBUG(qrLogger, "Request Identifiers:" << OFendl << DcmObject::PrintHelper(*requestedDataset));
	} else {
		OFLOG_INFO(qrLogger,
		           fmt::format("Sending Move Request (MsgID {}) to {}", request.MessageID, this->m_receiverAETitle));
	}

	DcmDataset *responseIDs  = nullptr;
	DcmDataset *statusDetail = nullptr;

	// sub-operations are stored by the move destination, no sub-operation association here
	OFCondition cond = DIMSE_moveUser(this->m_assoc,
	                                  presID,
	                                  &request,
	                                  requestedDataset,
	                                  moveCallback,
	                                  &moveCallbackInfo,
	                                  this->m_blockMode,
	                                  this->m_dimseTimeout,
	                                  nullptr,
	                                  nullptr,
	                                  nullptr,
	                                  &response,
	                                  &statusDetail,
	                                  &responseIDs);

	if (statusDetail != nullptr) {
		OFLOG_DEBUG(qrLogger, "Status Detail:" << OFendl << DcmObject::PrintHelper(*statusDetail));
		delete statusDetail;
	}
	if (responseIDs != nullptr) {
		OFLOG_DEBUG(qrLogger, "Response Identifiers:" << OFendl << DcmObject::PrintHelper(*responseIDs));
		delete responseIDs;
	}

	if (cond.bad()) {
		OFLOG_ERROR(qrLogger, "Move Request failed: " << DimseCondition::dump(temp_string, cond));
		return cond;
	}

	// final response carries the definitive counters
	progress.m_remaining = 0;
	progress.m_completed = response.NumberOfCompletedSubOperations;
	progress.m_failed    = response.NumberOfFailedSubOperations;
	progress.m_warning   = response.NumberOfWarningSubOperations;

	OFLOG_DEBUG(qrLogger,
	            "Received Final Move Response (" << DU_cmoveStatusString(response.DimseStatus) << ")");

	switch (response.DimseStatus) {
		case STATUS_Success:
			return EC_Normal;
		case STATUS_MOVE_Warning_SubOperationsCompleteOneOrMoreFailures:
			return makeTransferFailure(fmt::format("C-MOVE completed with {} failed and {} warning sub-operation(s)",
			                                       progress.m_failed,
			                                       progress.m_warning));
		case STATUS_MOVE_Failed_MoveDestinationUnknown:
			return makeTransferFailure(fmt::format(
				"move destination {} is unknown to {}, register it on the remote node",
				this->m_receiverAETitle,
				this->m_calledAETitle));
		default:
			return makeTransferFailure(fmt::format("C-MOVE ended with status {:#06x} ({})",
			                                       response.DimseStatus,
			                                       DU_cmoveStatusString(response.DimseStatus)));
	}
}

OFCondition QueryRetriever::findStudies(const std::string &       date_from,
                                        const std::string &       date_to,
                                        std::vector<StudyRecord> &studies) {
	studies.clear();

	DcmFileFormat fileformat;
	DcmDataset *  requestedDataset = fileformat.getDataset();

	const QueryDateRange range{date_from, date_to};
	const std::string    dateRange = date_from == date_to ? date_from : range.dicomRange();
	requestedDataset->putAndInsertString(DCM_QueryRetrieveLevel, "STUDY");
	requestedDataset->putAndInsertString(DCM_StudyDate, dateRange.c_str());
	requestedDataset->putAndInsertString(DCM_StudyTime, "");
	requestedDataset->putAndInsertString(DCM_StudyInstanceUID, "");
	requestedDataset->putAndInsertString(DCM_PatientID, "");
	requestedDataset->putAndInsertString(DCM_PatientName, "");
	requestedDataset->putAndInsertString(DCM_StudyDescription, "");
	requestedDataset->putAndInsertString(DCM_NumberOfStudyRelatedInstances, "");

	OFCondition cond = this->setupAssociation();
	if (cond.bad())
		return makeQueryFailure(this->describeFailure("Association for study query", cond));

	StudyQueryCallback callback(studies);
	cond = this->performFindRequest(requestedDataset, &callback);
	const OFCondition teardown = this->removeAssociation(cond);

	if (isSyncCondition(cond, SYNC_EC_CODE_QueryFailure))
		return cond;
	if (cond.bad())
		return makeQueryFailure(this->describeFailure("Study query", cond));
	if (teardown.bad())
		OFLOG_WARN(qrLogger, this->describeFailure("Association teardown", teardown));

	OFLOG_DEBUG(qrLogger, fmt::format("{} node returned {} studies for {}", this->m_nodeName, studies.size(), dateRange));
	return EC_Normal;
}

OFCondition QueryRetriever::findSeries(const std::string &study_uid, std::vector<SeriesRecord> &series) {
	series.clear();

	DcmFileFormat fileformat;
	DcmDataset *  requestedDataset = fileformat.getDataset();

	requestedDataset->putAndInsertString(DCM_QueryRetrieveLevel, "SERIES");
	requestedDataset->putAndInsertString(DCM_StudyInstanceUID, study_uid.c_str());
	requestedDataset->putAndInsertString(DCM_SeriesInstanceUID, "");
	requestedDataset->putAndInsertString(DCM_SeriesNumber, "");
	requestedDataset->putAndInsertString(DCM_SeriesDescription, "");
	requestedDataset->putAndInsertString(DCM_Modality, "");
	requestedDataset->putAndInsertString(DCM_NumberOfSeriesRelatedInstances, "");

	OFCondition cond = this->setupAssociation();
	if (cond.bad())
		return makeQueryFailure(this->describeFailure("Association for series query", cond));

	SeriesQueryCallback callback(study_uid, series);
	cond = this->performFindRequest(requestedDataset, &callback);
	const OFCondition teardown = this->removeAssociation(cond);

	if (isSyncCondition(cond, SYNC_EC_CODE_QueryFailure))
		return cond;
	if (cond.bad())
		return makeQueryFailure(this->describeFailure(fmt::format("Series query for study {}", study_uid).c_str(),
		                                              cond));
	if (teardown.bad())
		OFLOG_WARN(qrLogger, this->describeFailure("Association teardown", teardown));

	return EC_Normal;
}

OFCondition QueryRetriever::moveSeries(const std::string &series_uid,
                                       const std::string &study_uid,
                                       MoveProgress &     progress) {
	progress = MoveProgress{};

	DcmFileFormat fileformat;
	DcmDataset *  requestedDataset = fileformat.getDataset();

	requestedDataset->putAndInsertString(DCM_QueryRetrieveLevel, "SERIES");
	requestedDataset->putAndInsertString(DCM_StudyInstanceUID, study_uid.c_str());
	requestedDataset->putAndInsertString(DCM_SeriesInstanceUID, series_uid.c_str());

	OFCondition cond = this->setupAssociation();
	if (cond.bad())
		return makeTransferFailure(this->describeFailure("Association for series move", cond));

	cond = this->performMoveRequest(requestedDataset, progress);
	const OFCondition teardown = this->removeAssociation(cond);

	if (isSyncCondition(cond, SYNC_EC_CODE_TransferFailure))
		return cond;
	if (cond.bad())
		return makeTransferFailure(this->describeFailure(fmt::format("Move of series {}", series_uid).c_str(), cond));
	if (teardown.bad())
		OFLOG_WARN(qrLogger, this->describeFailure("Association teardown", teardown));

	return EC_Normal;
}

QueryCallback::QueryCallback() : m_assoc(nullptr),
                                 m_presID(0) {}

void QueryCallback::setAssociation(T_ASC_Association *assoc) {
	this->m_assoc = assoc;
}

void QueryCallback::setPresentationContextID(const T_ASC_PresentationContextID pres_id) {
	this->m_presID = pres_id;
}

static void logFindResponse(const int response_count, T_DIMSE_C_FindRSP *response, DcmDataset *response_identifiers) {
	if (DCM_dcmnetLogger.isEnabledFor(OFLogger::DEBUG_LOG_LEVEL)) {
		OFString temp_string;
		DCMNET_DEBUG("Received Find Response " << response_count);
		DCMNET_DEBUG(DIMSE_dumpMessage(temp_string, *response, DIMSE_INCOMING));
	}
	if (qrLogger.isEnabledFor(OFLogger::TRACE_LOG_LEVEL))
		OFLOG_TRACE(qrLogger, "Response Identifiers:" << OFendl << DcmObject::PrintHelper(*response_identifiers));
}

StudyQueryCallback::StudyQueryCallback(std::vector<StudyRecord> &studies) : m_studies(studies) {}

void StudyQueryCallback::callback(T_DIMSE_C_FindRQ *,
                                  const int          response_count,
                                  T_DIMSE_C_FindRSP *response,
                                  DcmDataset *       response_identifiers) {
	logFindResponse(response_count, response, response_identifiers);

	StudyRecord study = studyRecordFromDataset(*response_identifiers);
	if (study.m_study_uid.empty()) {
		OFLOG_WARN(qrLogger, "Find Response " << response_count << " without StudyInstanceUID, ignoring");
		return;
	}
	this->m_studies.push_back(std::move(study));
}

SeriesQueryCallback::SeriesQueryCallback(std::string study_uid, std::vector<SeriesRecord> &series)
	: m_studyUID(std::move(study_uid)),
	  m_series(series) {}

void SeriesQueryCallback::callback(T_DIMSE_C_FindRQ *,
                                   const int          response_count,
                                   T_DIMSE_C_FindRSP *response,
                                   DcmDataset *       response_identifiers) {
	logFindResponse(response_count, response, response_identifiers);

	SeriesRecord series = seriesRecordFromDataset(*response_identifiers, this->m_studyUID);
	if (series.m_series_uid.empty()) {
		OFLOG_WARN(qrLogger, "Find Response " << response_count << " without SeriesInstanceUID, ignoring");
		return;
	}
	this->m_series.push_back(std::move(series));
}
