#ifndef DICOMSERVICES_HPP
#define DICOMSERVICES_HPP

#include <string>
#include <vector>

#include "dcmtk/config/osconfig.h"
#include "dcmtk/ofstd/ofcond.h"

#include "StudyRecord.hpp"

/*
 * Study/series level queries against one archive.
 * Failures are reported as SYNC_EC_QueryFailure.
 */
class DirectoryService {
public:
	virtual ~DirectoryService() = default;

	// date range bounds are inclusive, format YYYYMMDD
	virtual OFCondition findStudies(const std::string &       date_from,
	                                const std::string &       date_to,
	                                std::vector<StudyRecord> &studies) = 0;

	virtual OFCondition findSeries(const std::string &        study_uid,
	                               std::vector<SeriesRecord> &series) = 0;
};

/*
 * Moves one series from the remote archive to the local archive.
 * Blocks until the move is acknowledged complete or failed, failures are
 * reported as SYNC_EC_TransferFailure.
 */
class TransferService {
public:
	virtual ~TransferService() = default;

	virtual OFCondition moveSeries(const std::string &series_uid,
	                               const std::string &study_uid,
	                               MoveProgress &     progress) = 0;
};

#endif //DICOMSERVICES_HPP
