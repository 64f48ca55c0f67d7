#ifndef SYNCCONDITIONS_HPP
#define SYNCCONDITIONS_HPP

#include <string_view>

#include "dcmtk/config/osconfig.h"
#include "dcmtk/ofstd/ofcond.h"

// first module id DCMTK leaves to applications
constexpr unsigned short OFM_fnostudysync = 1024;

constexpr unsigned short SYNC_EC_CODE_QueryFailure         = 1;
constexpr unsigned short SYNC_EC_CODE_TransferFailure      = 2;
constexpr unsigned short SYNC_EC_CODE_ConfigurationError   = 3;
constexpr unsigned short SYNC_EC_CODE_InvalidDownloadDay   = 4;

constexpr int EXITCODE_CONFIGURATION_ERROR       = 20;
constexpr int EXITCODE_CANNOT_INITIALIZE_NETWORK = 60;
constexpr int EXITCODE_SYNC_FAILED               = 70;

extern const OFCondition SYNC_EC_QueryFailure;
extern const OFCondition SYNC_EC_TransferFailure;
extern const OFCondition SYNC_EC_ConfigurationError;
extern const OFCondition SYNC_EC_InvalidDownloadDay;

OFCondition makeQueryFailure(std::string_view detail);

OFCondition makeTransferFailure(std::string_view detail);

OFCondition makeConfigurationError(std::string_view detail);

inline bool isSyncCondition(const OFCondition &cond, unsigned short code) {
	return cond.module() == OFM_fnostudysync && cond.code() == code;
}

#endif //SYNCCONDITIONS_HPP
