#include "SyncConditions.hpp"

#include <string>

makeOFConditionConst(SYNC_EC_QueryFailure, OFM_fnostudysync, SYNC_EC_CODE_QueryFailure, OF_error,
                     "Directory service query failed");
makeOFConditionConst(SYNC_EC_TransferFailure, OFM_fnostudysync, SYNC_EC_CODE_TransferFailure, OF_error,
                     "Transfer service move failed");
makeOFConditionConst(SYNC_EC_ConfigurationError, OFM_fnostudysync, SYNC_EC_CODE_ConfigurationError, OF_error,
                     "Invalid configuration");
makeOFConditionConst(SYNC_EC_InvalidDownloadDay, OFM_fnostudysync, SYNC_EC_CODE_InvalidDownloadDay, OF_error,
                     "Invalid download day, use 'today', 'yesterday' or YYYYMMDD");

static OFCondition withDetail(const OFCondition &base, std::string_view detail) {
	if (detail.empty())
		return base;

	const std::string text = std::string{base.text()} + ": " + std::string{detail};
	return makeOFCondition(base.module(), base.code(), base.status(), text.c_str());
}

OFCondition makeQueryFailure(std::string_view detail) {
	return withDetail(SYNC_EC_QueryFailure, detail);
}

OFCondition makeTransferFailure(std::string_view detail) {
	return withDetail(SYNC_EC_TransferFailure, detail);
}

OFCondition makeConfigurationError(std::string_view detail) {
	return withDetail(SYNC_EC_ConfigurationError, detail);
}
