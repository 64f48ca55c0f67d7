#include "SyncConfig.hpp"

#include "fmt/format.h"

#include "SyncConditions.hpp"

std::string DicomNode::describe() const {
	return fmt::format("{} ({}@{}:{})", m_name, m_aeTitle, m_address, m_port);
}

const std::string &SyncConfig::moveDestination() const {
	return m_moveDestination.empty() ? m_local.m_aeTitle : m_moveDestination;
}

static OFCondition checkAETitle(const std::string &ae_title, const std::string &what) {
	if (ae_title.empty())
		return makeConfigurationError(fmt::format("{} AE title is empty", what));
	if (ae_title.length() > MAX_AE_TITLE_LENGTH)
		return makeConfigurationError(fmt::format("{} AE title \"{}\" is longer than {} characters",
		                                          what,
		                                          ae_title,
		                                          MAX_AE_TITLE_LENGTH));
	return EC_Normal;
}

static OFCondition checkNode(const DicomNode &node) {
	OFCondition cond = checkAETitle(node.m_aeTitle, node.m_name);
	if (cond.bad())
		return cond;

	if (node.m_address.empty())
		return makeConfigurationError(fmt::format("{} address is empty", node.m_name));

	if (node.m_port == 0)
		return makeConfigurationError(fmt::format("{} port must be within 1..65535", node.m_name));

	return EC_Normal;
}

OFCondition SyncConfig::validate() const {
	OFCondition cond = checkNode(m_remote);
	if (cond.bad())
		return cond;

	cond = checkNode(m_local);
	if (cond.bad())
		return cond;

	cond = checkAETitle(m_callingAETitle, "calling");
	if (cond.bad())
		return cond;

	cond = checkAETitle(moveDestination(), "move destination");
	if (cond.bad())
		return cond;

	if (m_options.m_windowHours == 0)
		return makeConfigurationError("look-back window must be at least 1 hour");

	if (m_options.m_policy.m_mode == SelectionMode::Threshold && m_options.m_policy.m_min_images == 0)
		return makeConfigurationError("--max-images must be a positive number");

	if (m_options.m_policy.m_min_missing_images == 0)
		return makeConfigurationError("--min-missing must be a positive number");

	if (m_interval.count() <= 0)
		return makeConfigurationError("cycle interval must be at least 1 second");

	if (m_acseTimeout < 0 || m_dimseTimeout < 0)
		return makeConfigurationError("timeouts must not be negative");

	if (m_options.m_downloadDay) {
		QueryDateRange range{};
		if (parseDownloadDay(*m_options.m_downloadDay, SyncClock::now(), range).bad())
			return makeConfigurationError(fmt::format("download day \"{}\" is not 'today', 'yesterday' or YYYYMMDD",
			                                          *m_options.m_downloadDay));
	}

	return EC_Normal;
}
