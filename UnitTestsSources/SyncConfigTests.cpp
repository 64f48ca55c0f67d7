#include "gtest/gtest.h"

#include "SyncConditions.hpp"
#include "SyncConfig.hpp"

static SyncConfig validConfig() {
	SyncConfig config{};
	config.m_remote = DicomNode{"remote", "PACS", "10.0.0.5", 104};
	config.m_local  = DicomNode{"local", "ORTHANC", "127.0.0.1", 4242};
	return config;
}

static void expectConfigurationError(const SyncConfig &config, const char *fragment) {
	const OFCondition cond = config.validate();
	EXPECT_TRUE(cond.bad()) << fragment;
	EXPECT_TRUE(isSyncCondition(cond, SYNC_EC_CODE_ConfigurationError)) << cond.text();
	EXPECT_NE(std::string::npos, std::string(cond.text()).find(fragment)) << cond.text();
}

TEST(SyncConfig, Defaults) {
	const SyncConfig config = validConfig();
	ASSERT_TRUE(config.validate().good());

	ASSERT_EQ("FNOSTUDYSYNC", config.m_callingAETitle);
	ASSERT_EQ("ORTHANC", config.moveDestination());
	ASSERT_EQ(3u, config.m_options.m_windowHours);
	ASSERT_EQ(SelectionMode::Smallest, config.m_options.m_policy.m_mode);
	ASSERT_EQ(1u, config.m_options.m_policy.m_min_missing_images);
	ASSERT_EQ(60, config.m_interval.count());
	ASSERT_EQ(30, config.m_acseTimeout);
	ASSERT_EQ(0, config.m_dimseTimeout);
	ASSERT_EQ(EXS_LittleEndianExplicit, config.m_proposedTransferSyntax);
	ASSERT_FALSE(config.m_options.m_downloadDay.has_value());
}

TEST(SyncConfig, MoveDestinationOverride) {
	SyncConfig config        = validConfig();
	config.m_moveDestination = "ARCHIVE";
	ASSERT_EQ("ARCHIVE", config.moveDestination());
	ASSERT_TRUE(config.validate().good());
}

TEST(SyncConfig, InvalidNodes) {
	SyncConfig config = validConfig();
	config.m_remote.m_aeTitle.clear();
	expectConfigurationError(config, "remote AE title is empty");

	config                    = validConfig();
	config.m_local.m_aeTitle  = "THIS_AE_TITLE_IS_TOO_LONG";
	expectConfigurationError(config, "longer than 16");

	config                    = validConfig();
	config.m_remote.m_address = "";
	expectConfigurationError(config, "remote address");

	config               = validConfig();
	config.m_local.m_port = 0;
	expectConfigurationError(config, "local port");

	config                  = validConfig();
	config.m_callingAETitle = "";
	expectConfigurationError(config, "calling AE title");
}

TEST(SyncConfig, InvalidOptions) {
	SyncConfig config               = validConfig();
	config.m_options.m_windowHours = 0;
	expectConfigurationError(config, "window");

	config                                   = validConfig();
	config.m_options.m_policy.m_mode       = SelectionMode::Threshold;
	config.m_options.m_policy.m_min_images = 0;
	expectConfigurationError(config, "--max-images");

	config                                          = validConfig();
	config.m_options.m_policy.m_min_missing_images = 0;
	expectConfigurationError(config, "--min-missing");

	config            = validConfig();
	config.m_interval = std::chrono::seconds{0};
	expectConfigurationError(config, "interval");

	config                         = validConfig();
	config.m_options.m_downloadDay = "last week";
	expectConfigurationError(config, "last week");

	config                         = validConfig();
	config.m_options.m_downloadDay = "yesterday";
	ASSERT_TRUE(config.validate().good());
}

TEST(SyncConditions, DetailKeepsCode) {
	const OFCondition query = makeQueryFailure("remote node unreachable");
	ASSERT_TRUE(query.bad());
	ASSERT_EQ(OFM_fnostudysync, query.module());
	ASSERT_EQ(SYNC_EC_CODE_QueryFailure, query.code());
	ASSERT_EQ(std::string("Directory service query failed: remote node unreachable"), query.text());

	ASSERT_TRUE(isSyncCondition(makeTransferFailure("x"), SYNC_EC_CODE_TransferFailure));
	ASSERT_FALSE(isSyncCondition(makeTransferFailure("x"), SYNC_EC_CODE_QueryFailure));
	ASSERT_FALSE(isSyncCondition(EC_Normal, SYNC_EC_CODE_QueryFailure));
	ASSERT_TRUE(isSyncCondition(makeConfigurationError(""), SYNC_EC_CODE_ConfigurationError));
}
