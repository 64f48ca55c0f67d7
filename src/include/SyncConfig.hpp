#ifndef SYNCCONFIG_HPP
#define SYNCCONFIG_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "dcmtk/config/osconfig.h"
#include "dcmtk/dcmdata/dcxfer.h"
#include "dcmtk/ofstd/ofcond.h"

#include "SelectionPolicy.hpp"
#include "TimeWindow.hpp"

constexpr auto USER_APPLICATION_TITLE{"FNOSTUDYSYNC"};

constexpr unsigned int DEFAULT_INTERVAL_SECONDS = 60;
constexpr int          DEFAULT_ACSE_TIMEOUT     = 30;

// 16 characters, DICOM PS3.5 AE VR
constexpr std::size_t MAX_AE_TITLE_LENGTH = 16;

struct DicomNode {
	std::string    m_name{};
	std::string    m_aeTitle{};
	std::string    m_address{};
	unsigned short m_port{0};

	std::string describe() const;
};

// everything one sync cycle needs besides its services
struct SyncOptions {
	unsigned int               m_windowHours{DEFAULT_WINDOW_HOURS};
	SelectionPolicy            m_policy{};
	std::optional<std::string> m_downloadDay{}; // "today", "yesterday" or YYYYMMDD
};

struct SyncConfig {
	DicomNode   m_remote{"remote", "", "", 0};
	DicomNode   m_local{"local", "", "", 0};
	std::string m_callingAETitle{USER_APPLICATION_TITLE};
	std::string m_moveDestination{}; // empty: local node AE title

	SyncOptions          m_options{};
	std::chrono::seconds m_interval{DEFAULT_INTERVAL_SECONDS};
	int                  m_acseTimeout{DEFAULT_ACSE_TIMEOUT};
	int                  m_dimseTimeout{0};
	E_TransferSyntax     m_proposedTransferSyntax{EXS_LittleEndianExplicit};

	const std::string &moveDestination() const;

	// SYNC_EC_ConfigurationError naming the first invalid parameter
	OFCondition validate() const;
};

#endif //SYNCCONFIG_HPP
