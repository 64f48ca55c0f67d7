#include <atomic>
#include <chrono>
#include <csignal>

#include "fmt/color.h"
#include "fmt/format.h"

#include "dcmtk/config/osconfig.h"
#include "dcmtk/dcmdata/cmdlnarg.h"
#include "dcmtk/dcmdata/dcuid.h"
#include "dcmtk/ofstd/ofconapp.h"
#include "dcmtk/ofstd/ofexit.h"

#include "StudyQueryRetriever.hpp"
#include "SyncConditions.hpp"
#include "SyncConfig.hpp"
#include "SyncCycle.hpp"
#include "SyncReport.hpp"
#include "SyncScheduler.hpp"

static std::atomic<bool> cancelRequested{false};

extern "C" void requestCancel(int) { cancelRequested.store(true); }

static void configureRetriever(QueryRetriever &retriever,
                               const DicomNode &node,
                               const SyncConfig &config) {
  retriever.m_nodeName = node.m_name;
  retriever.m_calledIP = node.m_address;
  retriever.m_port = node.m_port;
  retriever.m_calledAETitle = node.m_aeTitle;
  retriever.m_callerAETitle = config.m_callingAETitle;
  retriever.m_receiverAETitle = config.moveDestination();
  retriever.m_acseTimeout = config.m_acseTimeout;
  retriever.m_dimseTimeout = config.m_dimseTimeout;
  retriever.m_networkTransferSyntax = config.m_proposedTransferSyntax;
}

int main(int argc, char *argv[]) {
  constexpr auto FNO_CONSOLE_APPLICATION{"fnostudysync"};
  constexpr auto *APP_VERSION{"1.0.0"};
  constexpr auto APP_RELEASE_DATE{"2026-10-19"};

  const std::string rcsid =
      fmt::format("${}: ver. {} rel. {}\n$dcmtk: ver. {} rel. {}",
                  FNO_CONSOLE_APPLICATION, APP_VERSION, APP_RELEASE_DATE,
                  OFFIS_DCMTK_VERSION, OFFIS_DCMTK_RELEASEDATE);
  OFLogger mainLogger = OFLog::getLogger(
      fmt::format("fno.apps.{}", FNO_CONSOLE_APPLICATION).c_str());

  constexpr int SHORTCOL{4};
  constexpr int LONGCOL{20};

  OFConsoleApplication app(
      FNO_CONSOLE_APPLICATION,
      "DICOM remote to local archive synchronization (C-FIND/C-MOVE) SCU",
      rcsid.c_str());
  OFCommandLine cmd;
  SyncConfig config;

  const char *opt_remoteIP{nullptr};
  OFCmdUnsignedInt opt_remotePort{0};
  const char *opt_localIP{nullptr};
  OFCmdUnsignedInt opt_localPort{0};

  const char *opt_aeCaller{USER_APPLICATION_TITLE};
  const char *opt_aeRemote{nullptr};
  const char *opt_aeLocal{nullptr};
  const char *opt_aeReceiver{nullptr};

  OFCmdSignedInt opt_acseTimeout{DEFAULT_ACSE_TIMEOUT};
  OFCmdSignedInt opt_dimseTimeout{0};

  OFCmdUnsignedInt opt_windowHours{DEFAULT_WINDOW_HOURS};
  OFCmdUnsignedInt opt_interval{DEFAULT_INTERVAL_SECONDS};
  OFCmdUnsignedInt opt_maxImages{0};
  OFCmdUnsignedInt opt_minMissing{1};
  const char *opt_downloadDay{nullptr};
  OFBool opt_allSeries{OFFalse};

  cmd.setParamColumn(LONGCOL + SHORTCOL + 4);
  cmd.addParam("remote-ip", "hostname of remote DICOM archive");
  cmd.addParam("remote-port", "tcp/ip port number of remote archive");
  cmd.addParam("local-ip", "hostname of local DICOM archive");
  cmd.addParam("local-port", "tcp/ip port number of local archive");

  cmd.setOptionColumns(LONGCOL, SHORTCOL);
  cmd.addGroup("general options:", LONGCOL, SHORTCOL + 2);
  cmd.addOption("--help", "-h", "print this help text and exit",
                OFCommandLine::AF_Exclusive);
  cmd.addOption("--version", "print version information and exit",
                OFCommandLine::AF_Exclusive);
  OFLog::addOptions(cmd);

  cmd.addGroup("network options:");
  cmd.addSubGroup("application entity titles:");
  cmd.addOption("--ae-caller", "-aet", 1, "[a]etitle: string",
                fmt::format("set my calling AE title (default: {})",
                            USER_APPLICATION_TITLE)
                    .c_str());
  cmd.addOption("--ae-remote", "-aec", 1, "[a]etitle: string",
                "set called AE title of remote archive");
  cmd.addOption("--ae-local", "-ael", 1, "[a]etitle: string",
                "set called AE title of local archive");
  cmd.addOption("--ae-receiver", "-aem", 1, "[a]etitle: string",
                "set move destination AE title (default: local AE title)");

  cmd.addSubGroup("timeouts:");
  cmd.addOption("--acse-timeout", "-ta", 1, "[s]econds: integer",
                fmt::format("timeout for ACSE messages (default: {})",
                            DEFAULT_ACSE_TIMEOUT)
                    .c_str());
  cmd.addOption("--dimse-timeout", "-td", 1, "[s]econds: integer",
                "timeout for DIMSE messages (default: unlimited)");

  cmd.addSubGroup("preferred network transfer syntaxes:");
  cmd.addOption("--propose-implicit", "-xi",
                "propose implicit VR little endian TS only");
  cmd.addOption("--propose-big", "-xb",
                "propose all uncompressed TS, explicit VR\nbig endian first");

  cmd.addGroup("synchronization options:");
  cmd.addOption("--window-hours", "-w", 1, "[h]ours: integer",
                fmt::format("look-back window in hours (default: {})",
                            DEFAULT_WINDOW_HOURS)
                    .c_str());
  cmd.addOption("--interval", "-i", 1, "[s]econds: integer",
                fmt::format("pause between sync cycles (default: {})",
                            DEFAULT_INTERVAL_SECONDS)
                    .c_str());
  cmd.addOption("--max-images", "-mi", 1, "[n]umber: integer",
                "transfer every series with fewer than n images");
  cmd.addOption("--all-series", "-as",
                "transfer every missing or incomplete series");
  cmd.addOption("--min-missing", "-mm", 1, "[n]umber: integer",
                "skip series missing fewer than n images (default: 1)");
  cmd.addOption("--download-day", "-dd", 1, "day: today|yesterday|YYYYMMDD",
                "run one cycle over all studies of that day and exit");

  prepareCmdLineArgs(argc, argv, FNO_CONSOLE_APPLICATION);
  if (app.parseCommandLine(cmd, argc, argv)) {
    if (cmd.hasExclusiveOption()) {
      if (cmd.findOption("--version")) {
        app.printHeader(OFTrue);
        return EXITCODE_NO_ERROR;
      }
    }

    cmd.getParam(1, opt_remoteIP);
    config.m_remote.m_address = opt_remoteIP;
    app.checkParam(cmd.getParamAndCheckMinMax(2, opt_remotePort, 1, 65535));
    config.m_remote.m_port = OFstatic_cast(unsigned short, opt_remotePort);

    cmd.getParam(3, opt_localIP);
    config.m_local.m_address = opt_localIP;
    app.checkParam(cmd.getParamAndCheckMinMax(4, opt_localPort, 1, 65535));
    config.m_local.m_port = OFstatic_cast(unsigned short, opt_localPort);

    OFLog::configureFromCommandLine(cmd, app);

    if (cmd.findOption("--ae-caller")) {
      app.checkValue(cmd.getValue(opt_aeCaller));
      config.m_callingAETitle = opt_aeCaller;
    }

    if (cmd.findOption("--ae-remote")) {
      app.checkValue(cmd.getValue(opt_aeRemote));
      config.m_remote.m_aeTitle = opt_aeRemote;
    }

    if (cmd.findOption("--ae-local")) {
      app.checkValue(cmd.getValue(opt_aeLocal));
      config.m_local.m_aeTitle = opt_aeLocal;
    }

    if (cmd.findOption("--ae-receiver")) {
      app.checkValue(cmd.getValue(opt_aeReceiver));
      config.m_moveDestination = opt_aeReceiver;
    }

    if (cmd.findOption("--acse-timeout")) {
      app.checkValue(cmd.getValueAndCheckMin(opt_acseTimeout, 1));
      config.m_acseTimeout = OFstatic_cast(int, opt_acseTimeout);
    }

    if (cmd.findOption("--dimse-timeout")) {
      app.checkValue(cmd.getValueAndCheckMin(opt_dimseTimeout, 1));
      config.m_dimseTimeout = OFstatic_cast(int, opt_dimseTimeout);
    }

    if (cmd.findOption("--propose-implicit"))
      config.m_proposedTransferSyntax = EXS_LittleEndianImplicit;
    else if (cmd.findOption("--propose-big"))
      config.m_proposedTransferSyntax = EXS_BigEndianExplicit;

    if (cmd.findOption("--window-hours")) {
      app.checkValue(cmd.getValue(opt_windowHours));
      config.m_options.m_windowHours =
          OFstatic_cast(unsigned int, opt_windowHours);
    }

    if (cmd.findOption("--interval")) {
      app.checkValue(cmd.getValue(opt_interval));
      config.m_interval = std::chrono::seconds(opt_interval);
    }

    if (cmd.findOption("--max-images")) {
      app.checkValue(cmd.getValue(opt_maxImages));
      config.m_options.m_policy.m_mode = SelectionMode::Threshold;
      config.m_options.m_policy.m_min_images =
          OFstatic_cast(unsigned int, opt_maxImages);
    }

    if (cmd.findOption("--all-series"))
      opt_allSeries = OFTrue;

    if (cmd.findOption("--min-missing")) {
      app.checkValue(cmd.getValue(opt_minMissing));
      config.m_options.m_policy.m_min_missing_images =
          OFstatic_cast(unsigned int, opt_minMissing);
    }

    if (cmd.findOption("--download-day")) {
      app.checkValue(cmd.getValue(opt_downloadDay));
      config.m_options.m_downloadDay = opt_downloadDay;
    }

    OFLOG_DEBUG(mainLogger, rcsid.c_str() << OFendl);
  }

  if (opt_allSeries) {
    if (config.m_options.m_policy.m_mode == SelectionMode::Threshold) {
      OFLOG_FATAL(mainLogger,
                  "--all-series cannot be combined with --max-images");
      return EXITCODE_CONFIGURATION_ERROR;
    }
    config.m_options.m_policy.m_mode = SelectionMode::All;
  }

  // a whole day is downloaded completely unless a threshold was given
  if (config.m_options.m_downloadDay &&
      config.m_options.m_policy.m_mode == SelectionMode::Smallest)
    config.m_options.m_policy.m_mode = SelectionMode::All;

  OFCondition cond = config.validate();
  if (cond.bad()) {
    OFLOG_FATAL(mainLogger, "Invalid configuration: " << cond.text());
    return EXITCODE_CONFIGURATION_ERROR;
  }

  printBanner(config);

  OFStandard::initializeNetwork();

  QueryRetriever remoteRetriever;
  QueryRetriever localRetriever;
  configureRetriever(remoteRetriever, config.m_remote, config);
  configureRetriever(localRetriever, config.m_local, config);

  OFString temp_string;
  cond = remoteRetriever.initializeNetwork();
  if (cond.good())
    cond = localRetriever.initializeNetwork();
  if (cond.bad()) {
    OFLOG_ERROR(mainLogger, "Cannot create network: "
                                << DimseCondition::dump(temp_string, cond));
    OFLOG_ERROR(mainLogger, "Exiting program");
    OFStandard::shutdownNetwork();
    return EXITCODE_CANNOT_INITIALIZE_NETWORK;
  }

  std::signal(SIGINT, requestCancel);
  std::signal(SIGTERM, requestCancel);

  TransferConsoleCallback transferCallback;
  SyncCycle cycle(remoteRetriever, localRetriever, remoteRetriever,
                  config.m_options, cancelRequested, &transferCallback);
  SyncScheduler scheduler(
      cycle, config.m_options,
      std::chrono::duration_cast<std::chrono::milliseconds>(config.m_interval),
      cancelRequested);

  int exitCode = EXITCODE_NO_ERROR;
  if (config.m_options.m_downloadDay) {
    const SyncCycleStats stats = scheduler.runOnce();
    if (stats.failed()) {
      fmt::print("\n{}\n", fmt::format(fg(fmt::color::red),
                                       "Download of day '{}' failed",
                                       *config.m_options.m_downloadDay));
      exitCode = EXITCODE_SYNC_FAILED;
    } else {
      fmt::print("\n{}\n", fmt::format(fg(fmt::color::green),
                                       "Download of day '{}' completed",
                                       *config.m_options.m_downloadDay));
    }
  } else {
    fmt::print("\nPress Ctrl+C to stop\n");
    scheduler.run();
    printShutdown(scheduler.totals());
  }

  cond = remoteRetriever.dropNetwork();
  if (cond.good())
    cond = localRetriever.dropNetwork();
  if (cond.bad()) {
    OFLOG_ERROR(mainLogger, "Failed to drop network: "
                                << DimseCondition::dump(temp_string, cond));
  }

  OFStandard::shutdownNetwork();

  return exitCode;
}
