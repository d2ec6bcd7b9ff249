#include "../crypto/Schnorr.h"
#include "../lib/Logger.h"
#include "../server/TrackerActor.h"

#include <CLI/CLI.hpp>

#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

namespace {
volatile std::sig_atomic_t g_stopRequested = 0;

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_stopRequested = 1;
  }
}

// One JSON reserve event per line, blank lines skipped
int ingestEvents(bt::TrackerActor &actor, const std::string &eventsFile) {
  auto logger = bt::logging::getLogger("bt");
  std::ifstream in(eventsFile);
  if (!in) {
    logger.error << "Cannot open events file: " << eventsFile;
    return 1;
  }

  size_t lineNo = 0;
  size_t applied = 0;
  size_t rejected = 0;
  std::string line;
  while (std::getline(in, line)) {
    ++lineNo;
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    auto jd = bt::utl::parseJson(line);
    if (!jd) {
      logger.warning << eventsFile << ":" << lineNo << ": " << jd.error().message;
      ++rejected;
      continue;
    }
    auto event = bt::reserveEventFromJson(jd.value());
    if (!event) {
      logger.warning << eventsFile << ":" << lineNo << ": " << event.error().message;
      ++rejected;
      continue;
    }
    auto result = actor.applyReserveEvent(event.value()).get();
    if (!result) {
      logger.warning << eventsFile << ":" << lineNo << ": " << result.error().message;
      ++rejected;
      continue;
    }
    ++applied;
  }
  logger.info << "Reserve events applied: " << applied << ", rejected: " << rejected;
  return 0;
}

int runTracker(const std::string &workDir, const std::string &eventsFile, bool debugMode) {
  auto logger = bt::logging::getLogger("bt");

  auto config = bt::TrackerConfig::loadOrCreate(workDir);
  if (!config) {
    logger.error << "Failed to load configuration: " << config.error().message;
    return 1;
  }

  bt::logging::Level level = bt::logging::Level::DEBUG;
  if (!debugMode) {
    bt::logging::parseLevel(config.value().logLevel, level);
  }
  auto rootLogger = bt::logging::getRootLogger();
  rootLogger.setLevel(level);
  rootLogger.addFileHandler(workDir + "/tracker.log", level);

  logger.info << "Running tracker with work directory: " << workDir;

  bt::TrackerActor::Config actorConfig;
  actorConfig.workDir = workDir;
  actorConfig.tracker = config.value();
  bt::TrackerActor actor(actorConfig);

  auto started = actor.start();
  if (!started) {
    logger.error << "Failed to start tracker: " << started.error().message;
    return 1;
  }

  if (!eventsFile.empty()) {
    int rc = ingestEvents(actor, eventsFile);
    if (rc != 0) {
      actor.shutdown();
      return rc;
    }
  }

  auto state = actor.getState();
  logger.info << "Commitment root " << bt::utl::hexEncode(state.commitmentRoot);

  while (!g_stopRequested) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  actor.shutdown();
  logger.info << "Tracker stopped after " << actor.getProcessedCount() << " commands";
  return 0;
}

int runKeygen() {
  auto keyPair = bt::crypto::generateKeyPair();
  if (!keyPair) {
    std::cerr << "Key generation failed: " << keyPair.error().message << std::endl;
    return 1;
  }
  std::cout << "secret: " << bt::utl::hexEncode(keyPair.value().secretKey) << std::endl;
  std::cout << "public: " << bt::utl::hexEncode(keyPair.value().publicKey) << std::endl;
  bt::utl::secureZero(keyPair.value().secretKey);
  return 0;
}
} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"basis-tracker - Off-chain IOU note tracker"};
  app.require_subcommand(1);

  auto runCmd = app.add_subcommand("run", "Run the tracker");
  std::string workDir;
  runCmd->add_option("-d,--work-dir", workDir, "Work directory (required)")->required();
  std::string eventsFile;
  runCmd->add_option("--events", eventsFile,
                     "File of reserve events, one JSON object per line");
  bool debugMode = false;
  runCmd->add_flag("--debug", debugMode, "Enable debug logging (default: config logLevel)");

  auto keygenCmd = app.add_subcommand("keygen", "Generate a secp256k1 key pair");

  app.footer("Example:\n"
             "  basis-tracker run -d /path/to/work-dir [--events reserves.jsonl] [--debug]\n"
             "  basis-tracker keygen\n"
             "\n"
             "The tracker creates a default config.json if it doesn't exist.\n");

  CLI11_PARSE(app, argc, argv);

  if (keygenCmd->parsed()) {
    return runKeygen();
  }

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);
  return runTracker(workDir, eventsFile, debugMode);
}
