#include "TrackerConfig.h"
#include "../crypto/Schnorr.h"
#include "../lib/Logger.h"

#include <filesystem>

namespace bt {

nlohmann::json TrackerConfig::ltsToJson() const {
  nlohmann::json jd;
  jd["redemptionLockSeconds"] = redemptionLockSeconds;
  jd["warningRatio"] = warningRatio;
  jd["criticalRatio"] = criticalRatio;
  jd["maxClockSkewSeconds"] = maxClockSkewSeconds;
  jd["checkpointInterval"] = checkpointInterval;
  jd["queueCapacity"] = queueCapacity;
  jd["estimatedFee"] = estimatedFee;
  jd["trackerPublicKey"] = utl::hexEncode(trackerPublicKey);
  jd["logLevel"] = logLevel;
  return jd;
}

Roe<void> TrackerConfig::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_CONFIG, "Configuration must be a JSON object");
  }

  try {
    redemptionLockSeconds = jd.value("redemptionLockSeconds", redemptionLockSeconds);
    warningRatio = jd.value("warningRatio", warningRatio);
    criticalRatio = jd.value("criticalRatio", criticalRatio);
    maxClockSkewSeconds = jd.value("maxClockSkewSeconds", maxClockSkewSeconds);
    checkpointInterval = jd.value("checkpointInterval", checkpointInterval);
    queueCapacity = jd.value("queueCapacity", queueCapacity);
    estimatedFee = jd.value("estimatedFee", estimatedFee);
    logLevel = jd.value("logLevel", logLevel);

    std::string keyHex = jd.value("trackerPublicKey", std::string());
    if (keyHex.empty()) {
      trackerPublicKey.clear();
    } else {
      auto key = crypto::publicKeyFromHex(keyHex);
      if (!key) {
        return Error(E_CONFIG, "Invalid trackerPublicKey: " + key.error().message);
      }
      trackerPublicKey = key.value();
    }
  } catch (const nlohmann::json::exception &e) {
    return Error(E_CONFIG, std::string("Invalid configuration value: ") + e.what());
  }

  if (criticalRatio <= 0 || warningRatio < criticalRatio) {
    return Error(E_CONFIG, "Ratios must satisfy 0 < criticalRatio <= warningRatio");
  }
  if (maxClockSkewSeconds < 0) {
    return Error(E_CONFIG, "maxClockSkewSeconds must not be negative");
  }
  if (queueCapacity == 0) {
    return Error(E_CONFIG, "queueCapacity must be positive");
  }
  logging::Level level;
  if (!logging::parseLevel(logLevel, level)) {
    return Error(E_CONFIG, "Unknown logLevel: " + logLevel);
  }
  return {};
}

Roe<TrackerConfig> TrackerConfig::loadOrCreate(const std::string &workDir) {
  auto logger = logging::getLogger("tracker.config");
  std::filesystem::path configPath = std::filesystem::path(workDir) / FILE_NAME;

  if (!std::filesystem::exists(configPath)) {
    logger.info << "No " << FILE_NAME << " found, creating with default values";
    std::error_code ec;
    std::filesystem::create_directories(workDir, ec);
    if (ec) {
      return Error(E_CONFIG, "Failed to create work directory " + workDir + ": " +
                                 ec.message());
    }
    TrackerConfig defaults;
    auto written = utl::writeToNewFile(configPath.string(), defaults.ltsToJson().dump(2) + "\n");
    if (!written) {
      return Error(E_CONFIG, "Failed to create " + configPath.string() + ": " +
                                 written.error().message);
    }
    logger.info << "Created " << configPath.string();
  }

  auto jd = utl::loadJsonFile(configPath.string());
  if (!jd) {
    return jd.error();
  }
  TrackerConfig config;
  auto parsed = config.ltsFromJson(jd.value());
  if (!parsed) {
    return parsed.error();
  }
  return config;
}

} // namespace bt
