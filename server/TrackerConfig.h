#ifndef BT_TRACKER_TRACKER_CONFIG_H
#define BT_TRACKER_TRACKER_CONFIG_H

#include "../lib/Utilities.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace bt {

/**
 * Tracker settings read from <work-dir>/config.json
 */
struct TrackerConfig {
  constexpr static const char *FILE_NAME = "config.json";

  uint64_t redemptionLockSeconds{ 7 * 24 * 3600 };
  double warningRatio{ 1.25 };
  double criticalRatio{ 1.0 };
  int64_t maxClockSkewSeconds{ 300 };
  uint64_t checkpointInterval{ 1000 };
  uint64_t queueCapacity{ 1024 };
  uint64_t estimatedFee{ 1000000 };
  std::string trackerPublicKey; // binary, empty when not configured
  std::string logLevel{ "info" };

  nlohmann::json ltsToJson() const;

  /**
   * Missing keys keep their defaults; present keys are type and range checked
   */
  Roe<void> ltsFromJson(const nlohmann::json &jd);

  /**
   * Load config.json from workDir, writing a default one first if absent
   */
  static Roe<TrackerConfig> loadOrCreate(const std::string &workDir);
};

} // namespace bt

#endif // BT_TRACKER_TRACKER_CONFIG_H
