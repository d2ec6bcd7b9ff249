#ifndef BT_TRACKER_UTILITIES_H
#define BT_TRACKER_UTILITIES_H

#include "ErrorCodes.h"
#include "ResultOrError.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace bt {

// Error type shared by the tracker components
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time in seconds since the epoch
 */
int64_t getCurrentTime();

/**
 * Load and parse a JSON file
 * @param configPath Path to the JSON file
 */
Roe<nlohmann::json> loadJsonFile(const std::string &configPath);

/**
 * Parse a JSON document held in memory
 */
Roe<nlohmann::json> parseJson(const std::string &text);

/**
 * Encode binary data as hex string
 * @return Lowercase hex string (two chars per byte)
 */
std::string hexEncode(const std::string &data);

/**
 * Decode hex string back to binary
 * @param hex Hex string (even length, 0-9a-fA-F), optional "0x" prefix
 * @return Decoded bytes, or empty string if input is invalid
 */
std::string hexDecode(const std::string &hex);

/**
 * Fill a buffer with cryptographically secure random bytes (libsodium)
 */
std::string randomBytes(size_t size);

/**
 * Overwrite a buffer holding secret material
 */
void secureZero(std::string &data);

/**
 * Write a string to a non-existent file
 * Creates parent directories if needed. Fails if the file already exists.
 */
Roe<void> writeToNewFile(const std::string &filePath, const std::string &content);

/**
 * Replace a file's content atomically: write to "<path>.tmp", then rename.
 * A crash leaves either the old or the new content, never a mix.
 */
Roe<void> writeFileAtomic(const std::string &filePath, const std::string &content);

/**
 * Read a whole file into memory
 */
Roe<std::string> readFile(const std::string &filePath);

} // namespace utl
} // namespace bt

#endif // BT_TRACKER_UTILITIES_H
