#pragma once

#include "FileStore.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bt {

/**
 * KeyValueStore - one persistent keyspace of binary keys and values.
 *
 * Every write is appended to a FileStore log as one record holding a batch
 * of PUT/ERASE entries, so a batch is applied completely or not at all. The
 * log is replayed into an ordered map on open. compact() rewrites the live
 * entries into a fresh log and swaps it in with an atomic rename.
 *
 * Reads and writes take a short internal lock, readers on other threads
 * never observe half of a batch.
 */
class KeyValueStore : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_NOT_FOUND = 1;
  constexpr static int32_t E_IO = 2;
  constexpr static int32_t E_FORMAT = 3;
  constexpr static int32_t E_NOT_OPEN = 4;

  // One entry of a write batch; an empty optional erases the key
  struct Mutation {
    std::string key;
    std::optional<std::string> value;
  };

  explicit KeyValueStore(const std::string &name);
  ~KeyValueStore() override = default;

  /**
   * Open (or create) the keyspace log and replay it into memory
   */
  Roe<void> open(const std::string &filepath);

  void close();

  Roe<void> put(const std::string &key, const std::string &value);
  Roe<void> erase(const std::string &key);

  /**
   * Apply several mutations as one durable record
   */
  Roe<void> writeBatch(const std::vector<Mutation> &batch);

  Roe<std::string> get(const std::string &key) const;
  bool contains(const std::string &key) const;

  /**
   * All entries whose key starts with prefix, in key order
   */
  std::vector<std::pair<std::string, std::string>>
  scanPrefix(const std::string &prefix) const;

  /**
   * Visit every entry in key order under the read lock
   */
  void forEach(
      const std::function<void(const std::string &, const std::string &)> &fn) const;

  size_t size() const;

  /**
   * Rewrite the log so it holds only the live entries
   */
  Roe<void> compact();

  uint64_t getLogRecordCount() const;

private:
  // Log records accumulate this many times the live entry count before an
  // automatic compaction
  constexpr static uint64_t COMPACT_FACTOR = 4;
  constexpr static uint64_t COMPACT_MIN_RECORDS = 4096;

  struct LogEntry {
    constexpr static uint8_t OP_PUT = 1;
    constexpr static uint8_t OP_ERASE = 2;

    uint8_t op{ OP_PUT };
    std::string key;
    std::string value;

    template <typename Archive> void serialize(Archive &ar) {
      ar & op & key & value;
    }
  };

  Roe<void> replay();
  Roe<void> compactLocked();
  void applyLocked(const std::vector<Mutation> &batch);

  std::string filepath_;
  FileStore records_;
  std::map<std::string, std::string> entries_;
  bool isOpen_{ false };
  mutable std::mutex mutex_;
};

} // namespace bt
