#include "KeyValueStore.h"
#include "../lib/BinaryPack.hpp"

#include <algorithm>
#include <filesystem>

namespace bt {

KeyValueStore::KeyValueStore(const std::string &name) : Module(name) {}

KeyValueStore::Roe<void> KeyValueStore::open(const std::string &filepath) {
  std::lock_guard<std::mutex> lock(mutex_);
  filepath_ = filepath;
  entries_.clear();
  isOpen_ = false;

  // A compaction interrupted before its rename leaves only a stale copy
  std::error_code ec;
  std::filesystem::remove(filepath_ + ".compact", ec);

  auto result = records_.openOrInit(filepath_);
  if (!result) {
    return Error(E_IO, "Failed to open keyspace " + filepath_ + ": " +
                           result.error().message);
  }

  auto replayResult = replay();
  if (!replayResult) {
    return replayResult;
  }

  isOpen_ = true;
  log().debug << "Opened keyspace " << filepath_ << " with " << entries_.size()
              << " entries from " << records_.getRecordCount() << " records";
  return {};
}

void KeyValueStore::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.close();
  isOpen_ = false;
}

KeyValueStore::Roe<void> KeyValueStore::replay() {
  for (uint64_t i = 0; i < records_.getRecordCount(); ++i) {
    auto record = records_.readRecord(i);
    if (!record) {
      return Error(E_IO, "Failed to read record " + std::to_string(i) + ": " +
                             record.error().message);
    }
    auto batch = utl::binaryUnpack<std::vector<LogEntry>>(record.value());
    if (!batch) {
      return Error(E_FORMAT, "Corrupt record " + std::to_string(i) + " in " +
                                 filepath_ + ": " + batch.error().message);
    }
    for (const auto &entry : batch.value()) {
      if (entry.op == LogEntry::OP_PUT) {
        entries_[entry.key] = entry.value;
      } else if (entry.op == LogEntry::OP_ERASE) {
        entries_.erase(entry.key);
      } else {
        return Error(E_FORMAT, "Unknown operation " + std::to_string(entry.op) +
                                   " in record " + std::to_string(i));
      }
    }
  }
  return {};
}

KeyValueStore::Roe<void> KeyValueStore::put(const std::string &key,
                                            const std::string &value) {
  return writeBatch({ Mutation{ key, value } });
}

KeyValueStore::Roe<void> KeyValueStore::erase(const std::string &key) {
  return writeBatch({ Mutation{ key, std::nullopt } });
}

KeyValueStore::Roe<void>
KeyValueStore::writeBatch(const std::vector<Mutation> &batch) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!isOpen_) {
    return Error(E_NOT_OPEN, "Keyspace is not open");
  }
  if (batch.empty()) {
    return {};
  }

  std::vector<LogEntry> entries;
  entries.reserve(batch.size());
  for (const auto &mutation : batch) {
    LogEntry entry;
    entry.key = mutation.key;
    if (mutation.value) {
      entry.op = LogEntry::OP_PUT;
      entry.value = *mutation.value;
    } else {
      entry.op = LogEntry::OP_ERASE;
    }
    entries.push_back(std::move(entry));
  }

  auto result = records_.appendRecord(utl::binaryPack(entries));
  if (!result) {
    log().error << "Failed to persist batch of " << batch.size()
                << " mutations: " << result.error().message;
    return Error(E_IO, "Failed to persist batch: " + result.error().message);
  }

  // Memory only changes after the record is durable
  applyLocked(batch);

  uint64_t threshold =
      std::max<uint64_t>(COMPACT_MIN_RECORDS, COMPACT_FACTOR * entries_.size());
  if (records_.getRecordCount() > threshold) {
    auto compactResult = compactLocked();
    if (!compactResult) {
      // The batch itself is durable, only the rewrite failed
      log().warning << "Automatic compaction failed: "
                    << compactResult.error().message;
    }
  }
  return {};
}

void KeyValueStore::applyLocked(const std::vector<Mutation> &batch) {
  for (const auto &mutation : batch) {
    if (mutation.value) {
      entries_[mutation.key] = *mutation.value;
    } else {
      entries_.erase(mutation.key);
    }
  }
}

KeyValueStore::Roe<std::string> KeyValueStore::get(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return Error(E_NOT_FOUND, "Key not found");
  }
  return it->second;
}

bool KeyValueStore::contains(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.find(key) != entries_.end();
}

std::vector<std::pair<std::string, std::string>>
KeyValueStore::scanPrefix(const std::string &prefix) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::pair<std::string, std::string>> out;
  for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) {
      break;
    }
    out.emplace_back(it->first, it->second);
  }
  return out;
}

void KeyValueStore::forEach(
    const std::function<void(const std::string &, const std::string &)> &fn) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &entry : entries_) {
    fn(entry.first, entry.second);
  }
}

size_t KeyValueStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

uint64_t KeyValueStore::getLogRecordCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.getRecordCount();
}

KeyValueStore::Roe<void> KeyValueStore::compact() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!isOpen_) {
    return Error(E_NOT_OPEN, "Keyspace is not open");
  }
  return compactLocked();
}

KeyValueStore::Roe<void> KeyValueStore::compactLocked() {
  constexpr size_t ENTRIES_PER_RECORD = 1024;
  std::string compactPath = filepath_ + ".compact";

  {
    FileStore fresh;
    auto initResult = fresh.init(compactPath);
    if (!initResult) {
      return Error(E_IO, "Failed to create " + compactPath + ": " +
                             initResult.error().message);
    }

    std::vector<LogEntry> chunk;
    auto flushChunk = [&]() -> Roe<void> {
      if (chunk.empty()) {
        return {};
      }
      auto appendResult = fresh.appendRecord(utl::binaryPack(chunk));
      chunk.clear();
      if (!appendResult) {
        return Error(E_IO, "Failed to write " + compactPath + ": " +
                               appendResult.error().message);
      }
      return {};
    };

    for (const auto &entry : entries_) {
      LogEntry logEntry;
      logEntry.key = entry.first;
      logEntry.value = entry.second;
      chunk.push_back(std::move(logEntry));
      if (chunk.size() == ENTRIES_PER_RECORD) {
        auto result = flushChunk();
        if (!result) {
          return result;
        }
      }
    }
    auto result = flushChunk();
    if (!result) {
      return result;
    }
    fresh.close();
  }

  uint64_t before = records_.getRecordCount();
  records_.close();
  std::error_code ec;
  std::filesystem::rename(compactPath, filepath_, ec);
  if (ec) {
    auto remount = records_.mount(filepath_);
    if (!remount) {
      isOpen_ = false;
    }
    return Error(E_IO, "Failed to swap compacted keyspace: " + ec.message());
  }

  auto mountResult = records_.mount(filepath_);
  if (!mountResult) {
    isOpen_ = false;
    return Error(E_IO, "Failed to remount compacted keyspace: " +
                           mountResult.error().message);
  }

  log().info << "Compacted keyspace " << filepath_ << " from " << before
             << " to " << records_.getRecordCount() << " records";
  return {};
}

} // namespace bt
