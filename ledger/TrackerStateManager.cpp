#include "TrackerStateManager.h"
#include "../crypto/Schnorr.h"
#include "../lib/BinaryPack.hpp"

#include <algorithm>
#include <filesystem>
#include <limits>
#include <unordered_set>

namespace bt {

TrackerStateManager::TrackerStateManager()
    : Module("tracker.state"), notes_("tracker.state.notes") {}

Roe<void> TrackerStateManager::open(const Config &config) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_ = config;

  std::error_code ec;
  std::filesystem::create_directories(config_.workDir, ec);
  if (ec) {
    return Error(E_STORAGE, "Failed to create work directory " + config_.workDir + ": " +
                                ec.message());
  }

  auto notesOpened = notes_.open(config_.workDir + "/" + NOTES_FILE);
  if (!notesOpened) {
    return Error(E_STORAGE, "Failed to open note store: " + notesOpened.error().message);
  }

  auto treeOpened = tree_.open(config_.workDir + "/" + TREE_DIR);
  if (!treeOpened) {
    return treeOpened;
  }

  auto stateLoaded = loadStateLocked();
  if (!stateLoaded) {
    return stateLoaded;
  }

  auto reconciled = reconcileLocked();
  if (!reconciled) {
    return reconciled;
  }

  // The tree is the authority for the root
  state_.commitmentRoot = tree_.rootDigest();
  auto saved = saveStateLocked();
  if (!saved) {
    return saved;
  }

  log().info << "Tracker state opened with " << notes_.size() << " notes, root "
             << utl::hexEncode(state_.commitmentRoot);
  return {};
}

void TrackerStateManager::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  tree_.close();
  notes_.close();
}

Roe<void> TrackerStateManager::loadStateLocked() {
  std::string path = config_.workDir + "/" + STATE_FILE;
  state_ = TrackerState();
  state_.commitmentRoot = tree::emptyDigest();
  if (!std::filesystem::exists(path)) {
    return {};
  }

  auto content = utl::readFile(path);
  if (!content) {
    return content.error();
  }
  auto file = utl::binaryUnpack<StateFile>(content.value());
  if (!file) {
    return Error(E_STORAGE_FORMAT, "Malformed state file: " + file.error().message);
  }
  if (file.value().magic != STATE_MAGIC || file.value().version != STATE_VERSION) {
    return Error(E_STORAGE_FORMAT, "Unsupported state file " + path);
  }
  state_ = file.value().state;
  return {};
}

Roe<void> TrackerStateManager::saveStateLocked() {
  StateFile file;
  file.state = state_;
  return utl::writeFileAtomic(config_.workDir + "/" + STATE_FILE, utl::binaryPack(file));
}

Roe<void> TrackerStateManager::reconcileLocked() {
  auto entries = tree_.entries();
  if (!entries) {
    return entries.error();
  }

  std::unordered_set<std::string> treeKeys;
  std::vector<KeyValueStore::Mutation> repairs;
  for (const auto &entry : entries.value()) {
    treeKeys.insert(entry.first);
    auto stored = notes_.get(entry.first);
    if (stored && stored.value() == entry.second) {
      continue;
    }
    // Crash between the tree log append and the store write
    auto record = NoteRecord::decode(entry.second);
    if (!record) {
      return Error(E_STATE_INCONSISTENT, "Tree holds an undecodable note: " +
                                             record.error().message);
    }
    log().warning << "Restoring note " << utl::hexEncode(entry.first.substr(0, 8))
                  << " from the commitment tree";
    repairs.push_back({ entry.first, entry.second });
  }

  size_t orphans = 0;
  notes_.forEach([&](const std::string &key, const std::string &) {
    if (treeKeys.count(key) == 0) {
      ++orphans;
    }
  });
  if (orphans > 0) {
    log().critical << orphans << " stored notes are absent from the commitment tree";
    return Error(E_STATE_INCONSISTENT, std::to_string(orphans) +
                                           " stored notes are absent from the commitment tree");
  }

  if (!repairs.empty()) {
    auto written = notes_.writeBatch(repairs);
    if (!written) {
      return Error(E_STORAGE, "Failed to restore notes: " + written.error().message);
    }
  }
  return {};
}

Roe<IouNote> TrackerStateManager::lookupLocked(const std::string &key) const {
  auto stored = notes_.get(key);
  if (!stored) {
    if (stored.error().code == KeyValueStore::E_NOT_FOUND) {
      return Error(E_NOTE_NOT_FOUND, "Note not found");
    }
    return Error(E_STORAGE, stored.error().message);
  }
  auto record = NoteRecord::decode(stored.value());
  if (!record) {
    return Error(E_STORAGE_FORMAT, "Corrupt note record: " + record.error().message);
  }
  return record.value().note;
}

Roe<void> TrackerStateManager::addNote(const std::string &issuerPubkey,
                                       const IouNote &note) {
  auto keyCheck = crypto::validatePublicKey(issuerPubkey);
  if (!keyCheck) {
    return keyCheck;
  }
  auto signatureCheck = note.verifySignature(issuerPubkey);
  if (!signatureCheck) {
    log().debug << "Rejected note: " << signatureCheck.error().message;
    return signatureCheck;
  }
  // amountRedeemed is not signed, only completed redemptions may raise it
  if (note.amountRedeemed != 0) {
    return Error(E_INVALID_NOTE, "Submitted note must not carry a redeemed amount");
  }
  int64_t now = utl::getCurrentTime();
  if (note.timestamp > static_cast<uint64_t>(now + config_.maxClockSkewSeconds)) {
    return Error(E_FUTURE_TIMESTAMP, "Note timestamp " + std::to_string(note.timestamp) +
                                         " is ahead of tracker time " +
                                         std::to_string(now));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::string key = noteKey(issuerPubkey, note.recipientPubkey);
  auto existing = lookupLocked(key);
  if (!existing && existing.error().code != E_NOTE_NOT_FOUND) {
    return existing.error();
  }

  if (!existing) {
    return writeNoteLocked(issuerPubkey, note, true);
  }

  const IouNote &current = existing.value();
  if (note.timestamp <= current.timestamp) {
    return Error(E_DUPLICATE_NONCE, "Note timestamp " + std::to_string(note.timestamp) +
                                        " is not newer than " +
                                        std::to_string(current.timestamp));
  }
  if (note.amountCollected < current.amountCollected) {
    return Error(E_AMOUNT_DECREASE, "Collected amount may not decrease from " +
                                        std::to_string(current.amountCollected));
  }
  IouNote replacement = note;
  replacement.amountRedeemed = current.amountRedeemed;
  return writeNoteLocked(issuerPubkey, replacement, false);
}

Roe<void> TrackerStateManager::writeNoteLocked(const std::string &issuerPubkey,
                                               const IouNote &note, bool isNew) {
  std::string key = noteKey(issuerPubkey, note.recipientPubkey);
  std::string value = note.encode(issuerPubkey);

  auto point = tree_.savepoint();
  auto treeResult = isNew ? tree_.insert(key, value) : tree_.update(key, value);
  if (!treeResult) {
    if (treeResult.error().code == E_TREE_CORRUPTION) {
      log().critical << "Commitment tree halted: " << treeResult.error().message;
    }
    return treeResult;
  }

  auto stored = notes_.put(key, value);
  if (!stored) {
    log().error << "Note store write failed: " << stored.error().message;
    auto rolledBack = tree_.rollback(point);
    if (!rolledBack) {
      log().critical << "Tree rollback failed: " << rolledBack.error().message;
    }
    return Error(E_STORAGE, "Failed to persist note: " + stored.error().message);
  }

  state_.commitmentRoot = tree_.rootDigest();
  state_.lastUpdateTimestamp = static_cast<uint64_t>(utl::getCurrentTime());
  auto saved = saveStateLocked();
  if (!saved) {
    // The state is rebuilt from the tree on open
    log().warning << "Failed to persist tracker state: " << saved.error().message;
  }

  log().debug << (isNew ? "Added" : "Updated") << " note "
              << utl::hexEncode(key.substr(0, 8)) << " collected "
              << note.amountCollected << " redeemed " << note.amountRedeemed;

  maybeCheckpointLocked();
  return {};
}

void TrackerStateManager::maybeCheckpointLocked() {
  if (config_.checkpointInterval == 0 ||
      tree_.operationsSinceCheckpoint() < config_.checkpointInterval) {
    return;
  }
  auto result = tree_.checkpoint();
  if (!result) {
    log().warning << "Automatic checkpoint failed: " << result.error().message;
  }
}

Roe<IouNote> TrackerStateManager::lookupNote(const std::string &issuerPubkey,
                                             const std::string &recipientPubkey) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lookupLocked(noteKey(issuerPubkey, recipientPubkey));
}

Roe<std::vector<NoteRecord>>
TrackerStateManager::scanLocked(const std::string &prefix) const {
  std::vector<NoteRecord> result;
  for (const auto &entry : notes_.scanPrefix(prefix)) {
    auto record = NoteRecord::decode(entry.second);
    if (!record) {
      return Error(E_STORAGE_FORMAT, "Corrupt note record: " + record.error().message);
    }
    result.push_back(record.value());
  }
  return result;
}

Roe<std::vector<NoteRecord>>
TrackerStateManager::getIssuerNotes(const std::string &issuerPubkey) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return scanLocked(issuerKeyPrefix(issuerPubkey));
}

Roe<std::vector<NoteRecord>>
TrackerStateManager::getRecipientNotes(const std::string &recipientPubkey) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto all = scanLocked("");
  if (!all) {
    return all;
  }
  std::vector<NoteRecord> result;
  for (auto &record : all.value()) {
    if (record.note.recipientPubkey == recipientPubkey) {
      result.push_back(std::move(record));
    }
  }
  return result;
}

Roe<std::vector<NoteRecord>> TrackerStateManager::getAllNotes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return scanLocked("");
}

TrackerState TrackerStateManager::getState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::string TrackerStateManager::rootDigest() const { return tree_.rootDigest(); }

Roe<IouNote> TrackerStateManager::applyRedemption(const std::string &issuerPubkey,
                                                  const std::string &recipientPubkey,
                                                  uint64_t amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto existing = lookupLocked(noteKey(issuerPubkey, recipientPubkey));
  if (!existing) {
    return existing;
  }

  IouNote note = existing.value();
  if (amount > std::numeric_limits<uint64_t>::max() - note.amountRedeemed) {
    return Error(E_AMOUNT_OVERFLOW, "Redeemed amount would overflow");
  }
  note.amountRedeemed = std::min(note.amountRedeemed + amount, note.amountCollected);

  auto written = writeNoteLocked(issuerPubkey, note, false);
  if (!written) {
    return written.error();
  }
  return note;
}

Roe<tree::BatchProof> TrackerStateManager::generateProof() {
  std::lock_guard<std::mutex> lock(mutex_);
  return tree_.generateProof();
}

Roe<tree::BatchProof> TrackerStateManager::proveNote(const std::string &issuerPubkey,
                                                     const std::string &recipientPubkey) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tree_.proveLookup(noteKey(issuerPubkey, recipientPubkey));
}

Roe<void> TrackerStateManager::recordCommitment(uint64_t height) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (height < state_.lastCommitHeight) {
    return Error(E_INVALID_COMMITMENT_HEIGHT, "Commitment height " + std::to_string(height) +
                                     " is below the last recorded " +
                                     std::to_string(state_.lastCommitHeight));
  }
  state_.lastCommitHeight = height;
  state_.lastUpdateTimestamp = static_cast<uint64_t>(utl::getCurrentTime());
  auto saved = saveStateLocked();
  if (!saved) {
    return saved;
  }
  log().info << "Commitment recorded at height " << height;
  return {};
}

Roe<void> TrackerStateManager::checkpoint() {
  std::lock_guard<std::mutex> lock(mutex_);
  return tree_.checkpoint();
}

} // namespace bt
