#ifndef BT_TRACKER_TRACKER_STATE_MANAGER_H
#define BT_TRACKER_TRACKER_STATE_MANAGER_H

#include "IouNote.h"
#include "../lib/Module.h"
#include "../lib/Utilities.h"
#include "../store/KeyValueStore.h"
#include "../tree/CommitmentTree.h"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace bt {

/**
 * What the tracker publishes on chain
 */
struct TrackerState {
  std::string commitmentRoot; // 33-byte tree digest
  uint64_t lastCommitHeight{ 0 };
  uint64_t lastUpdateTimestamp{ 0 };

  template <typename Archive> void serialize(Archive &ar) {
    ar & commitmentRoot & lastCommitHeight & lastUpdateTimestamp;
  }
};

/**
 * TrackerStateManager - owner of the note store, the commitment tree and
 * the tracker state.
 *
 * A note write goes to the tree first (which logs it) and then to the note
 * store; if the store write fails the tree is rolled back, so the two never
 * disagree. On open, tree entries missing from the store are restored from
 * the tree, and store entries unknown to the tree fail the open with
 * E_STATE_INCONSISTENT.
 */
class TrackerStateManager : public Module {
public:
  struct Config {
    std::string workDir;
    int64_t maxClockSkewSeconds{ 300 };
    uint64_t checkpointInterval{ 1000 };
  };

  constexpr static const char *NOTES_FILE = "notes.kv";
  constexpr static const char *STATE_FILE = "state.dat";
  constexpr static const char *TREE_DIR = "tree";

  TrackerStateManager();
  ~TrackerStateManager() override = default;

  Roe<void> open(const Config &config);
  void close();

  /**
   * Accept a note signed by issuerPubkey. An existing note for the same
   * pair is replaced only by a strictly newer timestamp and a collected
   * amount that does not shrink; the tracker's redeemed amount is kept.
   * A submitted note with a non-zero redeemed amount is E_INVALID_NOTE.
   */
  Roe<void> addNote(const std::string &issuerPubkey, const IouNote &note);

  Roe<IouNote> lookupNote(const std::string &issuerPubkey,
                          const std::string &recipientPubkey) const;
  Roe<std::vector<NoteRecord>> getIssuerNotes(const std::string &issuerPubkey) const;
  Roe<std::vector<NoteRecord>> getRecipientNotes(const std::string &recipientPubkey) const;
  Roe<std::vector<NoteRecord>> getAllNotes() const;

  TrackerState getState() const;

  /**
   * Raise amountRedeemed by amount, clamped at amountCollected.
   * Called by the redemption manager only.
   */
  Roe<IouNote> applyRedemption(const std::string &issuerPubkey,
                               const std::string &recipientPubkey, uint64_t amount);

  /**
   * Batch proof of every note mutation since the previous call
   */
  Roe<tree::BatchProof> generateProof();

  /**
   * Lookup proof for one note against the current root
   */
  Roe<tree::BatchProof> proveNote(const std::string &issuerPubkey,
                                  const std::string &recipientPubkey) const;

  /**
   * The current root was posted on chain at height
   */
  Roe<void> recordCommitment(uint64_t height);

  Roe<void> checkpoint();

  std::string rootDigest() const;

  const tree::CommitmentTree &getTree() const { return tree_; }

protected:
  KeyValueStore &noteStore() { return notes_; }

private:
  constexpr static uint32_t STATE_MAGIC = 0x42545354; // "BTST"
  constexpr static uint16_t STATE_VERSION = 1;

  struct StateFile {
    uint32_t magic{ STATE_MAGIC };
    uint16_t version{ STATE_VERSION };
    TrackerState state;

    template <typename Archive> void serialize(Archive &ar) {
      ar & magic & version & state;
    }
  };

  Roe<void> loadStateLocked();
  Roe<void> saveStateLocked();
  Roe<void> reconcileLocked();
  Roe<IouNote> lookupLocked(const std::string &key) const;
  Roe<void> writeNoteLocked(const std::string &issuerPubkey, const IouNote &note,
                            bool isNew);
  void maybeCheckpointLocked();
  Roe<std::vector<NoteRecord>> scanLocked(const std::string &prefix) const;

  Config config_;
  KeyValueStore notes_;
  tree::CommitmentTree tree_;
  TrackerState state_;
  mutable std::mutex mutex_;
};

} // namespace bt

#endif // BT_TRACKER_TRACKER_STATE_MANAGER_H
