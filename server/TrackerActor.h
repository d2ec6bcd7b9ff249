#ifndef BT_TRACKER_TRACKER_ACTOR_H
#define BT_TRACKER_TRACKER_ACTOR_H

#include "TrackerConfig.h"
#include "../ledger/RedemptionManager.h"
#include "../ledger/ReserveEvent.h"
#include "../ledger/ReserveTracker.h"
#include "../ledger/TrackerStateManager.h"
#include "../lib/Service.h"
#include "../lib/ThreadSafeQueue.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace bt {

/**
 * Commands accepted by TrackerActor. Each carries the promise its result is
 * delivered through.
 */
namespace cmd {

struct AddNote {
  using Reply = Roe<void>;
  std::string issuerPubkey;
  IouNote note;
  std::promise<Reply> reply;
};

struct GetNotesByIssuer {
  using Reply = Roe<std::vector<NoteRecord>>;
  std::string issuerPubkey;
  std::promise<Reply> reply;
};

struct GetNotesByRecipient {
  using Reply = Roe<std::vector<NoteRecord>>;
  std::string recipientPubkey;
  std::promise<Reply> reply;
};

struct GetNoteByIssuerAndRecipient {
  using Reply = Roe<IouNote>;
  std::string issuerPubkey;
  std::string recipientPubkey;
  std::promise<Reply> reply;
};

struct GetNotes {
  using Reply = Roe<std::vector<NoteRecord>>;
  std::promise<Reply> reply;
};

struct InitiateRedemption {
  using Reply = Roe<RedemptionData>;
  RedemptionRequest request;
  std::promise<Reply> reply;
};

struct CompleteRedemption {
  using Reply = Roe<IouNote>;
  std::string issuerPubkey;
  std::string recipientPubkey;
  uint64_t amount{ 0 };
  std::promise<Reply> reply;
};

struct GenerateProof {
  using Reply = Roe<tree::BatchProof>;
  std::promise<Reply> reply;
};

struct AddDebt {
  using Reply = Roe<ExtendedReserveInfo>;
  std::string boxId;
  uint64_t amount{ 0 };
  std::promise<Reply> reply;
};

struct ApplyReserveEvent {
  using Reply = Roe<void>;
  ReserveEvent event;
  std::promise<Reply> reply;
};

struct RecordCommitment {
  using Reply = Roe<void>;
  uint64_t height{ 0 };
  std::promise<Reply> reply;
};

struct Checkpoint {
  using Reply = Roe<void>;
  std::promise<Reply> reply;
};

} // namespace cmd

using Command =
    std::variant<cmd::AddNote, cmd::GetNotesByIssuer, cmd::GetNotesByRecipient,
                 cmd::GetNoteByIssuerAndRecipient, cmd::GetNotes,
                 cmd::InitiateRedemption, cmd::CompleteRedemption, cmd::GenerateProof,
                 cmd::AddDebt, cmd::ApplyReserveEvent, cmd::RecordCommitment,
                 cmd::Checkpoint>;

/**
 * TrackerActor - the single writer of the tracker.
 *
 * One service thread takes commands from a bounded FIFO queue and applies
 * them in arrival order, which fixes the order of commitment tree
 * operations. Submitting blocks while the queue is full. After shutdown()
 * every submission, and every command still queued, is answered with
 * E_ACTOR_STOPPED.
 *
 * Read-only queries that do not need ordering are served directly on the
 * caller's thread.
 */
class TrackerActor : public Service {
public:
  struct Config {
    std::string workDir;
    TrackerConfig tracker;
  };

  explicit TrackerActor(const Config &config);
  ~TrackerActor() override;

  /**
   * Close the queue, finish the command in progress and stop the thread
   */
  void shutdown();

  /**
   * Queue a command. On shutdown its reply is set to E_ACTOR_STOPPED.
   */
  void submit(Command &&command);

  std::future<cmd::AddNote::Reply> addNote(const std::string &issuerPubkey,
                                           const IouNote &note);
  std::future<cmd::GetNotesByIssuer::Reply> getNotesByIssuer(const std::string &issuerPubkey);
  std::future<cmd::GetNotesByRecipient::Reply>
  getNotesByRecipient(const std::string &recipientPubkey);
  std::future<cmd::GetNoteByIssuerAndRecipient::Reply>
  getNoteByIssuerAndRecipient(const std::string &issuerPubkey,
                              const std::string &recipientPubkey);
  std::future<cmd::GetNotes::Reply> getNotes();
  std::future<cmd::InitiateRedemption::Reply>
  initiateRedemption(const RedemptionRequest &request);
  std::future<cmd::CompleteRedemption::Reply>
  completeRedemption(const std::string &issuerPubkey, const std::string &recipientPubkey,
                     uint64_t amount);
  std::future<cmd::GenerateProof::Reply> generateProof();
  std::future<cmd::AddDebt::Reply> addDebt(const std::string &boxId, uint64_t amount);
  std::future<cmd::ApplyReserveEvent::Reply> applyReserveEvent(const ReserveEvent &event);
  std::future<cmd::RecordCommitment::Reply> recordCommitment(uint64_t height);
  std::future<cmd::Checkpoint::Reply> checkpoint();

  // Direct reads
  bt::Roe<IouNote> lookupNote(const std::string &issuerPubkey,
                              const std::string &recipientPubkey) const;
  TrackerState getState() const;
  bt::Roe<ExtendedReserveInfo> getReserve(const std::string &boxId) const;
  SystemTotals getSystemTotals() const;

  uint64_t getProcessedCount() const { return processed_; }

protected:
  Service::Roe<void> onStart() override;
  void runLoop() override;
  void onStop() override;

private:
  constexpr static std::chrono::milliseconds POLL_INTERVAL{ 100 };

  void process(Command &command);
  void drainQueue();

  void handle(cmd::AddNote &command);
  void handle(cmd::GetNotesByIssuer &command);
  void handle(cmd::GetNotesByRecipient &command);
  void handle(cmd::GetNoteByIssuerAndRecipient &command);
  void handle(cmd::GetNotes &command);
  void handle(cmd::InitiateRedemption &command);
  void handle(cmd::CompleteRedemption &command);
  void handle(cmd::GenerateProof &command);
  void handle(cmd::AddDebt &command);
  void handle(cmd::ApplyReserveEvent &command);
  void handle(cmd::RecordCommitment &command);
  void handle(cmd::Checkpoint &command);

  template <typename C> std::future<typename C::Reply> enqueue(C &&command);

  Config config_;
  ThreadSafeQueue<Command> queue_;
  TrackerStateManager state_;
  ReserveTracker reserves_;
  std::unique_ptr<RedemptionManager> redemption_;
  std::atomic<uint64_t> processed_{ 0 };
};

} // namespace bt

#endif // BT_TRACKER_TRACKER_ACTOR_H
