#include "TrackerActor.h"

#include <type_traits>

namespace bt {

TrackerActor::TrackerActor(const Config &config)
    : Service("tracker.actor"), config_(config),
      queue_(static_cast<size_t>(config.tracker.queueCapacity)) {}

TrackerActor::~TrackerActor() { shutdown(); }

Service::Roe<void> TrackerActor::onStart() {
  TrackerStateManager::Config stateConfig;
  stateConfig.workDir = config_.workDir;
  stateConfig.maxClockSkewSeconds = config_.tracker.maxClockSkewSeconds;
  stateConfig.checkpointInterval = config_.tracker.checkpointInterval;
  auto stateOpened = state_.open(stateConfig);
  if (!stateOpened) {
    return Service::Error(stateOpened.error().code,
                          "Failed to open tracker state: " + stateOpened.error().message);
  }

  ReserveTracker::Config reserveConfig;
  reserveConfig.warningRatio = config_.tracker.warningRatio;
  reserveConfig.criticalRatio = config_.tracker.criticalRatio;
  auto reservesOpened =
      reserves_.open(config_.workDir + "/" + ReserveTracker::RESERVES_FILE, reserveConfig);
  if (!reservesOpened) {
    return Service::Error(reservesOpened.error().code,
                          "Failed to open reserves: " + reservesOpened.error().message);
  }

  RedemptionManager::Config redemptionConfig;
  redemptionConfig.redemptionLockSeconds = config_.tracker.redemptionLockSeconds;
  redemptionConfig.estimatedFee = config_.tracker.estimatedFee;
  redemptionConfig.trackerPublicKey = config_.tracker.trackerPublicKey;
  redemption_ = std::make_unique<RedemptionManager>(state_, reserves_, redemptionConfig);

  log().info << "Tracker actor ready, queue capacity " << queue_.capacity();
  return {};
}

void TrackerActor::onStop() {
  state_.close();
  reserves_.close();
}

void TrackerActor::shutdown() {
  queue_.close();
  stop();
  // Covers commands queued while the thread was never started
  drainQueue();
}

void TrackerActor::runLoop() {
  log().debug << "Command loop started";
  while (!isStopSet()) {
    Command command;
    if (queue_.pollFor(command, POLL_INTERVAL)) {
      process(command);
    }
  }
  drainQueue();
  log().debug << "Command loop finished after " << processed_ << " commands";
}

void TrackerActor::drainQueue() {
  Command command;
  size_t rejected = 0;
  while (queue_.poll(command)) {
    std::visit(
        [](auto &c) {
          using Reply = typename std::decay_t<decltype(c)>::Reply;
          c.reply.set_value(Reply(bt::Error(E_ACTOR_STOPPED, "Tracker is shutting down")));
        },
        command);
    ++rejected;
  }
  if (rejected > 0) {
    log().info << "Rejected " << rejected << " queued commands on shutdown";
  }
}

void TrackerActor::submit(Command &&command) {
  if (!queue_.push(std::move(command))) {
    // push leaves the command intact when the queue is closed
    std::visit(
        [](auto &c) {
          using Reply = typename std::decay_t<decltype(c)>::Reply;
          c.reply.set_value(Reply(bt::Error(E_ACTOR_STOPPED, "Tracker is stopped")));
        },
        command);
  }
}

template <typename C> std::future<typename C::Reply> TrackerActor::enqueue(C &&command) {
  auto future = command.reply.get_future();
  submit(Command(std::move(command)));
  return future;
}

void TrackerActor::process(Command &command) {
  std::visit([this](auto &c) { handle(c); }, command);
  ++processed_;
}

// Submission helpers

std::future<cmd::AddNote::Reply> TrackerActor::addNote(const std::string &issuerPubkey,
                                                       const IouNote &note) {
  cmd::AddNote command;
  command.issuerPubkey = issuerPubkey;
  command.note = note;
  return enqueue(std::move(command));
}

std::future<cmd::GetNotesByIssuer::Reply>
TrackerActor::getNotesByIssuer(const std::string &issuerPubkey) {
  cmd::GetNotesByIssuer command;
  command.issuerPubkey = issuerPubkey;
  return enqueue(std::move(command));
}

std::future<cmd::GetNotesByRecipient::Reply>
TrackerActor::getNotesByRecipient(const std::string &recipientPubkey) {
  cmd::GetNotesByRecipient command;
  command.recipientPubkey = recipientPubkey;
  return enqueue(std::move(command));
}

std::future<cmd::GetNoteByIssuerAndRecipient::Reply>
TrackerActor::getNoteByIssuerAndRecipient(const std::string &issuerPubkey,
                                          const std::string &recipientPubkey) {
  cmd::GetNoteByIssuerAndRecipient command;
  command.issuerPubkey = issuerPubkey;
  command.recipientPubkey = recipientPubkey;
  return enqueue(std::move(command));
}

std::future<cmd::GetNotes::Reply> TrackerActor::getNotes() {
  return enqueue(cmd::GetNotes());
}

std::future<cmd::InitiateRedemption::Reply>
TrackerActor::initiateRedemption(const RedemptionRequest &request) {
  cmd::InitiateRedemption command;
  command.request = request;
  return enqueue(std::move(command));
}

std::future<cmd::CompleteRedemption::Reply>
TrackerActor::completeRedemption(const std::string &issuerPubkey,
                                 const std::string &recipientPubkey, uint64_t amount) {
  cmd::CompleteRedemption command;
  command.issuerPubkey = issuerPubkey;
  command.recipientPubkey = recipientPubkey;
  command.amount = amount;
  return enqueue(std::move(command));
}

std::future<cmd::GenerateProof::Reply> TrackerActor::generateProof() {
  return enqueue(cmd::GenerateProof());
}

std::future<cmd::AddDebt::Reply> TrackerActor::addDebt(const std::string &boxId,
                                                       uint64_t amount) {
  cmd::AddDebt command;
  command.boxId = boxId;
  command.amount = amount;
  return enqueue(std::move(command));
}

std::future<cmd::ApplyReserveEvent::Reply>
TrackerActor::applyReserveEvent(const ReserveEvent &event) {
  cmd::ApplyReserveEvent command;
  command.event = event;
  return enqueue(std::move(command));
}

std::future<cmd::RecordCommitment::Reply> TrackerActor::recordCommitment(uint64_t height) {
  cmd::RecordCommitment command;
  command.height = height;
  return enqueue(std::move(command));
}

std::future<cmd::Checkpoint::Reply> TrackerActor::checkpoint() {
  return enqueue(cmd::Checkpoint());
}

// Handlers, run on the actor thread only

void TrackerActor::handle(cmd::AddNote &command) {
  auto result = state_.addNote(command.issuerPubkey, command.note);
  if (!result && isFatal(result.error().code)) {
    log().critical << "Note rejected by halted tree: " << result.error().message;
  }
  command.reply.set_value(std::move(result));
}

void TrackerActor::handle(cmd::GetNotesByIssuer &command) {
  command.reply.set_value(state_.getIssuerNotes(command.issuerPubkey));
}

void TrackerActor::handle(cmd::GetNotesByRecipient &command) {
  command.reply.set_value(state_.getRecipientNotes(command.recipientPubkey));
}

void TrackerActor::handle(cmd::GetNoteByIssuerAndRecipient &command) {
  command.reply.set_value(state_.lookupNote(command.issuerPubkey, command.recipientPubkey));
}

void TrackerActor::handle(cmd::GetNotes &command) {
  command.reply.set_value(state_.getAllNotes());
}

void TrackerActor::handle(cmd::InitiateRedemption &command) {
  auto result = redemption_->initiateRedemption(command.request);
  if (!result) {
    if (isRetryable(result.error().code)) {
      log().debug << "Redemption deferred: " << result.error().message;
    } else {
      log().warning << "Redemption refused: " << result.error().message;
    }
  }
  command.reply.set_value(std::move(result));
}

void TrackerActor::handle(cmd::CompleteRedemption &command) {
  command.reply.set_value(redemption_->completeRedemption(
      command.issuerPubkey, command.recipientPubkey, command.amount));
}

void TrackerActor::handle(cmd::GenerateProof &command) {
  command.reply.set_value(state_.generateProof());
}

void TrackerActor::handle(cmd::AddDebt &command) {
  command.reply.set_value(reserves_.addDebt(command.boxId, command.amount));
}

void TrackerActor::handle(cmd::ApplyReserveEvent &command) {
  auto result = reserves_.applyEvent(command.event);
  if (!result) {
    log().warning << "Reserve event for " << reserveEventBoxId(command.event)
                  << " rejected: " << result.error().message;
  }
  command.reply.set_value(std::move(result));
}

void TrackerActor::handle(cmd::RecordCommitment &command) {
  command.reply.set_value(state_.recordCommitment(command.height));
}

void TrackerActor::handle(cmd::Checkpoint &command) {
  command.reply.set_value(state_.checkpoint());
}

// Direct reads

bt::Roe<IouNote> TrackerActor::lookupNote(const std::string &issuerPubkey,
                                          const std::string &recipientPubkey) const {
  return state_.lookupNote(issuerPubkey, recipientPubkey);
}

TrackerState TrackerActor::getState() const { return state_.getState(); }

bt::Roe<ExtendedReserveInfo> TrackerActor::getReserve(const std::string &boxId) const {
  return reserves_.getReserve(boxId);
}

SystemTotals TrackerActor::getSystemTotals() const { return reserves_.getSystemTotals(); }

} // namespace bt
