#pragma once

#include "Module.h"
#include "ResultOrError.hpp"
#include <atomic>
#include <thread>

namespace bt {

/**
 * Service - Base class for components that run in a dedicated thread.
 *
 * Provides thread lifecycle management with start/stop functionality.
 * Derived classes implement runLoop(), which executes in the service thread.
 */
class Service : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  explicit Service(const std::string &name);

  /**
   * Derived classes must call stop() in their own destructor, the thread
   * must not outlive the members runLoop() touches.
   */
  ~Service() override;

  bool isStopSet() const { return isStopSet_; }
  bool isRunning() const { return isRunning_; }

  Roe<void> start();
  void stop();

protected:
  /**
   * Main service loop - implement in derived classes.
   * Should check !isStopSet() periodically to allow graceful shutdown.
   */
  virtual void runLoop() = 0;

  /**
   * Called before the thread starts (in the calling thread context).
   */
  virtual Roe<void> onStart() { return {}; }

  /**
   * Called after the thread has stopped (in the calling thread context).
   */
  virtual void onStop() {}

private:
  std::atomic<bool> isStopSet_{ true };
  std::atomic<bool> isRunning_{ false };
  std::thread thread_;
};

} // namespace bt
