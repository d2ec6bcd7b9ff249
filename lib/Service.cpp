#include "Service.h"

namespace bt {

Service::Service(const std::string &name) : Module(name) {}

Service::~Service() {
  if (thread_.joinable()) {
    isStopSet_ = true;
    thread_.join();
  }
}

Service::Roe<void> Service::start() {
  if (isRunning_) {
    return Error(-1, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(result.error().code, "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  isRunning_ = true;
  thread_ = std::thread(&Service::runLoop, this);

  log().info << "Service started";
  return {};
}

void Service::stop() {
  if (!isRunning_) {
    return;
  }

  log().info << "Stopping service";

  isStopSet_ = true;

  if (thread_.joinable()) {
    thread_.join();
  }
  isRunning_ = false;

  onStop();

  log().info << "Service stopped";
}

} // namespace bt
