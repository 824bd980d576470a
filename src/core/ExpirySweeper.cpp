#include "core/ExpirySweeper.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <exception>
#include <utility>

namespace sessiondb::core {

ExpirySweeper::ExpirySweeper(std::function<int()> fnSweep, std::chrono::seconds durInterval)
    : _fnSweep(std::move(fnSweep)), _durInterval(durInterval) {
  if (!_fnSweep) {
    throw common::ConfigurationError("invalid_configuration",
                                     "Expiry sweep function must not be empty");
  }
  if (_durInterval < std::chrono::seconds(1)) {
    throw common::ConfigurationError("invalid_configuration",
                                     "Expiry sweep interval must be >= 1s");
  }
}

ExpirySweeper::~ExpirySweeper() {
  stop();
}

int ExpirySweeper::sweepNow() {
  const int iDeleted = _fnSweep();
  _lTotalDeleted.fetch_add(iDeleted);
  if (iDeleted > 0) {
    common::Logger::get()->info("Expiry sweep: deleted {} expired sessions", iDeleted);
  }
  return iDeleted;
}

void ExpirySweeper::start() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_bRunning) return;
  _bRunning = true;

  _thread = std::jthread([this](std::stop_token stToken) {
    auto spLog = common::Logger::get();

    while (!stToken.stop_requested()) {
      try {
        sweepNow();
      } catch (const std::exception& ex) {
        spLog->error("Expiry sweep failed: {}", ex.what());
      }

      const auto tpNextRun = std::chrono::steady_clock::now() + _durInterval;
      std::unique_lock<std::mutex> ulock(_mtx);
      _cv.wait_until(ulock, tpNextRun, [&stToken]() {
        return stToken.stop_requested();
      });
    }
  });
}

void ExpirySweeper::stop() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (!_bRunning) return;
    _bRunning = false;
    _thread.request_stop();
  }
  _cv.notify_all();

  if (_thread.joinable()) {
    _thread.join();
  }
}

}  // namespace sessiondb::core
