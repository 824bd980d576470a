#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace sessiondb::core {

/// Runs the expired-session sweep on a fixed interval on a background thread.
/// The first sweep runs as soon as start() is called. A sweep that throws is
/// logged and the schedule continues.
/// Class abbreviation: es
class ExpirySweeper {
 public:
  /// fnSweep deletes expired sessions and returns how many it removed,
  /// typically SessionRepository::cleanUpExpiredSessions.
  ExpirySweeper(std::function<int()> fnSweep, std::chrono::seconds durInterval);
  ~ExpirySweeper();

  ExpirySweeper(const ExpirySweeper&) = delete;
  ExpirySweeper& operator=(const ExpirySweeper&) = delete;

  void start();
  void stop();

  /// Run one sweep on the calling thread. Exceptions propagate.
  int sweepNow();

  /// Sessions removed by all completed sweeps.
  long totalDeleted() const { return _lTotalDeleted.load(); }

 private:
  std::function<int()> _fnSweep;
  std::chrono::seconds _durInterval;
  std::jthread _thread;
  std::mutex _mtx;
  std::condition_variable _cv;
  bool _bRunning = false;
  std::atomic<long> _lTotalDeleted{0};
};

}  // namespace sessiondb::core
