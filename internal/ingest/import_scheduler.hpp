#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include "importer.hpp"

namespace backupmon::ingest {

/*
  Background worker that runs import passes.

  Executes:
      pass now, then every interval until Stop()

  A pass that throws is logged and the loop keeps going. Stop() wakes
  the wait immediately but lets an in-flight pass finish.
*/
class ImportScheduler {
 public:
  using Pass = std::function<ImportReport()>;

  ImportScheduler(Pass pass, std::chrono::seconds interval);
  ~ImportScheduler();

  ImportScheduler(const ImportScheduler&)            = delete;
  ImportScheduler& operator=(const ImportScheduler&) = delete;

  void Start();
  void Stop();

  // Wake the loop for an extra pass without waiting for the interval.
  void RequestImport();

  std::chrono::seconds Interval() const {
    return interval_;
  }

  uint64_t PassCount() const {
    return passes_.load();
  }

  uint64_t FailureCount() const {
    return failures_.load();
  }

 private:
  void Run();
  void RunOnce();

  Pass                 pass_;
  std::chrono::seconds interval_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_   = false;
  bool                    requested_ = false;

  std::atomic<uint64_t> passes_{0};
  std::atomic<uint64_t> failures_{0};
};

} // namespace backupmon::ingest
