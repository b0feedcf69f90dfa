#include "internal/ingest/import_scheduler.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

using backupmon::ingest::ImportReport;
using backupmon::ingest::ImportScheduler;

bool WaitForPasses(const ImportScheduler& scheduler, uint64_t passes) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (scheduler.PassCount() < passes) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

void TestIntervalBelowFloorIsClamped() {
  auto noop = [] { return ImportReport{}; };

  assert(ImportScheduler(noop, std::chrono::seconds(5)).Interval() == std::chrono::seconds(60));
  assert(ImportScheduler(noop, std::chrono::seconds(0)).Interval() == std::chrono::seconds(60));
  assert(ImportScheduler(noop, std::chrono::hours(12)).Interval() == std::chrono::hours(12));
}

void TestRunsImmediatelyOnStart() {
  std::atomic<int> calls{0};
  ImportScheduler  scheduler(
      [&] {
        ++calls;
        return ImportReport{};
      },
      std::chrono::hours(1));

  scheduler.Start();
  assert(WaitForPasses(scheduler, 1));
  scheduler.Stop();
  assert(calls.load() == 1);
}

void TestFailingPassDoesNotStopTheLoop() {
  std::atomic<int> calls{0};
  ImportScheduler  scheduler(
      [&] {
        if (++calls == 1) throw std::runtime_error("database is locked");
        return ImportReport{};
      },
      std::chrono::hours(1));

  scheduler.Start();
  assert(WaitForPasses(scheduler, 1));
  assert(scheduler.FailureCount() == 1);

  scheduler.RequestImport();
  assert(WaitForPasses(scheduler, 2));
  scheduler.RequestImport();
  assert(WaitForPasses(scheduler, 3));
  scheduler.Stop();

  assert(calls.load() == 3);
  assert(scheduler.FailureCount() == 1);
}

void TestNonStandardThrowIsCountedAsFailure() {
  std::atomic<int> calls{0};
  ImportScheduler  scheduler(
      [&]() -> ImportReport {
        if (++calls == 1) throw 42;
        return ImportReport{};
      },
      std::chrono::hours(1));

  scheduler.Start();
  assert(WaitForPasses(scheduler, 1));
  assert(scheduler.FailureCount() == 1);

  scheduler.RequestImport();
  assert(WaitForPasses(scheduler, 2));
  scheduler.Stop();

  assert(calls.load() == 2);
  assert(scheduler.FailureCount() == 1);
}

void TestStopCancelsTheWait() {
  ImportScheduler scheduler([] { return ImportReport{}; }, std::chrono::hours(12));
  scheduler.Start();
  assert(WaitForPasses(scheduler, 1));

  const auto start = std::chrono::steady_clock::now();
  scheduler.Stop();
  assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
  assert(scheduler.PassCount() == 1);
}

} // namespace

int main() {
  TestIntervalBelowFloorIsClamped();
  TestRunsImmediatelyOnStart();
  TestFailingPassDoesNotStopTheLoop();
  TestNonStandardThrowIsCountedAsFailure();
  TestStopCancelsTheWait();

  std::cout << "backupmon_unit_import_scheduler: pass\n";
  return 0;
}
