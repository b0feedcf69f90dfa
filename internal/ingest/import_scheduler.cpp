#include "import_scheduler.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace backupmon::ingest {

using observability::IntField;
using observability::StringField;

namespace {

std::chrono::seconds ClampInterval(std::chrono::seconds interval) {
  if (interval < kMinImportInterval) {
    BACKUPMON_LOG_WARN("Import interval below minimum, clamping",
                       {IntField("requested_seconds", interval.count()), IntField("minimum_seconds", kMinImportInterval.count())});
    return kMinImportInterval;
  }
  return interval;
}

} // namespace

ImportScheduler::ImportScheduler(Pass pass, std::chrono::seconds interval) : pass_(std::move(pass)), interval_(ClampInterval(interval)) {
  if (!pass_) throw std::invalid_argument("import scheduler requires a pass");
}

ImportScheduler::~ImportScheduler() {
  Stop();
}

void ImportScheduler::Start() {
  {
    std::scoped_lock lock(mutex_);
    if (running_) return;
    running_ = true;
  }
  BACKUPMON_LOG_INFO("Import scheduler started", {IntField("interval_seconds", interval_.count())});
  thread_ = std::thread(&ImportScheduler::Run, this);
}

void ImportScheduler::Stop() {
  {
    std::scoped_lock lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    BACKUPMON_LOG_INFO("Import scheduler stopped", {IntField("passes", static_cast<std::int64_t>(passes_.load()))});
  }
}

void ImportScheduler::RequestImport() {
  {
    std::scoped_lock lock(mutex_);
    requested_ = true;
  }
  cv_.notify_all();
}

void ImportScheduler::Run() {
  RunOnce();

  std::unique_lock lock(mutex_);
  while (running_) {
    cv_.wait_for(lock, interval_, [this] { return !running_ || requested_; });
    if (!running_) break;
    requested_ = false;

    lock.unlock();
    RunOnce();
    lock.lock();
  }
}

void ImportScheduler::RunOnce() {
  try {
    pass_();
  } catch (const std::exception& e) {
    ++failures_;
    BACKUPMON_LOG_ERROR("Import pass failed", {StringField("error", e.what())});
  } catch (...) {
    ++failures_;
    BACKUPMON_LOG_ERROR("Import pass failed", {StringField("error", "non-standard exception")});
  }
  ++passes_;
}

} // namespace backupmon::ingest
