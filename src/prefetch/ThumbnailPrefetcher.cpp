// Repository: Retrovue-streamcache
// Component: Thumbnail Prefetcher Implementation
// Copyright (c) 2025 RetroVue

#include "streamcache/prefetch/ThumbnailPrefetcher.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "streamcache/util/Logger.hpp"

namespace streamcache::prefetch {

using streamcache::util::Logger;
using transport::TransportStatus;

ThumbnailPrefetcher::ThumbnailPrefetcher(transport::ITransportClient* transport,
                                         resolver::RemoteIdentityResolver* resolver,
                                         scheduler::ConcurrencyScheduler* scheduler,
                                         config::SettingsProvider* settings)
    : transport_(transport),
      resolver_(resolver),
      scheduler_(scheduler),
      settings_(settings) {
  if (transport_ == nullptr || resolver_ == nullptr || scheduler_ == nullptr ||
      settings_ == nullptr) {
    throw std::invalid_argument("ThumbnailPrefetcher: null dependency");
  }
}

ThumbnailPrefetcher::~ThumbnailPrefetcher() {
  Stop();
}

void ThumbnailPrefetcher::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (worker_thread_.joinable()) return;
  shutdown_.store(false, std::memory_order_release);
  worker_thread_ = std::thread(&ThumbnailPrefetcher::WorkerLoop, this);
}

void ThumbnailPrefetcher::Stop() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_.store(true, std::memory_order_release);
    worker = std::move(worker_thread_);
  }
  work_cv_.notify_all();
  if (worker.joinable()) {
    worker.join();
  }
}

void ThumbnailPrefetcher::Offer(const std::vector<std::string>& remote_ids) {
  size_t accepted = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& id : remote_ids) {
      if (id.empty()) continue;
      if (done_.count(id) || in_flight_.count(id) || pending_set_.count(id)) continue;
      pending_.push_back(id);
      pending_set_.insert(id);
      ++accepted;
    }
  }
  if (accepted > 0) {
    work_cv_.notify_all();
    Logger::Debug("[ThumbnailPrefetcher] OFFERED accepted=" + std::to_string(accepted) +
                  " offered=" + std::to_string(remote_ids.size()));
  }
}

void ThumbnailPrefetcher::SetBuffering(bool buffering) {
  bool changed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    changed = buffering_ != buffering;
    buffering_ = buffering;
  }
  if (changed) {
    Logger::Info(std::string("[ThumbnailPrefetcher] VIDEO_BUFFERING ") +
                 (buffering ? "ASSERTED" : "CLEARED"));
    work_cv_.notify_all();
  }
}

bool ThumbnailPrefetcher::IsBuffering() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffering_;
}

void ThumbnailPrefetcher::ClearCache() {
  std::lock_guard<std::mutex> lock(mutex_);
  done_.clear();
}

void ThumbnailPrefetcher::OnProgress(int32_t /*local_id*/) {
  progress_seq_.fetch_add(1, std::memory_order_acq_rel);
  work_cv_.notify_all();
}

PrefetchStats ThumbnailPrefetcher::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

bool ThumbnailPrefetcher::IsKnown(const std::string& remote_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return done_.count(remote_id) || in_flight_.count(remote_id) ||
         pending_set_.count(remote_id);
}

size_t ThumbnailPrefetcher::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

size_t ThumbnailPrefetcher::InFlightCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_flight_.size();
}

void ThumbnailPrefetcher::SetBatchHook(BatchHookFn hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  batch_hook_ = std::move(hook);
}

// =============================================================================
// WorkerLoop - persistent thread, one batch at a time
// =============================================================================

bool ThumbnailPrefetcher::BatchAllowedLocked(const config::StreamingSettings& s) const {
  if (!s.thumb_prefetch_enabled) return false;
  return !(buffering_ && s.thumb_pause_while_buffering);
}

void ThumbnailPrefetcher::WorkerLoop() {
  while (true) {
    std::vector<std::string> batch;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      while (!shutdown_.load(std::memory_order_acquire)) {
        const auto s = settings_->Current();
        if (!pending_.empty() && BatchAllowedLocked(s)) break;
        // Timed: settings changes (enable flag) do not notify this cv.
        work_cv_.wait_for(lock,
                          std::chrono::milliseconds(std::max<int64_t>(1, s.poll_interval_ms)));
      }
      if (shutdown_.load(std::memory_order_acquire)) break;

      const auto s = settings_->Current();
      const size_t n = std::min(pending_.size(), static_cast<size_t>(s.thumb_batch_size));
      for (size_t i = 0; i < n; ++i) {
        std::string id = std::move(pending_.front());
        pending_.pop_front();
        pending_set_.erase(id);
        in_flight_.insert(id);
        batch.push_back(std::move(id));
      }
    }
    RunBatch(std::move(batch));
  }
}

bool ThumbnailPrefetcher::PrepareItem(Item& item, const config::StreamingSettings& s,
                                      Outcome& outcome) {
  resolver::ResolveOutcome resolved = resolver_->Resolve(item.remote_id);
  if (!resolved.ok) {
    outcome = Outcome::kFailed;
    return false;
  }
  item.local_id = resolved.local_id;

  transport::FileStateResult fs = transport_->QueryLocalFileState(item.local_id);
  if (fs.status == TransportStatus::kNotFound) {
    resolver_->InvalidateIfStale(item.remote_id, item.local_id);
    outcome = Outcome::kFailed;
    return false;
  }
  if (fs.status == TransportStatus::kOk && fs.state.complete) {
    outcome = Outcome::kSkipped;
    return false;
  }

  scheduler::JobRequest req;
  req.stream_id = ThumbStreamId(item.remote_id);
  req.local_id = item.local_id;
  req.kind = DownloadKind::kThumbnail;
  req.priority = s.thumb_priority;
  req.offset = 0;
  req.required_bytes = 0;
  item.job = scheduler_->Submit(req);
  item.deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(s.thumb_item_timeout_ms);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.submitted;
  }
  return true;
}

bool ThumbnailPrefetcher::PollItem(Item& item, std::chrono::steady_clock::time_point now,
                                   Outcome& outcome) {
  const auto state = scheduler_->StateOf(item.job);
  if (!state || *state == JobState::kCancelled || *state == JobState::kFailed) {
    if (scheduler_->FailureCauseOf(item.job) == scheduler::FailureCause::kStaleHandle) {
      resolver_->InvalidateIfStale(item.remote_id, item.local_id);
    }
    outcome = Outcome::kFailed;
    return true;
  }

  transport::FileStateResult fs = transport_->QueryLocalFileState(item.local_id);
  if (fs.status == TransportStatus::kNotFound) {
    if (*state == JobState::kActive) {
      scheduler_->MarkFailed(item.job, scheduler::FailureCause::kStaleHandle);
    } else {
      scheduler_->Cancel(item.job);
    }
    resolver_->InvalidateIfStale(item.remote_id, item.local_id);
    outcome = Outcome::kFailed;
    return true;
  }
  if (fs.status == TransportStatus::kOk && fs.state.complete) {
    if (*state == JobState::kActive) {
      scheduler_->MarkDone(item.job);
    } else if (*state == JobState::kQueued) {
      scheduler_->Cancel(item.job);
    }
    outcome = Outcome::kSucceeded;
    return true;
  }
  if (now >= item.deadline) {
    scheduler_->Cancel(item.job);
    outcome = Outcome::kTimedOut;
    return true;
  }
  return false;
}

void ThumbnailPrefetcher::Record(const std::string& remote_id, Outcome outcome) {
  std::lock_guard<std::mutex> lock(mutex_);
  in_flight_.erase(remote_id);
  switch (outcome) {
    case Outcome::kSucceeded:
      done_.insert(remote_id);
      ++stats_.succeeded;
      break;
    case Outcome::kSkipped:
      done_.insert(remote_id);
      ++stats_.skipped;
      break;
    case Outcome::kFailed:
      ++stats_.failed;
      break;
    case Outcome::kTimedOut:
      ++stats_.timed_out;
      break;
    case Outcome::kAbandoned:
      break;
  }
}

void ThumbnailPrefetcher::RunBatch(std::vector<std::string> batch) {
  const auto s = settings_->Current();
  BatchHookFn hook;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    hook = batch_hook_;
  }
  if (hook) hook(batch);

  Logger::Debug("[ThumbnailPrefetcher] BATCH_BEGIN size=" + std::to_string(batch.size()));

  std::vector<Item> items;
  items.reserve(batch.size());
  for (auto& id : batch) {
    Item item;
    item.remote_id = std::move(id);
    Outcome outcome = Outcome::kFailed;
    if (PrepareItem(item, s, outcome)) {
      items.push_back(std::move(item));
    } else {
      Record(item.remote_id, outcome);
    }
  }

  // Settle: every item completes, fails or times out before the next batch.
  while (true) {
    const uint64_t seen = progress_seq_.load(std::memory_order_acquire);
    const auto now = std::chrono::steady_clock::now();
    bool all_settled = true;
    for (auto& item : items) {
      if (item.settled) continue;
      Outcome outcome = Outcome::kFailed;
      if (PollItem(item, now, outcome)) {
        item.settled = true;
        Record(item.remote_id, outcome);
      } else {
        all_settled = false;
      }
    }
    if (all_settled) break;

    if (shutdown_.load(std::memory_order_acquire)) {
      for (auto& item : items) {
        if (item.settled) continue;
        scheduler_->Cancel(item.job);
        item.settled = true;
        Record(item.remote_id, Outcome::kAbandoned);
      }
      break;
    }

    const auto tick =
        std::chrono::milliseconds(std::max<int64_t>(1, settings_->Current().poll_interval_ms));
    std::unique_lock<std::mutex> lock(mutex_);
    work_cv_.wait_for(lock, tick, [&] {
      return shutdown_.load(std::memory_order_acquire) ||
             progress_seq_.load(std::memory_order_acquire) != seen;
    });
  }

  PrefetchStats snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.batches;
    snapshot = stats_;
  }
  std::ostringstream oss;
  oss << "[ThumbnailPrefetcher] BATCH_DONE size=" << batch.size()
      << " submitted=" << snapshot.submitted
      << " succeeded=" << snapshot.succeeded
      << " failed=" << snapshot.failed
      << " skipped=" << snapshot.skipped
      << " timed_out=" << snapshot.timed_out;
  Logger::Info(oss.str());
}

}  // namespace streamcache::prefetch
