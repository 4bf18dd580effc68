// Repository: Retrovue-streamcache
// Component: Thumbnail Prefetcher
// Purpose: Background worker that downloads thumbnails ahead of display in
//          bounded batches through the scheduler, deduplicated per remote id
//          and paused while foreground video is buffering.
// Copyright (c) 2025 RetroVue

#ifndef STREAMCACHE_PREFETCH_THUMBNAIL_PREFETCHER_HPP_
#define STREAMCACHE_PREFETCH_THUMBNAIL_PREFETCHER_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "streamcache/config/StreamingSettings.hpp"
#include "streamcache/resolver/RemoteIdentityResolver.hpp"
#include "streamcache/scheduler/ConcurrencyScheduler.hpp"
#include "streamcache/transport/ITransportClient.hpp"

namespace streamcache::prefetch {

struct PrefetchStats {
  uint64_t batches = 0;
  uint64_t submitted = 0;
  uint64_t succeeded = 0;
  uint64_t failed = 0;
  uint64_t skipped = 0;     // already fully cached, no job submitted
  uint64_t timed_out = 0;
};

// ThumbnailPrefetcher - persistent worker thread.
//
// Offer() queues candidate remote ids.  The worker takes up to
// thumb_batch_size of them, resolves each, skips files already complete,
// submits one kThumbnail job per remaining item and waits until every item
// settles (complete, failed, or thumb_item_timeout_ms elapsed, which cancels
// its job).  Only then does the next batch start, so at most one batch of
// thumbnail jobs is ever in flight.
//
// A remote id that completed or is in flight is never submitted again for
// the session; ClearCache() forgets completed ids.  Failed and timed-out ids
// may be offered again.
//
// While SetBuffering(true) is asserted and thumb_pause_while_buffering is on,
// no new batch starts; the current batch finishes.  No batch starts while
// thumb_prefetch_enabled is off.
class ThumbnailPrefetcher {
 public:
  using BatchHookFn = std::function<void(const std::vector<std::string>&)>;

  // Throws std::invalid_argument on a null dependency.
  ThumbnailPrefetcher(transport::ITransportClient* transport,
                      resolver::RemoteIdentityResolver* resolver,
                      scheduler::ConcurrencyScheduler* scheduler,
                      config::SettingsProvider* settings);
  ~ThumbnailPrefetcher();

  ThumbnailPrefetcher(const ThumbnailPrefetcher&) = delete;
  ThumbnailPrefetcher& operator=(const ThumbnailPrefetcher&) = delete;

  // Idempotent.  Stop() cancels the in-flight batch's jobs and joins.
  void Start();
  void Stop();

  void Offer(const std::vector<std::string>& remote_ids);

  void SetBuffering(bool buffering);
  bool IsBuffering() const;

  void ClearCache();

  // Progress hook; wakes the settling loop before its next poll tick.
  void OnProgress(int32_t local_id);

  PrefetchStats Stats() const;
  bool IsKnown(const std::string& remote_id) const;
  size_t PendingCount() const;
  size_t InFlightCount() const;

  // Test-only: called on the worker thread as each batch starts.
  void SetBatchHook(BatchHookFn hook);

 private:
  struct Item {
    std::string remote_id;
    int32_t local_id = 0;
    JobId job = kInvalidJobId;
    std::chrono::steady_clock::time_point deadline;
    bool settled = false;
  };

  enum class Outcome { kSucceeded, kFailed, kSkipped, kTimedOut, kAbandoned };

  void WorkerLoop();
  bool BatchAllowedLocked(const config::StreamingSettings& s) const;
  void RunBatch(std::vector<std::string> batch);
  bool PrepareItem(Item& item, const config::StreamingSettings& s, Outcome& outcome);
  bool PollItem(Item& item, std::chrono::steady_clock::time_point now, Outcome& outcome);
  void Record(const std::string& remote_id, Outcome outcome);

  static std::string ThumbStreamId(const std::string& remote_id) {
    return "thumb:" + remote_id;
  }

  transport::ITransportClient* transport_;
  resolver::RemoteIdentityResolver* resolver_;
  scheduler::ConcurrencyScheduler* scheduler_;
  config::SettingsProvider* settings_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;

  std::deque<std::string> pending_;
  std::unordered_set<std::string> pending_set_;
  std::unordered_set<std::string> in_flight_;
  std::unordered_set<std::string> done_;
  bool buffering_ = false;
  PrefetchStats stats_;

  std::thread worker_thread_;
  std::atomic<bool> shutdown_{false};
  std::atomic<uint64_t> progress_seq_{0};

  BatchHookFn batch_hook_;  // Test-only
};

}  // namespace streamcache::prefetch

#endif  // STREAMCACHE_PREFETCH_THUMBNAIL_PREFETCHER_HPP_
