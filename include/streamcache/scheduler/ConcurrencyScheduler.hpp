// Repository: Retrovue-streamcache
// Component: Concurrency Scheduler
// Purpose: Admission control for transport downloads.  Enforces a global
//          limit plus per-kind (video / thumbnail) limits, queues the excess
//          in per-kind FIFOs, and drains video before thumbnails whenever a
//          slot frees up.
// Copyright (c) 2025 RetroVue

#ifndef STREAMCACHE_SCHEDULER_CONCURRENCY_SCHEDULER_HPP_
#define STREAMCACHE_SCHEDULER_CONCURRENCY_SCHEDULER_HPP_

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "streamcache/engine/StreamTypes.hpp"
#include "streamcache/transport/ITransportClient.hpp"

namespace streamcache::scheduler {

struct SchedulerLimits {
  int global_limit = 5;
  int video_limit = 3;
  int thumb_limit = 3;
};

struct JobRequest {
  StreamId stream_id;
  int32_t local_id = 0;
  DownloadKind kind = DownloadKind::kVideo;
  int priority = 1;              // transport priority, 1..32
  uint64_t offset = 0;
  uint64_t required_bytes = 0;   // 0 = unbounded
};

struct DownloadJob {
  JobId id = kInvalidJobId;
  StreamId stream_id;
  int32_t local_id = 0;
  DownloadKind kind = DownloadKind::kVideo;
  int priority = 1;
  uint64_t offset = 0;
  uint64_t required_bytes = 0;
  JobState state = JobState::kQueued;
  std::chrono::steady_clock::time_point enqueued_at;
};

enum class FailureCause {
  kTransferError,  // transport rejected or aborted the transfer
  kStaleHandle,    // transport no longer knows the local id
};

inline const char* FailureCauseToString(FailureCause c) {
  switch (c) {
    case FailureCause::kTransferError: return "TRANSFER_ERROR";
    case FailureCause::kStaleHandle: return "STALE_HANDLE";
  }
  return "UNKNOWN";
}

struct BudgetSnapshot {
  SchedulerLimits limits;
  int active_global = 0;
  int active_video = 0;
  int active_thumb = 0;
  size_t queued_video = 0;
  size_t queued_thumb = 0;
};

// ConcurrencyScheduler
//
// All counters and queues live behind one mutex.  The transport is never
// called with that mutex held: admissions are decided under the lock and the
// StartTransferFn / AbortTransferFn callbacks run after it is released, on the
// thread that triggered the decision (Submit, Cancel, MarkDone, MarkFailed or
// SetLimits).
//
// Lifecycle: Queued -> Active -> Done | Failed | Cancelled, or
//            Queued -> Cancelled.
// Terminal states are retained for the most recent kMaxRetainedTerminalJobs
// jobs so late StateOf() queries still answer.
//
// Lowering a limit never preempts an active job; the new limit applies at the
// next admission decision.
class ConcurrencyScheduler {
 public:
  static constexpr size_t kMaxRetainedTerminalJobs = 1024;

  // Returns kOk if the transfer started.  kNotFound marks the job failed with
  // kStaleHandle, kError with kTransferError.
  using StartTransferFn = std::function<transport::TransportStatus(const DownloadJob&)>;
  using AbortTransferFn = std::function<void(const DownloadJob&)>;
  using StateListener = std::function<void(const DownloadJob&)>;

  ConcurrencyScheduler(SchedulerLimits limits, StartTransferFn start_fn,
                       AbortTransferFn abort_fn);
  ~ConcurrencyScheduler() = default;

  ConcurrencyScheduler(const ConcurrencyScheduler&) = delete;
  ConcurrencyScheduler& operator=(const ConcurrencyScheduler&) = delete;

  // Admit immediately if budget allows, otherwise append to the kind's FIFO.
  JobId Submit(const JobRequest& request);

  // Queued: O(1) removal, no side effects.  Active: abort transfer, free the
  // slot, drain.  Idempotent; returns false if the job was already terminal
  // or unknown.
  bool Cancel(JobId id);

  // Transfer finished.  Frees the slot and drains.  No-op unless Active.
  void MarkDone(JobId id);
  void MarkFailed(JobId id, FailureCause cause);

  std::optional<JobState> StateOf(JobId id) const;
  std::optional<DownloadJob> Find(JobId id) const;
  std::optional<FailureCause> FailureCauseOf(JobId id) const;

  BudgetSnapshot Snapshot() const;
  SchedulerLimits Limits() const;

  // Takes effect at the next admission decision; raising a limit drains now.
  void SetLimits(SchedulerLimits limits);

  // Invoked outside the scheduler lock after every state transition.
  // Register during setup, before jobs are submitted.
  void AddStateListener(StateListener listener);

 private:
  struct JobEntry {
    DownloadJob job;
    std::list<JobId>::iterator queue_pos;
    bool in_queue = false;
    std::optional<FailureCause> failure;
  };

  // A state change plus its log line, composed under the lock and emitted
  // after it is released.
  struct Transition {
    DownloadJob job;
    std::string log_line;
  };
  using TransitionList = std::vector<Transition>;

  std::list<JobId>& QueueFor(DownloadKind kind);
  bool CanAdmitLocked(DownloadKind kind) const;
  void ActivateLocked(JobEntry& entry, std::vector<DownloadJob>& to_start,
                      TransitionList& events);
  void DrainLocked(std::vector<DownloadJob>& to_start, TransitionList& events);
  void RetireLocked(JobEntry& entry, JobState terminal, TransitionList& events);

  // Common path for MarkDone / MarkFailed / Cancel.
  bool Finish(JobId id, JobState terminal, std::optional<FailureCause> cause);

  void StartAdmitted(const std::vector<DownloadJob>& to_start);
  void Dispatch(const TransitionList& events);
  Transition MakeTransitionLocked(const char* event, const DownloadJob& job) const;

  StartTransferFn start_fn_;
  AbortTransferFn abort_fn_;

  mutable std::mutex mutex_;
  SchedulerLimits limits_;
  int active_global_ = 0;
  int active_video_ = 0;
  int active_thumb_ = 0;
  JobId next_id_ = 1;
  std::unordered_map<JobId, JobEntry> jobs_;
  std::list<JobId> video_queue_;
  std::list<JobId> thumb_queue_;
  std::deque<JobId> terminal_order_;

  std::mutex listeners_mutex_;
  std::vector<StateListener> listeners_;
};

}  // namespace streamcache::scheduler

#endif  // STREAMCACHE_SCHEDULER_CONCURRENCY_SCHEDULER_HPP_
