// Repository: Retrovue-streamcache
// Component: Concurrency Scheduler Implementation
// Copyright (c) 2025 RetroVue

#include "streamcache/scheduler/ConcurrencyScheduler.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "streamcache/util/Logger.hpp"

namespace streamcache::scheduler {

using streamcache::util::Logger;

ConcurrencyScheduler::ConcurrencyScheduler(SchedulerLimits limits,
                                           StartTransferFn start_fn,
                                           AbortTransferFn abort_fn)
    : start_fn_(std::move(start_fn)),
      abort_fn_(std::move(abort_fn)),
      limits_(limits) {
  if (!start_fn_ || !abort_fn_) {
    throw std::invalid_argument("ConcurrencyScheduler: transfer callbacks are required");
  }
  if (limits_.global_limit < 1 || limits_.video_limit < 1 || limits_.thumb_limit < 1) {
    throw std::invalid_argument("ConcurrencyScheduler: limits must be >= 1");
  }
}

std::list<JobId>& ConcurrencyScheduler::QueueFor(DownloadKind kind) {
  return kind == DownloadKind::kVideo ? video_queue_ : thumb_queue_;
}

bool ConcurrencyScheduler::CanAdmitLocked(DownloadKind kind) const {
  if (active_global_ >= limits_.global_limit) return false;
  if (kind == DownloadKind::kVideo) return active_video_ < limits_.video_limit;
  return active_thumb_ < limits_.thumb_limit;
}

ConcurrencyScheduler::Transition ConcurrencyScheduler::MakeTransitionLocked(
    const char* event, const DownloadJob& job) const {
  std::ostringstream oss;
  oss << "[ConcurrencyScheduler] " << event
      << " job=" << job.id
      << " stream=" << job.stream_id
      << " kind=" << DownloadKindToString(job.kind)
      << " offset=" << job.offset
      << " bytes=" << job.required_bytes
      << " active_global=" << active_global_ << "/" << limits_.global_limit
      << " active_video=" << active_video_ << "/" << limits_.video_limit
      << " active_thumb=" << active_thumb_ << "/" << limits_.thumb_limit
      << " queued_video=" << video_queue_.size()
      << " queued_thumb=" << thumb_queue_.size();
  return Transition{job, oss.str()};
}

void ConcurrencyScheduler::ActivateLocked(JobEntry& entry,
                                          std::vector<DownloadJob>& to_start,
                                          TransitionList& events) {
  if (entry.in_queue) {
    QueueFor(entry.job.kind).erase(entry.queue_pos);
    entry.in_queue = false;
  }
  entry.job.state = JobState::kActive;
  ++active_global_;
  if (entry.job.kind == DownloadKind::kVideo) {
    ++active_video_;
  } else {
    ++active_thumb_;
  }
  to_start.push_back(entry.job);
  events.push_back(MakeTransitionLocked("JOB_ADMITTED", entry.job));
}

// Video first, then thumbnails; FIFO within a kind.  Stops at the first head
// that does not fit so later jobs never overtake it.
void ConcurrencyScheduler::DrainLocked(std::vector<DownloadJob>& to_start,
                                       TransitionList& events) {
  while (true) {
    if (!video_queue_.empty() && CanAdmitLocked(DownloadKind::kVideo)) {
      ActivateLocked(jobs_.at(video_queue_.front()), to_start, events);
      continue;
    }
    if (!thumb_queue_.empty() && CanAdmitLocked(DownloadKind::kThumbnail)) {
      ActivateLocked(jobs_.at(thumb_queue_.front()), to_start, events);
      continue;
    }
    break;
  }
}

void ConcurrencyScheduler::RetireLocked(JobEntry& entry, JobState terminal,
                                        TransitionList& events) {
  if (entry.in_queue) {
    QueueFor(entry.job.kind).erase(entry.queue_pos);
    entry.in_queue = false;
  } else if (entry.job.state == JobState::kActive) {
    --active_global_;
    if (entry.job.kind == DownloadKind::kVideo) {
      --active_video_;
    } else {
      --active_thumb_;
    }
  }
  entry.job.state = terminal;

  const char* event = "JOB_DONE";
  if (terminal == JobState::kFailed) event = "JOB_FAILED";
  if (terminal == JobState::kCancelled) event = "JOB_CANCELLED";
  events.push_back(MakeTransitionLocked(event, entry.job));

  terminal_order_.push_back(entry.job.id);
  while (terminal_order_.size() > kMaxRetainedTerminalJobs) {
    jobs_.erase(terminal_order_.front());
    terminal_order_.pop_front();
  }
}

JobId ConcurrencyScheduler::Submit(const JobRequest& request) {
  std::vector<DownloadJob> to_start;
  TransitionList events;
  JobId id = kInvalidJobId;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_id_++;
    JobEntry entry;
    entry.job.id = id;
    entry.job.stream_id = request.stream_id;
    entry.job.local_id = request.local_id;
    entry.job.kind = request.kind;
    entry.job.priority = std::clamp(request.priority, 1, 32);
    entry.job.offset = request.offset;
    entry.job.required_bytes = request.required_bytes;
    entry.job.state = JobState::kQueued;
    entry.job.enqueued_at = std::chrono::steady_clock::now();
    JobEntry& stored = jobs_.emplace(id, std::move(entry)).first->second;

    auto& queue = QueueFor(request.kind);
    if (queue.empty() && CanAdmitLocked(request.kind)) {
      ActivateLocked(stored, to_start, events);
    } else {
      stored.queue_pos = queue.insert(queue.end(), id);
      stored.in_queue = true;
      events.push_back(MakeTransitionLocked("JOB_QUEUED", stored.job));
    }
  }
  Dispatch(events);
  StartAdmitted(to_start);
  return id;
}

bool ConcurrencyScheduler::Finish(JobId id, JobState terminal,
                                  std::optional<FailureCause> cause) {
  std::vector<DownloadJob> to_start;
  TransitionList events;
  std::optional<DownloadJob> to_abort;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return false;
    JobEntry& entry = it->second;
    if (IsTerminal(entry.job.state)) return false;
    if (terminal != JobState::kCancelled && entry.job.state != JobState::kActive) {
      return false;
    }
    const bool was_active = entry.job.state == JobState::kActive;
    entry.failure = cause;
    RetireLocked(entry, terminal, events);
    if (terminal == JobState::kCancelled && was_active) {
      to_abort = entry.job;
    }
    if (was_active) {
      DrainLocked(to_start, events);
    }
  }

  // Abort before any newly admitted transfer starts: the transport replaces
  // requests per local id, so the order matters when both share one.
  if (to_abort) abort_fn_(*to_abort);
  Dispatch(events);
  StartAdmitted(to_start);
  return true;
}

bool ConcurrencyScheduler::Cancel(JobId id) {
  return Finish(id, JobState::kCancelled, std::nullopt);
}

void ConcurrencyScheduler::MarkDone(JobId id) {
  Finish(id, JobState::kDone, std::nullopt);
}

void ConcurrencyScheduler::MarkFailed(JobId id, FailureCause cause) {
  if (Finish(id, JobState::kFailed, cause)) {
    std::ostringstream oss;
    oss << "[ConcurrencyScheduler] JOB_FAILURE_CAUSE job=" << id
        << " cause=" << FailureCauseToString(cause);
    Logger::Warn(oss.str());
  }
}

void ConcurrencyScheduler::StartAdmitted(const std::vector<DownloadJob>& to_start) {
  for (const auto& job : to_start) {
    transport::TransportStatus status = start_fn_(job);
    if (status == transport::TransportStatus::kOk) {
      // Cancelled between admission and start: the abort already ran, so the
      // freshly started transfer must be stopped too.
      bool cancelled = false;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(job.id);
        cancelled = it != jobs_.end() && it->second.job.state == JobState::kCancelled;
      }
      if (cancelled) abort_fn_(job);
      continue;
    }
    std::ostringstream oss;
    oss << "[ConcurrencyScheduler] START_FAILED job=" << job.id
        << " local_id=" << job.local_id
        << " status=" << transport::TransportStatusToString(status);
    Logger::Error(oss.str());
    MarkFailed(job.id, status == transport::TransportStatus::kNotFound
                           ? FailureCause::kStaleHandle
                           : FailureCause::kTransferError);
  }
}

void ConcurrencyScheduler::Dispatch(const TransitionList& events) {
  if (events.empty()) return;
  std::vector<StateListener> listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners = listeners_;
  }
  for (const auto& t : events) {
    if (t.job.state == JobState::kQueued || t.job.state == JobState::kActive) {
      Logger::Debug(t.log_line);
    } else {
      Logger::Info(t.log_line);
    }
    for (const auto& listener : listeners) {
      listener(t.job);
    }
  }
}

std::optional<JobState> ConcurrencyScheduler::StateOf(JobId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) return std::nullopt;
  return it->second.job.state;
}

std::optional<DownloadJob> ConcurrencyScheduler::Find(JobId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) return std::nullopt;
  return it->second.job;
}

std::optional<FailureCause> ConcurrencyScheduler::FailureCauseOf(JobId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) return std::nullopt;
  return it->second.failure;
}

BudgetSnapshot ConcurrencyScheduler::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  BudgetSnapshot s;
  s.limits = limits_;
  s.active_global = active_global_;
  s.active_video = active_video_;
  s.active_thumb = active_thumb_;
  s.queued_video = video_queue_.size();
  s.queued_thumb = thumb_queue_.size();
  return s;
}

SchedulerLimits ConcurrencyScheduler::Limits() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return limits_;
}

void ConcurrencyScheduler::SetLimits(SchedulerLimits limits) {
  limits.global_limit = std::max(1, limits.global_limit);
  limits.video_limit = std::max(1, limits.video_limit);
  limits.thumb_limit = std::max(1, limits.thumb_limit);

  std::vector<DownloadJob> to_start;
  TransitionList events;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    limits_ = limits;
    DrainLocked(to_start, events);
  }

  std::ostringstream oss;
  oss << "[ConcurrencyScheduler] LIMITS_UPDATED global=" << limits.global_limit
      << " video=" << limits.video_limit << " thumb=" << limits.thumb_limit;
  Logger::Info(oss.str());

  Dispatch(events);
  StartAdmitted(to_start);
}

void ConcurrencyScheduler::AddStateListener(StateListener listener) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  listeners_.push_back(std::move(listener));
}

}  // namespace streamcache::scheduler
