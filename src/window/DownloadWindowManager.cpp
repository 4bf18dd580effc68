// Repository: Retrovue-streamcache
// Component: Download Window Manager Implementation
// Copyright (c) 2025 RetroVue

#include "streamcache/window/DownloadWindowManager.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "streamcache/util/Logger.hpp"

namespace streamcache::window {

using streamcache::util::Logger;
using container::PlaybackMode;

namespace {

// Stream whose mutex this thread holds across a scheduler call.  A transport
// may deliver progress synchronously from StartPartialDownload or
// CancelDownload; OnProgress must not lock that stream again.
thread_local const void* t_calling_out = nullptr;

class ScopedCallOut {
 public:
  explicit ScopedCallOut(const void* stream) : prev_(t_calling_out) {
    t_calling_out = stream;
  }
  ~ScopedCallOut() { t_calling_out = prev_; }

  ScopedCallOut(const ScopedCallOut&) = delete;
  ScopedCallOut& operator=(const ScopedCallOut&) = delete;

 private:
  const void* prev_;
};

}  // namespace

DownloadWindowManager::DownloadWindowManager(transport::ITransportClient* transport,
                                             scheduler::ConcurrencyScheduler* scheduler,
                                             config::SettingsProvider* settings)
    : transport_(transport),
      scheduler_(scheduler),
      settings_(settings),
      alive_(std::make_shared<std::atomic<bool>>(true)) {
  if (transport_ == nullptr || scheduler_ == nullptr || settings_ == nullptr) {
    throw std::invalid_argument("DownloadWindowManager: null dependency");
  }
  auto alive = alive_;
  scheduler_->AddStateListener([this, alive](const scheduler::DownloadJob& job) {
    if (!alive->load(std::memory_order_acquire)) return;
    OnJobStateChanged(job);
  });
}

DownloadWindowManager::~DownloadWindowManager() {
  std::vector<StreamId> ids;
  {
    std::lock_guard<std::mutex> lock(map_mutex_);
    for (const auto& entry : streams_) ids.push_back(entry.first);
  }
  for (const auto& id : ids) {
    CloseStream(id);
  }
  alive_->store(false, std::memory_order_release);
}

// =============================================================================
// Lookup / notification
// =============================================================================

std::shared_ptr<DownloadWindowManager::StreamState> DownloadWindowManager::FindStream(
    const StreamId& stream_id) const {
  std::lock_guard<std::mutex> lock(map_mutex_);
  auto it = streams_.find(stream_id);
  return it == streams_.end() ? nullptr : it->second;
}

std::shared_ptr<DownloadWindowManager::StreamState> DownloadWindowManager::FindByLocalId(
    int32_t local_id) const {
  std::lock_guard<std::mutex> lock(map_mutex_);
  auto idx = by_local_id_.find(local_id);
  if (idx == by_local_id_.end()) return nullptr;
  auto it = streams_.find(idx->second);
  return it == streams_.end() ? nullptr : it->second;
}

// Never takes the stream mutex: callers may already hold it (scheduler
// callbacks fire synchronously from MarkDone/Submit).  A notification that
// lands between a waiter's predicate check and its wait costs at most one
// poll tick.
void DownloadWindowManager::Notify(StreamState& st) {
  st.progress_seq.fetch_add(1, std::memory_order_acq_rel);
  st.cv.notify_all();
}

void DownloadWindowManager::OnJobStateChanged(const scheduler::DownloadJob& job) {
  if (job.kind != DownloadKind::kVideo) return;
  auto st = FindStream(job.stream_id);
  if (st) Notify(*st);
}

void DownloadWindowManager::OnProgress(int32_t local_id) {
  auto st = FindByLocalId(local_id);
  if (!st) return;

  if (t_calling_out == st.get()) {
    // Delivered from inside our own scheduler call on this thread.
    st->deferred_progress.store(true, std::memory_order_release);
    Notify(*st);
    return;
  }

  transport::FileStateResult r = transport_->QueryLocalFileState(local_id);
  {
    std::unique_lock<std::mutex> lock(st->mutex, std::try_to_lock);
    if (!lock.owns_lock()) {
      // Applied by the holder's next refresh or by FlushDeferredProgress().
      st->deferred_progress.store(true, std::memory_order_release);
    } else if (!st->closed && st->local_id == local_id &&
               r.status == transport::TransportStatus::kOk) {
      ApplyFileStateLocked(*st, r.state);
    }
  }
  Notify(*st);
}

void DownloadWindowManager::FlushDeferredProgress(StreamState& st) {
  if (!st.deferred_progress.exchange(false, std::memory_order_acq_rel)) return;
  int32_t local_id = 0;
  {
    std::lock_guard<std::mutex> lock(st.mutex);
    if (st.closed) return;
    local_id = st.local_id;
  }
  OnProgress(local_id);
}

// =============================================================================
// Stream registration
// =============================================================================

StreamError DownloadWindowManager::OpenStream(const StreamId& stream_id, int32_t local_id,
                                              std::optional<uint64_t> size_hint,
                                              const std::string& mime) {
  if (stream_id.empty()) return StreamError::kInvalidHandle;

  auto st = std::make_shared<StreamState>();
  st->stream_id = stream_id;
  st->local_id = local_id;
  st->total_size = size_hint;
  st->mode = container::PlaybackModeDetector::FromMime(mime);

  {
    std::lock_guard<std::mutex> lock(map_mutex_);
    if (streams_.count(stream_id) != 0) {
      return StreamError::kStreamAlreadyOpen;
    }
    streams_.emplace(stream_id, st);
    by_local_id_[local_id] = stream_id;
  }

  std::ostringstream oss;
  oss << "[DownloadWindowManager] STREAM_OPENED stream=" << stream_id
      << " local_id=" << local_id
      << " mode=" << (st->mode ? container::PlaybackModeToString(*st->mode) : "SNIFF");
  if (size_hint) oss << " size=" << *size_hint;
  Logger::Info(oss.str());
  return StreamError::kNone;
}

void DownloadWindowManager::CloseStream(const StreamId& stream_id) {
  std::shared_ptr<StreamState> st;
  {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = streams_.find(stream_id);
    if (it == streams_.end()) return;
    st = it->second;
    streams_.erase(it);
    for (auto idx = by_local_id_.begin(); idx != by_local_id_.end();) {
      if (idx->second == stream_id) {
        idx = by_local_id_.erase(idx);
      } else {
        ++idx;
      }
    }
  }

  JobId job = kInvalidJobId;
  {
    std::lock_guard<std::mutex> lock(st->mutex);
    st->closed = true;
    ++st->wait_epoch;
    job = st->job;
    st->job = kInvalidJobId;
    st->has_window = false;
    st->phase = WindowPhase::kIdle;
  }
  if (job != kInvalidJobId) {
    scheduler_->Cancel(job);
  }
  st->cv.notify_all();

  Logger::Info("[DownloadWindowManager] STREAM_CLOSED stream=" + stream_id);
}

bool DownloadWindowManager::HasStream(const StreamId& stream_id) const {
  return FindStream(stream_id) != nullptr;
}

// =============================================================================
// Window transitions
// =============================================================================

uint64_t DownloadWindowManager::ClipToFile(const StreamState& st, uint64_t start,
                                           uint64_t size) const {
  if (size == 0 || !st.total_size) return size;
  const uint64_t total = *st.total_size;
  if (start >= total) return 1;
  return std::min(size, total - start);
}

void DownloadWindowManager::ReplaceWindowLocked(StreamState& st, uint64_t start,
                                                uint64_t size,
                                                const config::StreamingSettings& s,
                                                const char* reason) {
  ScopedCallOut call_out(&st);
  const JobId old_job = st.job;
  if (old_job != kInvalidJobId) {
    scheduler_->Cancel(old_job);
  }

  st.window = DownloadWindow{};
  st.window.stream_id = st.stream_id;
  st.window.start_offset = start;
  st.window.requested_size = size;
  st.has_window = true;
  st.phase = WindowPhase::kWindowOpen;

  scheduler::JobRequest req;
  req.stream_id = st.stream_id;
  req.local_id = st.local_id;
  req.kind = DownloadKind::kVideo;
  req.priority = s.video_priority;
  req.offset = start;
  req.required_bytes = size;
  st.job = scheduler_->Submit(req);

  std::ostringstream oss;
  oss << "[DownloadWindowManager] WINDOW_OPENED stream=" << st.stream_id
      << " reason=" << reason
      << " start=" << start
      << " size=" << (size == 0 ? std::string("unbounded") : std::to_string(size))
      << " job=" << st.job;
  if (old_job != kInvalidJobId) oss << " superseded_job=" << old_job;
  Logger::Info(oss.str());
}

WindowOpenResult DownloadWindowManager::OpenWindowLocked(StreamState& st, uint64_t target,
                                                         EnsureMode mode,
                                                         const config::StreamingSettings& s) {
  auto job_usable = [&]() {
    if (st.job == kInvalidJobId) return false;
    auto state = scheduler_->StateOf(st.job);
    return state && *state != JobState::kFailed && *state != JobState::kCancelled;
  };

  if (mode == EnsureMode::kInitialStart) {
    st.seek_target = 0;
    if (st.has_window && st.window.start_offset == 0 && job_usable()) {
      return WindowOpenResult::Success(st.window, st.job, true);
    }
    const uint64_t size =
        (st.mode && *st.mode == PlaybackMode::kFullFile) ? 0 : s.initial_prefix_bytes;
    ReplaceWindowLocked(st, 0, ClipToFile(st, 0, size), s, "initial_start");
    return WindowOpenResult::Success(st.window, st.job, false);
  }

  if (st.total_size && *st.total_size > 0 && target >= *st.total_size) {
    target = *st.total_size - 1;
  }
  st.seek_target = target;
  if (st.has_window && target >= st.window.start_offset && target < st.window.End() &&
      job_usable()) {
    Logger::Debug("[DownloadWindowManager] WINDOW_REUSED stream=" + st.stream_id +
                  " target=" + std::to_string(target));
    return WindowOpenResult::Success(st.window, st.job, true);
  }

  // (target - start) + margin with start == target.
  const uint64_t size = std::min(s.seek_margin_bytes, s.max_window_bytes);
  ReplaceWindowLocked(st, target, ClipToFile(st, target, size), s, "seek");
  return WindowOpenResult::Success(st.window, st.job, false);
}

void DownloadWindowManager::GrowWindowLocked(StreamState& st, uint64_t needed_end,
                                             const config::StreamingSettings& s) {
  if (!st.has_window || st.window.Unbounded()) return;
  const uint64_t start = st.window.start_offset;
  if (needed_end <= start) return;

  uint64_t size = std::min((needed_end - start) + s.seek_margin_bytes, s.max_window_bytes);
  size = ClipToFile(st, start, size);
  if (size <= st.window.requested_size) return;

  // Same start: bytes already confirmed remain valid for the larger window.
  const uint64_t kept = st.window.downloaded_prefix_len;
  ReplaceWindowLocked(st, start, size, s, "grow");
  st.window.downloaded_prefix_len = kept;
}

void DownloadWindowManager::CoverFromStartLocked(StreamState& st, uint64_t required_end,
                                                 const config::StreamingSettings& s) {
  if (!st.has_window || st.window.start_offset != 0 || st.window.Unbounded()) return;
  if (required_end <= st.window.End()) return;
  if (required_end <= s.max_window_bytes) {
    GrowWindowLocked(st, required_end, s);
    return;
  }
  const uint64_t kept = st.window.downloaded_prefix_len;
  ReplaceWindowLocked(st, 0, 0, s, "initial_start_unbounded");
  st.window.downloaded_prefix_len = kept;
}

void DownloadWindowManager::SwitchToFullFileLocked(StreamState& st,
                                                   const config::StreamingSettings& s,
                                                   const std::string& reason) {
  st.mode = PlaybackMode::kFullFile;
  st.incomplete_since.reset();

  std::ostringstream oss;
  oss << "[DownloadWindowManager] FULL_FILE_FALLBACK stream=" << st.stream_id
      << " reason=\"" << reason << "\"";
  Logger::Warn(oss.str());

  const uint64_t kept = st.window.start_offset == 0 ? st.window.downloaded_prefix_len : 0;
  ReplaceWindowLocked(st, 0, 0, s, "full_file");
  st.window.downloaded_prefix_len = kept;
}

WindowOpenResult DownloadWindowManager::OpenWindow(const StreamId& stream_id,
                                                   uint64_t target_offset, EnsureMode mode) {
  auto st = FindStream(stream_id);
  if (!st) return WindowOpenResult::Failure(StreamError::kInvalidHandle);
  const auto s = settings_->Current();

  WindowOpenResult result = WindowOpenResult::Failure(StreamError::kInvalidHandle);
  {
    std::lock_guard<std::mutex> lock(st->mutex);
    if (st->closed) return result;
    result = OpenWindowLocked(*st, target_offset, mode, s);
    if (!result.reused) {
      ++st->wait_epoch;
    }
  }
  st->cv.notify_all();
  FlushDeferredProgress(*st);
  return result;
}

void DownloadWindowManager::Rebind(const StreamId& stream_id, int32_t new_local_id) {
  auto st = FindStream(stream_id);
  if (!st) return;

  int32_t old_local_id = 0;
  JobId job = kInvalidJobId;
  {
    std::lock_guard<std::mutex> lock(st->mutex);
    old_local_id = st->local_id;
    st->local_id = new_local_id;
    job = st->job;
    st->job = kInvalidJobId;
    st->has_window = false;
    st->window = DownloadWindow{};
    st->phase = WindowPhase::kIdle;
    st->local_path.clear();
    st->file_complete = false;
    st->validated_len = 0;
    st->last_validation.reset();
    st->container_complete = false;
    st->incomplete_since.reset();
    ++st->wait_epoch;
  }
  if (job != kInvalidJobId) {
    scheduler_->Cancel(job);
  }
  {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto idx = by_local_id_.find(old_local_id);
    if (idx != by_local_id_.end() && idx->second == stream_id) {
      by_local_id_.erase(idx);
    }
    by_local_id_[new_local_id] = stream_id;
  }
  st->cv.notify_all();

  std::ostringstream oss;
  oss << "[DownloadWindowManager] STREAM_REBOUND stream=" << stream_id
      << " old_local_id=" << old_local_id << " new_local_id=" << new_local_id;
  Logger::Info(oss.str());
}

// =============================================================================
// Transport observations
// =============================================================================

void DownloadWindowManager::ApplyFileStateLocked(StreamState& st,
                                                 const transport::LocalFileState& fs) {
  if (!fs.local_path.empty()) st.local_path = fs.local_path;
  if (fs.total_size) st.total_size = fs.total_size;
  st.file_complete = fs.complete;
  if (!st.has_window) return;

  DownloadWindow& w = st.window;
  uint64_t observed = w.downloaded_prefix_len;
  if (fs.complete && st.total_size) {
    observed = *st.total_size > w.start_offset ? *st.total_size - w.start_offset : 0;
  } else if (fs.download_offset <= w.start_offset &&
             fs.download_offset + fs.downloaded_prefix_bytes > w.start_offset) {
    observed = fs.download_offset + fs.downloaded_prefix_bytes - w.start_offset;
  }
  // Reports for another offset say nothing about this window; hold.
  w.downloaded_prefix_len = std::max(w.downloaded_prefix_len, observed);

  const bool window_full =
      fs.complete || (!w.Unbounded() && w.downloaded_prefix_len >= w.requested_size);
  if (window_full && !w.complete) {
    w.complete = true;
    if (st.job != kInvalidJobId) {
      ScopedCallOut call_out(&st);
      auto state = scheduler_->StateOf(st.job);
      if (state == JobState::kActive) {
        scheduler_->MarkDone(st.job);
      } else if (state == JobState::kQueued) {
        scheduler_->Cancel(st.job);
      }
    }
    std::ostringstream oss;
    oss << "[DownloadWindowManager] WINDOW_COMPLETE stream=" << st.stream_id
        << " start=" << w.start_offset << " confirmed=" << w.downloaded_prefix_len;
    Logger::Debug(oss.str());
  }
}

std::optional<transport::FileStateResult> DownloadWindowManager::RefreshUnlocked(
    std::unique_lock<std::mutex>& lock, StreamState& st) {
  const int32_t local_id = st.local_id;
  st.deferred_progress.store(false, std::memory_order_release);
  lock.unlock();
  transport::FileStateResult r = transport_->QueryLocalFileState(local_id);
  lock.lock();
  if (st.local_id != local_id) return std::nullopt;
  if (r.status == transport::TransportStatus::kOk) {
    ApplyFileStateLocked(st, r.state);
  }
  return r;
}

void DownloadWindowManager::DetectModeLocked(StreamState& st,
                                             const config::StreamingSettings& s) {
  if (st.mode || st.local_path.empty() || !st.has_window) return;

  uint64_t available = st.window.start_offset == 0 ? st.window.ConfirmedEnd() : 0;
  if (st.file_complete && st.total_size) available = *st.total_size;
  uint64_t need = container::PlaybackModeDetector::kSniffBytes;
  if (st.total_size) need = std::min<uint64_t>(need, *st.total_size);
  if (need == 0 || available < need) return;

  std::vector<uint8_t> head(static_cast<size_t>(need));
  container::FileByteSource src(st.local_path);
  if (!src.ReadAt(0, head.data(), head.size())) return;

  const PlaybackMode mode = container::PlaybackModeDetector::Sniff(head.data(), head.size());
  st.mode = mode;
  Logger::Info("[DownloadWindowManager] MODE_DETECTED stream=" + st.stream_id +
               " mode=" + container::PlaybackModeToString(mode));

  if (mode == PlaybackMode::kFullFile && st.window.start_offset == 0 &&
      !st.window.Unbounded()) {
    const uint64_t kept = st.window.downloaded_prefix_len;
    ReplaceWindowLocked(st, 0, 0, s, "full_file");
    st.window.downloaded_prefix_len = kept;
  }
}

// =============================================================================
// Readiness
// =============================================================================

uint64_t DownloadWindowManager::RequirementFor(const StreamState& st, uint64_t required_end,
                                               EnsureMode mode,
                                               const config::StreamingSettings& s) const {
  uint64_t r = required_end;
  if (mode == EnsureMode::kInitialStart) {
    if (r == 0) r = s.initial_prefix_bytes;
  } else if (st.has_window && r == st.window.start_offset) {
    // Empty range at the window start: wait for its first byte.
    r = st.window.start_offset + 1;
  }
  if (st.total_size) r = std::min(r, *st.total_size);
  return r;
}

bool DownloadWindowManager::WindowCoversLocked(const StreamState& st, uint64_t required_end,
                                               EnsureMode mode) const {
  if (!st.has_window) return false;
  const DownloadWindow& w = st.window;
  if (mode == EnsureMode::kInitialStart) {
    return w.start_offset == 0 && required_end <= w.End();
  }
  return w.start_offset < required_end && required_end <= w.End();
}

bool DownloadWindowManager::SatisfiedLocked(const StreamState& st, uint64_t required,
                                            EnsureMode mode) const {
  if (st.local_path.empty() || !st.has_window) return false;
  if (st.file_complete) return true;
  const DownloadWindow& w = st.window;
  if (mode == EnsureMode::kInitialStart) {
    if (w.start_offset != 0 || !st.mode || *st.mode != PlaybackMode::kProgressive) {
      return false;
    }
    return st.container_complete && w.ConfirmedEnd() >= required;
  }
  return w.start_offset < required && w.ConfirmedEnd() >= required;
}

DownloadWindowManager::Evaluation DownloadWindowManager::EvaluateContainerLocked(
    StreamState& st, uint64_t required, const config::StreamingSettings& s) {
  Evaluation ev;
  if (st.local_path.empty()) return ev;

  uint64_t available = st.window.ConfirmedEnd();
  if (st.file_complete && st.total_size) available = *st.total_size;

  if (!st.last_validation || available != st.validated_len) {
    container::FileByteSource src(st.local_path);
    if (!src.IsOpen()) {
      const int err = src.OpenErrno();
      ev.verdict = Verdict::kFailed;
      ev.error = err == ENOENT ? StreamError::kStaleLocalIdentity : StreamError::kIoError;
      ev.detail = std::string("open ") + st.local_path + ": " + std::strerror(err);
      return ev;
    }
    st.last_validation =
        container::ProgressiveContainerValidator::Validate(src, available, st.total_size);
    st.validated_len = available;
    Logger::Debug("[DownloadWindowManager] CONTAINER_CHECK stream=" + st.stream_id +
                  " available=" + std::to_string(available) + " result=" +
                  container::Describe(*st.last_validation));
  }

  const auto& result = *st.last_validation;
  const DownloadWindow& w = st.window;

  if (container::IsComplete(result)) {
    st.container_complete = true;
    st.incomplete_since.reset();
    if (available >= required) {
      ev.verdict = Verdict::kReady;
    } else {
      CoverFromStartLocked(st, required, s);
    }
    return ev;
  }

  if (const auto* invalid = std::get_if<container::ContainerInvalid>(&result)) {
    ev.verdict = Verdict::kFailed;
    ev.error = StreamError::kContainerInvalid;
    ev.detail = invalid->reason;
    return ev;
  }

  if (const auto* incomplete = std::get_if<container::ContainerIncomplete>(&result)) {
    const auto now = Clock::now();
    if (!st.incomplete_since) st.incomplete_since = now;
    if (s.full_file_fallback) {
      if (incomplete->bytes_needed > s.max_window_bytes) {
        SwitchToFullFileLocked(st, s, "moov exceeds max window");
        return ev;
      }
      const auto stuck = std::chrono::duration_cast<std::chrono::milliseconds>(
          now - *st.incomplete_since).count();
      if (stuck >= s.moov_incomplete_timeout_ms) {
        SwitchToFullFileLocked(st, s, "moov incomplete for " + std::to_string(stuck) + "ms");
        return ev;
      }
    }
    if (!w.Unbounded() && incomplete->bytes_needed > w.End()) {
      GrowWindowLocked(st, incomplete->bytes_needed, s);
    }
    return ev;
  }

  const auto& not_found = std::get<container::ContainerNotFound>(result);
  if (s.full_file_fallback && not_found.scanned_bytes >= s.max_prefix_scan_bytes) {
    SwitchToFullFileLocked(st, s, "moov not found within " +
                                      std::to_string(s.max_prefix_scan_bytes) + " bytes");
    return ev;
  }
  if (!w.Unbounded() && w.complete) {
    GrowWindowLocked(st,
                     not_found.scanned_bytes +
                         container::ProgressiveContainerValidator::kLargeBoxHeaderSize,
                     s);
  }
  return ev;
}

DownloadWindowManager::Evaluation DownloadWindowManager::EvaluateLocked(
    StreamState& st, uint64_t required, EnsureMode mode, const config::StreamingSettings& s) {
  Evaluation ev;

  if (mode == EnsureMode::kInitialStart && !st.file_complete) {
    DetectModeLocked(st, s);
    if (st.mode && *st.mode == PlaybackMode::kProgressive && st.window.start_offset == 0) {
      ev = EvaluateContainerLocked(st, required, s);
      if (ev.verdict != Verdict::kWaiting) return ev;
    }
  }

  if (SatisfiedLocked(st, required, mode)) {
    ev.verdict = Verdict::kReady;
    return ev;
  }

  if (st.job != kInvalidJobId) {
    auto state = scheduler_->StateOf(st.job);
    if (state == JobState::kFailed) {
      auto cause = scheduler_->FailureCauseOf(st.job);
      ev.verdict = Verdict::kFailed;
      if (cause && *cause == scheduler::FailureCause::kStaleHandle) {
        ev.error = StreamError::kStaleLocalIdentity;
        ev.detail = "transport rejected local id " + std::to_string(st.local_id);
      } else {
        ev.error = StreamError::kDownloadFailed;
        ev.detail = "job " + std::to_string(st.job) + " failed";
      }
      return ev;
    }
    if (state == JobState::kCancelled) {
      ev.verdict = Verdict::kFailed;
      ev.error = StreamError::kCancelled;
      ev.detail = "job " + std::to_string(st.job) + " cancelled";
      return ev;
    }
  }
  return ev;
}

EnsureResult DownloadWindowManager::EnsureReady(const StreamId& stream_id,
                                                uint64_t required_end, EnsureMode mode,
                                                int64_t timeout_ms) {
  auto st = FindStream(stream_id);
  if (!st) return EnsureResult::Failure(StreamError::kInvalidHandle, "unknown stream");

  auto s = settings_->Current();
  if (timeout_ms <= 0) timeout_ms = s.ensure_ready_timeout_ms;
  const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

  std::unique_lock<std::mutex> lock(st->mutex);
  if (st->closed) return EnsureResult::Failure(StreamError::kCancelled, "stream closed");

  uint64_t required = RequirementFor(*st, required_end, mode, s);
  if (WindowCoversLocked(*st, required, mode) && SatisfiedLocked(*st, required, mode)) {
    st->phase = WindowPhase::kReady;
    return EnsureResult::Success(st->local_path);
  }

  // Make sure a window covering the requirement is live.  A seek requirement
  // is measured from the window start and never moves the window.
  if (!WindowCoversLocked(*st, required, mode)) {
    if (mode == EnsureMode::kInitialStart) {
      OpenWindowLocked(*st, 0, mode, s);
      CoverFromStartLocked(*st, required, s);
    } else {
      if (!st->has_window) {
        OpenWindowLocked(*st, st->seek_target, mode, s);
        required = RequirementFor(*st, required_end, mode, s);
      }
      const uint64_t start = st->window.start_offset;
      if (required <= start || required - start > s.max_window_bytes) {
        std::ostringstream oss;
        oss << "required_end=" << required << " window_start=" << start
            << " max_window=" << s.max_window_bytes;
        Logger::Warn("[DownloadWindowManager] ENSURE_REJECTED stream=" + stream_id + " " +
                     oss.str());
        return EnsureResult::Failure(StreamError::kRangeOutsideWindow, oss.str());
      }
      GrowWindowLocked(*st, required, s);
    }
    required = RequirementFor(*st, required_end, mode, s);
  }

  const uint64_t epoch = st->wait_epoch;
  {
    std::ostringstream oss;
    oss << "[DownloadWindowManager] ENSURE_BEGIN stream=" << stream_id
        << " mode=" << EnsureModeToString(mode)
        << " required=" << required
        << " window_start=" << st->window.start_offset
        << " timeout_ms=" << timeout_ms;
    Logger::Debug(oss.str());
  }

  while (true) {
    const uint64_t seen_seq = st->progress_seq.load(std::memory_order_acquire);
    auto refreshed = RefreshUnlocked(lock, *st);
    if (st->closed || st->wait_epoch != epoch) {
      return EnsureResult::Failure(StreamError::kCancelled, "superseded");
    }
    if (refreshed && refreshed->status == transport::TransportStatus::kNotFound) {
      Logger::Warn("[DownloadWindowManager] STALE_LOCAL_ID stream=" + stream_id +
                   " local_id=" + std::to_string(st->local_id));
      return EnsureResult::Failure(StreamError::kStaleLocalIdentity, refreshed->message);
    }

    s = settings_->Current();
    required = RequirementFor(*st, required_end, mode, s);
    Evaluation ev = EvaluateLocked(*st, required, mode, s);
    if (ev.verdict == Verdict::kReady) {
      st->phase = WindowPhase::kReady;
      std::ostringstream oss;
      oss << "[DownloadWindowManager] ENSURE_READY stream=" << stream_id
          << " mode=" << EnsureModeToString(mode)
          << " confirmed_end=" << st->window.ConfirmedEnd()
          << " path=" << st->local_path;
      Logger::Info(oss.str());
      return EnsureResult::Success(st->local_path);
    }
    if (ev.verdict == Verdict::kFailed) {
      std::ostringstream oss;
      oss << "[DownloadWindowManager] ENSURE_FAILED stream=" << stream_id
          << " error=" << StreamErrorToString(ev.error) << " detail=\"" << ev.detail << "\"";
      Logger::Error(oss.str());
      return EnsureResult::Failure(ev.error, ev.detail);
    }

    const auto now = Clock::now();
    if (now >= deadline) {
      std::ostringstream oss;
      oss << "[DownloadWindowManager] ENSURE_TIMEOUT stream=" << stream_id
          << " required=" << required
          << " confirmed_end=" << st->window.ConfirmedEnd()
          << " timeout_ms=" << timeout_ms;
      Logger::Warn(oss.str());
      return EnsureResult::Failure(StreamError::kDownloadTimeout, oss.str());
    }

    const auto tick = std::chrono::milliseconds(std::max<int64_t>(1, s.poll_interval_ms));
    st->cv.wait_until(lock, std::min(now + tick, deadline), [&] {
      return st->closed || st->wait_epoch != epoch ||
             st->progress_seq.load(std::memory_order_acquire) != seen_seq;
    });
  }
}

StreamError DownloadWindowManager::Refresh(const StreamId& stream_id) {
  auto st = FindStream(stream_id);
  if (!st) return StreamError::kInvalidHandle;

  std::unique_lock<std::mutex> lock(st->mutex);
  if (st->closed) return StreamError::kCancelled;
  auto refreshed = RefreshUnlocked(lock, *st);
  if (refreshed && refreshed->status == transport::TransportStatus::kNotFound) {
    Logger::Warn("[DownloadWindowManager] STALE_LOCAL_ID stream=" + stream_id +
                 " local_id=" + std::to_string(st->local_id));
    return StreamError::kStaleLocalIdentity;
  }
  return StreamError::kNone;
}

bool DownloadWindowManager::IsReadyForPlayback(const StreamId& stream_id) {
  auto st = FindStream(stream_id);
  if (!st) return false;
  const auto s = settings_->Current();

  bool ready = false;
  {
    std::unique_lock<std::mutex> lock(st->mutex);
    if (st->closed) return false;
    RefreshUnlocked(lock, *st);
    ready = ProgressiveReadyLocked(*st, s);
  }
  FlushDeferredProgress(*st);
  return ready;
}

bool DownloadWindowManager::ProgressiveReadyLocked(StreamState& st,
                                                   const config::StreamingSettings& s) {
  if (st.file_complete && !st.local_path.empty()) return true;
  if (!st.has_window || st.window.start_offset != 0 || st.local_path.empty()) {
    return false;
  }
  DetectModeLocked(st, s);
  if (!st.mode || *st.mode != PlaybackMode::kProgressive) return false;

  const uint64_t available = st.window.ConfirmedEnd();
  if (!st.last_validation || st.validated_len != available) {
    container::FileByteSource src(st.local_path);
    if (!src.IsOpen()) return false;
    st.last_validation =
        container::ProgressiveContainerValidator::Validate(src, available, st.total_size);
    st.validated_len = available;
  }
  if (container::IsComplete(*st.last_validation)) {
    st.container_complete = true;
  }
  return st.container_complete;
}

// =============================================================================
// Introspection
// =============================================================================

std::optional<DownloadWindow> DownloadWindowManager::CurrentWindow(
    const StreamId& stream_id) const {
  auto st = FindStream(stream_id);
  if (!st) return std::nullopt;
  std::lock_guard<std::mutex> lock(st->mutex);
  if (!st->has_window) return std::nullopt;
  return st->window;
}

std::optional<JobId> DownloadWindowManager::CurrentJob(const StreamId& stream_id) const {
  auto st = FindStream(stream_id);
  if (!st) return std::nullopt;
  std::lock_guard<std::mutex> lock(st->mutex);
  if (st->job == kInvalidJobId) return std::nullopt;
  return st->job;
}

std::optional<ConfirmedRange> DownloadWindowManager::Confirmed(
    const StreamId& stream_id) const {
  auto st = FindStream(stream_id);
  if (!st) return std::nullopt;
  std::lock_guard<std::mutex> lock(st->mutex);
  if (!st->has_window || st->local_path.empty()) return std::nullopt;
  ConfirmedRange r;
  r.local_path = st->local_path;
  r.start = st->window.start_offset;
  r.end = st->window.ConfirmedEnd();
  r.file_complete = st->file_complete;
  r.total_size = st->total_size;
  return r;
}

std::optional<WindowPhase> DownloadWindowManager::PhaseOf(const StreamId& stream_id) const {
  auto st = FindStream(stream_id);
  if (!st) return std::nullopt;
  std::lock_guard<std::mutex> lock(st->mutex);
  return st->phase;
}

std::optional<container::PlaybackMode> DownloadWindowManager::ModeOf(
    const StreamId& stream_id) const {
  auto st = FindStream(stream_id);
  if (!st) return std::nullopt;
  std::lock_guard<std::mutex> lock(st->mutex);
  return st->mode;
}

}  // namespace streamcache::window
