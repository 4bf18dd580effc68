// Repository: Retrovue-streamcache
// Component: Download Window Manager
// Purpose: Owns the byte range being fetched for each open stream.  Sizes
//          windows for cold start and seek, supersedes stale windows, and
//          drives the scheduler, transport and container validator to decide
//          when a stream is ready to read.
// Copyright (c) 2025 RetroVue

#ifndef STREAMCACHE_WINDOW_DOWNLOAD_WINDOW_MANAGER_HPP_
#define STREAMCACHE_WINDOW_DOWNLOAD_WINDOW_MANAGER_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "streamcache/config/StreamingSettings.hpp"
#include "streamcache/container/PlaybackModeDetector.hpp"
#include "streamcache/container/ProgressiveContainerValidator.hpp"
#include "streamcache/engine/StreamTypes.hpp"
#include "streamcache/scheduler/ConcurrencyScheduler.hpp"
#include "streamcache/transport/ITransportClient.hpp"

namespace streamcache::window {

enum class WindowPhase { kIdle, kWindowOpen, kReady };

inline const char* WindowPhaseToString(WindowPhase p) {
  switch (p) {
    case WindowPhase::kIdle: return "IDLE";
    case WindowPhase::kWindowOpen: return "WINDOW_OPEN";
    case WindowPhase::kReady: return "READY";
  }
  return "UNKNOWN";
}

struct WindowOpenResult {
  bool ok;
  StreamError error;
  DownloadWindow window;
  JobId job;
  bool reused;  // target was inside the covered range; no new job

  static WindowOpenResult Success(const DownloadWindow& w, JobId job, bool reused) {
    return {true, StreamError::kNone, w, job, reused};
  }

  static WindowOpenResult Failure(StreamError err) {
    return {false, err, DownloadWindow{}, kInvalidJobId, false};
  }
};

// Bytes of the current window known to be on disk.
struct ConfirmedRange {
  std::string local_path;
  uint64_t start = 0;
  uint64_t end = 0;                     // exclusive
  bool file_complete = false;
  std::optional<uint64_t> total_size;
};

// DownloadWindowManager
//
// Per-stream state machine:
//
//   Idle --OpenWindow--> WindowOpen --EnsureReady satisfied--> Ready
//   WindowOpen|Ready --seek outside covered range--> WindowOpen (new window)
//   any --CloseStream--> removed
//
// At most one live window per stream.  Replacing a window cancels its job in
// the scheduler; bytes already on disk stay in the transport cache.
//
// Readiness:
//   kInitialStart on progressive media: prefix >= required AND the container
//     validator reports Complete.  A movie header past the window grows the
//     window; a header that cannot be found within max_prefix_scan_bytes, or
//     stays Incomplete for moov_incomplete_timeout_ms, switches the stream to
//     full-file mode (unbounded window, ready when complete).
//   kInitialStart on full-file media: transport reports the file complete.
//   kSeek: byte threshold, confirmed range covers [window start, required).
//     The window stays anchored at the seek target; a requirement ending
//     before it, or more than max_window_bytes past it, is kRangeOutsideWindow.
//
// Locking: each stream has its own mutex, held across window transitions
// and scheduler calls.  Scheduler listeners never take a stream mutex, so the
// scheduler may call back synchronously.  OnProgress() may also be invoked
// synchronously from inside StartPartialDownload() or CancelDownload(): it
// then defers the refresh to the caller instead of locking the stream again.
// Transport queries happen with the stream mutex released.
class DownloadWindowManager {
 public:
  // None of the pointers may be null; all must outlive the manager.
  // Throws std::invalid_argument otherwise.  Registers a state listener on
  // |scheduler|.
  DownloadWindowManager(transport::ITransportClient* transport,
                        scheduler::ConcurrencyScheduler* scheduler,
                        config::SettingsProvider* settings);
  ~DownloadWindowManager();

  DownloadWindowManager(const DownloadWindowManager&) = delete;
  DownloadWindowManager& operator=(const DownloadWindowManager&) = delete;

  // Register a stream.  |mime| may be empty; the mode is then sniffed from the
  // first bytes on disk.
  StreamError OpenStream(const StreamId& stream_id, int32_t local_id,
                         std::optional<uint64_t> size_hint, const std::string& mime);

  // Cancel the live job, wake waiters with kCancelled and forget the stream.
  void CloseStream(const StreamId& stream_id);

  bool HasStream(const StreamId& stream_id) const;

  // InitialStart: window [0, initial prefix) (unbounded for full-file media).
  // Seek: window [target, target + seek margin), capped at max window and
  // clipped to the file size.  A target inside the live window is reused.
  // Replacing a window wakes in-flight EnsureReady() calls with kCancelled.
  WindowOpenResult OpenWindow(const StreamId& stream_id, uint64_t target_offset,
                              EnsureMode mode);

  // Block until the requirement is met, the deadline passes, the job fails,
  // or the wait is superseded.  required_end == 0 with kInitialStart means
  // "initial prefix"; a kInitialStart requirement beyond max_window_bytes
  // widens the window to the whole file.  timeout_ms <= 0 uses
  // ensure_ready_timeout_ms.  Returns immediately without polling when
  // already satisfied.
  EnsureResult EnsureReady(const StreamId& stream_id, uint64_t required_end,
                           EnsureMode mode, int64_t timeout_ms);

  // Non-blocking transport refresh for the current window.  Returns
  // kStaleLocalIdentity when the transport no longer knows the local id.
  StreamError Refresh(const StreamId& stream_id);

  // Non-blocking: whole file present, or progressive prefix validates Complete.
  bool IsReadyForPlayback(const StreamId& stream_id);

  // Point the stream at a re-resolved local id.  Cancels the live job and
  // drops the window; the next EnsureReady() opens a fresh one.
  void Rebind(const StreamId& stream_id, int32_t new_local_id);

  // Transport progress hook.  Refreshes the stream bound to |local_id|,
  // completes its job when the window is fully on disk, and wakes waiters.
  void OnProgress(int32_t local_id);

  std::optional<DownloadWindow> CurrentWindow(const StreamId& stream_id) const;
  std::optional<JobId> CurrentJob(const StreamId& stream_id) const;
  std::optional<ConfirmedRange> Confirmed(const StreamId& stream_id) const;
  std::optional<WindowPhase> PhaseOf(const StreamId& stream_id) const;
  std::optional<container::PlaybackMode> ModeOf(const StreamId& stream_id) const;

 private:
  using Clock = std::chrono::steady_clock;

  struct StreamState {
    std::mutex mutex;
    std::condition_variable cv;

    StreamId stream_id;
    int32_t local_id = 0;
    std::optional<uint64_t> total_size;
    std::optional<container::PlaybackMode> mode;  // nullopt until sniffed

    WindowPhase phase = WindowPhase::kIdle;
    bool has_window = false;
    DownloadWindow window;
    JobId job = kInvalidJobId;
    // Anchor for kSeek windows; 0 after kInitialStart.
    uint64_t seek_target = 0;

    // Last transport observation.
    std::string local_path;
    bool file_complete = false;

    // Container tracking for the window starting at 0.
    uint64_t validated_len = 0;
    std::optional<container::ContainerValidationResult> last_validation;
    bool container_complete = false;
    std::optional<Clock::time_point> incomplete_since;

    bool closed = false;
    // Bumped by external supersession (seek, rebind, close); waiters that
    // observe a change return kCancelled.
    uint64_t wait_epoch = 0;
    // Bumped without the mutex by progress / job notifications.
    std::atomic<uint64_t> progress_seq{0};
    // Progress that arrived while the stream mutex was held.
    std::atomic<bool> deferred_progress{false};
  };

  enum class Verdict { kReady, kWaiting, kFailed };

  struct Evaluation {
    Verdict verdict = Verdict::kWaiting;
    StreamError error = StreamError::kNone;
    std::string detail;
  };

  std::shared_ptr<StreamState> FindStream(const StreamId& stream_id) const;
  std::shared_ptr<StreamState> FindByLocalId(int32_t local_id) const;

  // Window transitions (stream mutex held).
  WindowOpenResult OpenWindowLocked(StreamState& st, uint64_t target, EnsureMode mode,
                                    const config::StreamingSettings& s);
  void ReplaceWindowLocked(StreamState& st, uint64_t start, uint64_t size,
                           const config::StreamingSettings& s, const char* reason);
  void GrowWindowLocked(StreamState& st, uint64_t needed_end,
                        const config::StreamingSettings& s);
  // Grow the window at offset 0 to cover |required_end|, unbounded when that
  // is beyond max_window_bytes.
  void CoverFromStartLocked(StreamState& st, uint64_t required_end,
                            const config::StreamingSettings& s);
  void SwitchToFullFileLocked(StreamState& st, const config::StreamingSettings& s,
                              const std::string& reason);
  uint64_t ClipToFile(const StreamState& st, uint64_t start, uint64_t size) const;

  // Fold a transport observation into the window.  Keeps the prefix
  // monotonic and completes the job once the window is fully on disk.
  void ApplyFileStateLocked(StreamState& st, const transport::LocalFileState& fs);

  // Query the transport with the stream mutex released.
  std::optional<transport::FileStateResult> RefreshUnlocked(
      std::unique_lock<std::mutex>& lock, StreamState& st);

  void DetectModeLocked(StreamState& st, const config::StreamingSettings& s);
  uint64_t RequirementFor(const StreamState& st, uint64_t required_end, EnsureMode mode,
                          const config::StreamingSettings& s) const;
  bool WindowCoversLocked(const StreamState& st, uint64_t required_end,
                          EnsureMode mode) const;
  bool SatisfiedLocked(const StreamState& st, uint64_t required, EnsureMode mode) const;
  Evaluation EvaluateLocked(StreamState& st, uint64_t required, EnsureMode mode,
                            const config::StreamingSettings& s);
  Evaluation EvaluateContainerLocked(StreamState& st, uint64_t required,
                                     const config::StreamingSettings& s);
  bool ProgressiveReadyLocked(StreamState& st, const config::StreamingSettings& s);

  void OnJobStateChanged(const scheduler::DownloadJob& job);
  void Notify(StreamState& st);
  void FlushDeferredProgress(StreamState& st);

  transport::ITransportClient* transport_;
  scheduler::ConcurrencyScheduler* scheduler_;
  config::SettingsProvider* settings_;

  mutable std::mutex map_mutex_;
  std::unordered_map<StreamId, std::shared_ptr<StreamState>> streams_;
  std::unordered_map<int32_t, StreamId> by_local_id_;
  // Cleared in the destructor so late scheduler callbacks become no-ops.
  std::shared_ptr<std::atomic<bool>> alive_;
};

}  // namespace streamcache::window

#endif  // STREAMCACHE_WINDOW_DOWNLOAD_WINDOW_MANAGER_HPP_
