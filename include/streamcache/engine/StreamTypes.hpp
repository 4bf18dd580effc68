// Repository: Retrovue-streamcache
// Component: Stream Types
// Purpose: Identity, error codes and result structs shared by the resolver,
//          scheduler, window manager, reader and engine facade.
// Copyright (c) 2025 RetroVue

#ifndef STREAMCACHE_ENGINE_STREAM_TYPES_HPP_
#define STREAMCACHE_ENGINE_STREAM_TYPES_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace streamcache {

// =============================================================================
// Error Codes
// =============================================================================

enum class StreamError {
  kNone,
  kResolutionFailed,     // transport could not map remoteId -> localId
  kStaleLocalIdentity,   // localId no longer valid; re-resolve once, then surface
  kDownloadTimeout,      // readiness deadline passed (job may still be running)
  kDownloadFailed,       // transport reported a failed transfer; no internal retry
  kContainerInvalid,     // box walk found a malformed header; never ready
  kCancelled,            // superseded by seek or closed while waiting
  kInvalidHandle,        // unknown or already-closed stream handle
  kStreamAlreadyOpen,    // a stream for this remoteId is already open
  kRangeNotReady,        // read past the confirmed prefix
  kIoError,              // open/pread failure on the cache file
  kInvalidUri,           // malformed tg://file URI
  kReaderBusy,           // exclusive reader already held for this stream
  kRangeOutsideWindow,   // seek requirement ends before the window or exceeds max window
};

inline const char* StreamErrorToString(StreamError e) {
  switch (e) {
    case StreamError::kNone: return "NONE";
    case StreamError::kResolutionFailed: return "RESOLUTION_FAILED";
    case StreamError::kStaleLocalIdentity: return "STALE_LOCAL_IDENTITY";
    case StreamError::kDownloadTimeout: return "DOWNLOAD_TIMEOUT";
    case StreamError::kDownloadFailed: return "DOWNLOAD_FAILED";
    case StreamError::kContainerInvalid: return "CONTAINER_INVALID";
    case StreamError::kCancelled: return "CANCELLED";
    case StreamError::kInvalidHandle: return "INVALID_HANDLE";
    case StreamError::kStreamAlreadyOpen: return "STREAM_ALREADY_OPEN";
    case StreamError::kRangeNotReady: return "RANGE_NOT_READY";
    case StreamError::kIoError: return "IO_ERROR";
    case StreamError::kInvalidUri: return "INVALID_URI";
    case StreamError::kReaderBusy: return "READER_BUSY";
    case StreamError::kRangeOutsideWindow: return "RANGE_OUTSIDE_WINDOW";
  }
  return "UNKNOWN";
}

// =============================================================================
// Identity
// =============================================================================

// remote_id is the stable key.  local_id is session-scoped and never
// persisted; it is filled in by the resolver.
struct StreamIdentity {
  std::string remote_id;
  std::optional<int32_t> local_id;
  std::optional<uint64_t> size_hint;
};

// Streams are keyed by remote_id; at most one open stream per remote_id.
using StreamId = std::string;

// Opaque handle returned by StreamingEngine::OpenStream.  0 is never issued.
using StreamHandle = uint64_t;
inline constexpr StreamHandle kInvalidStreamHandle = 0;

// =============================================================================
// Download Classes
// =============================================================================

enum class DownloadKind { kVideo, kThumbnail };

inline const char* DownloadKindToString(DownloadKind k) {
  switch (k) {
    case DownloadKind::kVideo: return "VIDEO";
    case DownloadKind::kThumbnail: return "THUMBNAIL";
  }
  return "UNKNOWN";
}

enum class JobState { kQueued, kActive, kDone, kFailed, kCancelled };

inline const char* JobStateToString(JobState s) {
  switch (s) {
    case JobState::kQueued: return "QUEUED";
    case JobState::kActive: return "ACTIVE";
    case JobState::kDone: return "DONE";
    case JobState::kFailed: return "FAILED";
    case JobState::kCancelled: return "CANCELLED";
  }
  return "UNKNOWN";
}

inline bool IsTerminal(JobState s) {
  return s == JobState::kDone || s == JobState::kFailed || s == JobState::kCancelled;
}

using JobId = uint64_t;
inline constexpr JobId kInvalidJobId = 0;

// =============================================================================
// Readiness
// =============================================================================

enum class EnsureMode {
  kInitialStart,  // cold start from offset 0; container-aware for progressive media
  kSeek,          // byte-threshold readiness at a new playback position
};

inline const char* EnsureModeToString(EnsureMode m) {
  switch (m) {
    case EnsureMode::kInitialStart: return "INITIAL_START";
    case EnsureMode::kSeek: return "SEEK";
  }
  return "UNKNOWN";
}

// Byte range currently being fetched for a stream.  requested_size == 0 means
// unbounded (to end of file).
struct DownloadWindow {
  StreamId stream_id;
  uint64_t start_offset = 0;
  uint64_t requested_size = 0;
  uint64_t downloaded_prefix_len = 0;  // contiguous bytes from start_offset
  bool complete = false;

  bool Unbounded() const { return requested_size == 0; }

  // One past the last byte this window asks for; UINT64_MAX when unbounded.
  uint64_t End() const {
    return Unbounded() ? UINT64_MAX : start_offset + requested_size;
  }

  // One past the last byte confirmed on disk.
  uint64_t ConfirmedEnd() const { return start_offset + downloaded_prefix_len; }
};

// =============================================================================
// Result Structs
// =============================================================================

struct EnsureResult {
  bool ready;
  StreamError error;
  std::string local_path;
  std::string detail;

  static EnsureResult Success(const std::string& path) {
    return {true, StreamError::kNone, path, ""};
  }

  static EnsureResult Failure(StreamError err, const std::string& detail = "") {
    return {false, err, "", detail};
  }
};

struct OpenResult {
  bool ok;
  StreamError error;
  StreamHandle handle;
  std::string detail;

  static OpenResult Success(StreamHandle h) {
    return {true, StreamError::kNone, h, ""};
  }

  static OpenResult Failure(StreamError err, const std::string& detail = "") {
    return {false, err, kInvalidStreamHandle, detail};
  }
};

struct ReadResult {
  bool ok;
  StreamError error;
  size_t bytes_read;

  static ReadResult Success(size_t n) { return {true, StreamError::kNone, n}; }
  static ReadResult Failure(StreamError err) { return {false, err, 0}; }
};

}  // namespace streamcache

#endif  // STREAMCACHE_ENGINE_STREAM_TYPES_HPP_
