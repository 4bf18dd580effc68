// Repository: Retrovue-streamcache
// Component: Streaming Engine Implementation
// Copyright (c) 2025 RetroVue

#include "streamcache/engine/StreamingEngine.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include "streamcache/util/Logger.hpp"

namespace streamcache {

using streamcache::util::Logger;

namespace {

scheduler::SchedulerLimits LimitsFrom(const config::StreamingSettings& s) {
  scheduler::SchedulerLimits limits;
  limits.global_limit = s.max_global_downloads;
  limits.video_limit = s.max_video_downloads;
  limits.thumb_limit = s.max_thumb_downloads;
  return limits;
}

}  // namespace

StreamingEngine::StreamingEngine(transport::ITransportClient* transport,
                                 config::SettingsProvider* settings)
    : transport_(transport), settings_(settings) {
  if (transport_ == nullptr || settings_ == nullptr) {
    throw std::invalid_argument("StreamingEngine: null transport or settings");
  }

  resolver_ = std::make_unique<resolver::RemoteIdentityResolver>(transport_);

  auto* t = transport_;
  scheduler_ = std::make_unique<scheduler::ConcurrencyScheduler>(
      LimitsFrom(settings_->Current()),
      [t](const scheduler::DownloadJob& job) {
        return t->StartPartialDownload(job.local_id, job.offset, job.required_bytes,
                                       job.priority);
      },
      [t](const scheduler::DownloadJob& job) { t->CancelDownload(job.local_id); });

  windows_ = std::make_unique<window::DownloadWindowManager>(transport_, scheduler_.get(),
                                                             settings_);
  reader_ = std::make_unique<reader::ZeroCopyFileReader>();
  prefetcher_ = std::make_unique<prefetch::ThumbnailPrefetcher>(
      transport_, resolver_.get(), scheduler_.get(), settings_);

  auto* sched = scheduler_.get();
  settings_token_ = settings_->Subscribe([sched](const config::StreamingSettings& s) {
    sched->SetLimits(LimitsFrom(s));
  });

  prefetcher_->Start();
}

StreamingEngine::~StreamingEngine() {
  settings_->Unsubscribe(settings_token_);
  prefetcher_->Stop();

  std::unordered_map<StreamHandle, std::shared_ptr<Session>> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions.swap(sessions_);
  }
  for (auto& entry : sessions) {
    auto& session = entry.second;
    std::lock_guard<std::mutex> lock(session->mutex);
    if (session->reader != reader::kInvalidReaderHandle) {
      reader_->Close(session->reader);
    }
    windows_->CloseStream(session->stream_id);
  }
}

std::shared_ptr<StreamingEngine::Session> StreamingEngine::FindSession(
    StreamHandle handle) const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto it = sessions_.find(handle);
  return it == sessions_.end() ? nullptr : it->second;
}

int32_t StreamingEngine::BoundLocalId(Session& session) {
  std::lock_guard<std::mutex> lock(session.mutex);
  return session.local_id;
}

// =============================================================================
// Open / Close
// =============================================================================

OpenResult StreamingEngine::OpenStream(const StreamIdentity& identity, const std::string& mime) {
  if (identity.remote_id.empty()) {
    return OpenResult::Failure(StreamError::kResolutionFailed, "empty remote id");
  }

  resolver::ResolveOutcome resolved = resolver_->Resolve(identity.remote_id);
  if (!resolved.ok) {
    Logger::Error("[StreamingEngine] OPEN_FAILED remote_id=" + identity.remote_id +
                  " error=RESOLUTION_FAILED detail=\"" + resolved.detail + "\"");
    return OpenResult::Failure(StreamError::kResolutionFailed, resolved.detail);
  }

  const StreamId stream_id = VideoStreamId(identity.remote_id);
  const std::optional<uint64_t> size = identity.size_hint ? identity.size_hint
                                                          : resolved.size_hint;
  StreamError err = windows_->OpenStream(stream_id, resolved.local_id, size, mime);
  if (err != StreamError::kNone) {
    return OpenResult::Failure(err, stream_id);
  }

  auto session = std::make_shared<Session>();
  session->stream_id = stream_id;
  session->remote_id = identity.remote_id;
  session->local_id = resolved.local_id;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    session->handle = next_handle_++;
    sessions_.emplace(session->handle, session);
  }

  windows_->OpenWindow(stream_id, 0, EnsureMode::kInitialStart);

  std::ostringstream oss;
  oss << "[StreamingEngine] STREAM_OPENED handle=" << session->handle
      << " stream=" << stream_id
      << " local_id=" << resolved.local_id
      << " mime=" << (mime.empty() ? std::string("-") : mime);
  Logger::Info(oss.str());
  return OpenResult::Success(session->handle);
}

StreamError StreamingEngine::Close(StreamHandle handle) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(handle);
    if (it == sessions_.end()) return StreamError::kInvalidHandle;
    session = std::move(it->second);
    sessions_.erase(it);
  }

  {
    std::lock_guard<std::mutex> lock(session->mutex);
    if (session->reader != reader::kInvalidReaderHandle) {
      reader_->Close(session->reader);
      session->reader = reader::kInvalidReaderHandle;
    }
  }
  windows_->CloseStream(session->stream_id);
  Logger::Info("[StreamingEngine] STREAM_CLOSED handle=" + std::to_string(handle) +
               " stream=" + session->stream_id);
  return StreamError::kNone;
}

// =============================================================================
// Stale local identity
// =============================================================================

StreamError StreamingEngine::RecoverStale(Session& session, int32_t observed_local_id,
                                          EnsureMode mode, uint64_t offset) {
  std::lock_guard<std::mutex> lock(session.mutex);
  if (session.local_id != observed_local_id) {
    return StreamError::kNone;
  }

  resolver_->InvalidateIfStale(session.remote_id, observed_local_id);
  resolver::ResolveOutcome resolved = resolver_->Resolve(session.remote_id);
  if (!resolved.ok) {
    Logger::Error("[StreamingEngine] STALE_RECOVERY_FAILED stream=" + session.stream_id +
                  " detail=\"" + resolved.detail + "\"");
    return StreamError::kResolutionFailed;
  }
  if (resolved.local_id == observed_local_id) {
    Logger::Error("[StreamingEngine] STALE_RECOVERY_FAILED stream=" + session.stream_id +
                  " detail=\"transport re-issued stale local id " +
                  std::to_string(observed_local_id) + "\"");
    return StreamError::kStaleLocalIdentity;
  }

  if (session.reader != reader::kInvalidReaderHandle) {
    reader_->Close(session.reader);
    session.reader = reader::kInvalidReaderHandle;
  }
  windows_->Rebind(session.stream_id, resolved.local_id);
  session.local_id = resolved.local_id;
  windows_->OpenWindow(session.stream_id, mode == EnsureMode::kSeek ? offset : 0, mode);

  std::ostringstream oss;
  oss << "[StreamingEngine] STALE_RECOVERED stream=" << session.stream_id
      << " remote_id=" << session.remote_id
      << " old_local_id=" << observed_local_id
      << " new_local_id=" << resolved.local_id;
  Logger::Warn(oss.str());
  return StreamError::kNone;
}

// =============================================================================
// Readiness
// =============================================================================

EnsureResult StreamingEngine::EnsureBytesAvailable(StreamHandle handle, uint64_t upto_offset,
                                                   EnsureMode mode, int64_t timeout_ms) {
  auto session = FindSession(handle);
  if (!session) return EnsureResult::Failure(StreamError::kInvalidHandle, "unknown handle");

  const int32_t observed = BoundLocalId(*session);
  EnsureResult result = windows_->EnsureReady(session->stream_id, upto_offset, mode, timeout_ms);
  if (result.ready || result.error != StreamError::kStaleLocalIdentity) {
    return result;
  }

  // The new window is anchored where the old one was: the last seek target.
  uint64_t target = 0;
  {
    std::lock_guard<std::mutex> lock(session->mutex);
    target = session->seek_offset;
  }
  StreamError err = RecoverStale(*session, observed, mode, target);
  if (err != StreamError::kNone) {
    return EnsureResult::Failure(err, "stale local id " + std::to_string(observed));
  }
  return windows_->EnsureReady(session->stream_id, upto_offset, mode, timeout_ms);
}

bool StreamingEngine::IsReadyForPlayback(StreamHandle handle) {
  auto session = FindSession(handle);
  if (!session) return false;
  return windows_->IsReadyForPlayback(session->stream_id);
}

// =============================================================================
// Read / Seek
// =============================================================================

ReadResult StreamingEngine::ReadOnce(Session& session, uint64_t position, uint8_t* buffer,
                                     size_t length) {
  StreamError err = windows_->Refresh(session.stream_id);
  if (err != StreamError::kNone) return ReadResult::Failure(err);

  std::optional<window::ConfirmedRange> confirmed = windows_->Confirmed(session.stream_id);
  if (!confirmed) return ReadResult::Failure(StreamError::kRangeNotReady);

  reader::ReaderHandle rh = reader::kInvalidReaderHandle;
  {
    std::lock_guard<std::mutex> lock(session.mutex);
    if (session.reader == reader::kInvalidReaderHandle) {
      reader::ReaderOpenResult opened = reader_->Open(session.stream_id, confirmed->local_path);
      if (!opened.ok) return ReadResult::Failure(opened.error);
      session.reader = opened.handle;
    }
    rh = session.reader;
  }

  reader_->Confirm(rh, confirmed->start, confirmed->end);
  if (confirmed->file_complete && confirmed->total_size) {
    reader_->MarkComplete(rh, *confirmed->total_size);
  }
  return reader_->Read(rh, position, buffer, length);
}

ReadResult StreamingEngine::Read(StreamHandle handle, uint64_t position, uint8_t* buffer,
                                 size_t length) {
  auto session = FindSession(handle);
  if (!session) return ReadResult::Failure(StreamError::kInvalidHandle);

  const int32_t observed = BoundLocalId(*session);
  ReadResult result = ReadOnce(*session, position, buffer, length);
  if (result.ok || result.error != StreamError::kStaleLocalIdentity) {
    return result;
  }

  const EnsureMode mode = position == 0 ? EnsureMode::kInitialStart : EnsureMode::kSeek;
  StreamError err = RecoverStale(*session, observed, mode, position);
  if (err != StreamError::kNone) return ReadResult::Failure(err);
  return ReadOnce(*session, position, buffer, length);
}

StreamError StreamingEngine::Seek(StreamHandle handle, uint64_t offset) {
  auto session = FindSession(handle);
  if (!session) return StreamError::kInvalidHandle;
  {
    std::lock_guard<std::mutex> lock(session->mutex);
    session->seek_offset = offset;
  }
  window::WindowOpenResult opened =
      windows_->OpenWindow(session->stream_id, offset, EnsureMode::kSeek);
  if (!opened.ok) return opened.error;

  std::ostringstream oss;
  oss << "[StreamingEngine] SEEK handle=" << handle
      << " offset=" << offset
      << " window_start=" << opened.window.start_offset
      << " reused=" << (opened.reused ? "true" : "false");
  Logger::Debug(oss.str());
  return StreamError::kNone;
}

// =============================================================================
// Prefetch / Notifications
// =============================================================================

void StreamingEngine::SetVideoBuffering(bool buffering) {
  prefetcher_->SetBuffering(buffering);
}

void StreamingEngine::OfferThumbnails(const std::vector<std::string>& remote_ids) {
  prefetcher_->Offer(remote_ids);
}

void StreamingEngine::OnFileUpdated(int32_t local_id) {
  windows_->OnProgress(local_id);
  prefetcher_->OnProgress(local_id);
}

std::optional<StreamId> StreamingEngine::StreamIdOf(StreamHandle handle) const {
  auto session = FindSession(handle);
  if (!session) return std::nullopt;
  return session->stream_id;
}

std::optional<int32_t> StreamingEngine::LocalIdOf(StreamHandle handle) const {
  auto session = FindSession(handle);
  if (!session) return std::nullopt;
  std::lock_guard<std::mutex> lock(session->mutex);
  return session->local_id;
}

size_t StreamingEngine::OpenStreamCount() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

}  // namespace streamcache
