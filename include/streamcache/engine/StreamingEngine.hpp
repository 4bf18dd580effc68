// Repository: Retrovue-streamcache
// Component: Streaming Engine
// Purpose: Public facade.  Wires resolver, scheduler, window manager, reader
//          and thumbnail prefetcher over one injected transport and exposes
//          open / ensure / read / seek / close on stream handles.
// Copyright (c) 2025 RetroVue

#ifndef STREAMCACHE_ENGINE_STREAMING_ENGINE_HPP_
#define STREAMCACHE_ENGINE_STREAMING_ENGINE_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "streamcache/config/StreamingSettings.hpp"
#include "streamcache/engine/StreamTypes.hpp"
#include "streamcache/prefetch/ThumbnailPrefetcher.hpp"
#include "streamcache/reader/ZeroCopyFileReader.hpp"
#include "streamcache/resolver/RemoteIdentityResolver.hpp"
#include "streamcache/scheduler/ConcurrencyScheduler.hpp"
#include "streamcache/transport/ITransportClient.hpp"
#include "streamcache/window/DownloadWindowManager.hpp"

namespace streamcache {

// StreamingEngine
//
// One video stream per remote id: a second OpenStream() for a remote id that
// is already open fails with kStreamAlreadyOpen.
//
// Stale local ids: when the transport reports the bound local id as unknown
// during EnsureBytesAvailable() or Read(), the engine invalidates the
// resolver entry, re-resolves, rebinds the stream and retries the operation
// exactly once.  A second staleness is surfaced as kStaleLocalIdentity.
//
// Read() never waits for the network; bytes outside the confirmed range are
// refused with kRangeNotReady.
class StreamingEngine {
 public:
  // Neither pointer may be null; both must outlive the engine.  Throws
  // std::invalid_argument otherwise.  Starts the prefetch worker.
  StreamingEngine(transport::ITransportClient* transport, config::SettingsProvider* settings);
  ~StreamingEngine();

  StreamingEngine(const StreamingEngine&) = delete;
  StreamingEngine& operator=(const StreamingEngine&) = delete;

  // Resolve, register the stream and open its initial window.  |mime| may be
  // empty.
  OpenResult OpenStream(const StreamIdentity& identity, const std::string& mime = "");

  // upto_offset == 0 with kInitialStart means "initial prefix".  kSeek waits
  // for [seek position, upto_offset); a range wider than max_window_bytes or
  // ending before the seek position fails with kRangeOutsideWindow.
  // timeout_ms <= 0 uses the configured ensure-ready timeout.
  EnsureResult EnsureBytesAvailable(StreamHandle handle, uint64_t upto_offset, EnsureMode mode,
                                    int64_t timeout_ms = 0);

  ReadResult Read(StreamHandle handle, uint64_t position, uint8_t* buffer, size_t length);

  // Move the playback position.  Wakes pending EnsureBytesAvailable() calls
  // with kCancelled when the window is replaced.
  StreamError Seek(StreamHandle handle, uint64_t offset);

  StreamError Close(StreamHandle handle);

  bool IsReadyForPlayback(StreamHandle handle);

  // Foreground buffering signal for prefetch backpressure.
  void SetVideoBuffering(bool buffering);

  void OfferThumbnails(const std::vector<std::string>& remote_ids);

  // Transport progress hook for |local_id|.
  void OnFileUpdated(int32_t local_id);

  std::optional<StreamId> StreamIdOf(StreamHandle handle) const;
  std::optional<int32_t> LocalIdOf(StreamHandle handle) const;
  size_t OpenStreamCount() const;

  resolver::RemoteIdentityResolver& resolver() { return *resolver_; }
  scheduler::ConcurrencyScheduler& scheduler() { return *scheduler_; }
  window::DownloadWindowManager& windows() { return *windows_; }
  reader::ZeroCopyFileReader& file_reader() { return *reader_; }
  prefetch::ThumbnailPrefetcher& prefetcher() { return *prefetcher_; }

 private:
  struct Session {
    std::mutex mutex;
    StreamHandle handle = kInvalidStreamHandle;
    StreamId stream_id;
    std::string remote_id;
    int32_t local_id = 0;
    uint64_t seek_offset = 0;
    reader::ReaderHandle reader = reader::kInvalidReaderHandle;
  };

  static StreamId VideoStreamId(const std::string& remote_id) { return "video:" + remote_id; }

  std::shared_ptr<Session> FindSession(StreamHandle handle) const;
  int32_t BoundLocalId(Session& session);

  // Invalidate, re-resolve and rebind after |observed_local_id| went stale,
  // then reopen a window at |offset| in |mode|.  Succeeds without touching
  // the session when another caller already rebound it.
  StreamError RecoverStale(Session& session, int32_t observed_local_id, EnsureMode mode,
                           uint64_t offset);

  ReadResult ReadOnce(Session& session, uint64_t position, uint8_t* buffer, size_t length);

  transport::ITransportClient* transport_;
  config::SettingsProvider* settings_;

  std::unique_ptr<resolver::RemoteIdentityResolver> resolver_;
  std::unique_ptr<scheduler::ConcurrencyScheduler> scheduler_;
  // Declared after the scheduler so it is destroyed first.
  std::unique_ptr<window::DownloadWindowManager> windows_;
  std::unique_ptr<reader::ZeroCopyFileReader> reader_;
  std::unique_ptr<prefetch::ThumbnailPrefetcher> prefetcher_;

  int settings_token_ = 0;

  mutable std::mutex sessions_mutex_;
  StreamHandle next_handle_ = 1;
  std::unordered_map<StreamHandle, std::shared_ptr<Session>> sessions_;
};

}  // namespace streamcache

#endif  // STREAMCACHE_ENGINE_STREAMING_ENGINE_HPP_
