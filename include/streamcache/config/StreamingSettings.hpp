// Repository: Retrovue-streamcache
// Component: Streaming Settings
// Purpose: Runtime configuration for admission control, windowing, readiness
//          polling and thumbnail prefetch.  Hot-reloadable via SettingsProvider.
// Copyright (c) 2025 RetroVue

#ifndef STREAMCACHE_CONFIG_STREAMING_SETTINGS_HPP_
#define STREAMCACHE_CONFIG_STREAMING_SETTINGS_HPP_

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace streamcache::config {

// POD struct - copied out of SettingsProvider as an immutable snapshot.
struct StreamingSettings {
  // Admission control
  int max_global_downloads = 5;               // 1..20
  int max_video_downloads = 3;                // 1..10
  int max_thumb_downloads = 3;                // 1..10
  int video_priority = 32;                    // transport priority, 1..32
  int thumb_priority = 16;                    // transport priority, 1..32

  // Windowing
  uint64_t initial_prefix_bytes = 256 * 1024;        // InitialStart request size
  uint64_t seek_margin_bytes = 1024 * 1024;          // read-ahead past a seek target
  uint64_t max_window_bytes = 50ull * 1024 * 1024;   // cap per stream window

  // Readiness
  int64_t poll_interval_ms = 100;
  int64_t ensure_ready_timeout_ms = 30'000;          // 2s..60s
  uint64_t max_prefix_scan_bytes = 2 * 1024 * 1024;  // NotFound beyond this → full file
  int64_t moov_incomplete_timeout_ms = 5'000;        // Incomplete longer than this → full file
  bool full_file_fallback = true;

  // Thumbnail prefetch
  bool thumb_prefetch_enabled = true;
  int thumb_batch_size = 8;                   // 1..50
  int64_t thumb_item_timeout_ms = 15'000;
  bool thumb_pause_while_buffering = true;
};

// Clamp every field into its supported range.  Returns the sanitized copy
// and appends one human-readable note per adjusted field to |notes|.
StreamingSettings Sanitize(const StreamingSettings& in,
                           std::vector<std::string>* notes = nullptr);

// Thread-safe holder of the current settings snapshot.
//
// Readers call Current() at each decision point (admission, window sizing,
// poll tick, batch start), so an Update() takes effect at the next decision
// without restarting anything.  Subscribers are notified synchronously after
// the snapshot is swapped, outside the provider lock.
class SettingsProvider {
 public:
  using Listener = std::function<void(const StreamingSettings&)>;

  SettingsProvider() = default;
  explicit SettingsProvider(const StreamingSettings& initial);

  SettingsProvider(const SettingsProvider&) = delete;
  SettingsProvider& operator=(const SettingsProvider&) = delete;

  // Defaults overlaid with STREAMCACHE_* environment variables.
  static StreamingSettings FromEnvironment();

  StreamingSettings Current() const;

  void Update(const StreamingSettings& next);

  // Returns a token usable with Unsubscribe().
  int Subscribe(Listener listener);
  void Unsubscribe(int token);

 private:
  mutable std::mutex mutex_;
  StreamingSettings current_;
  int next_token_ = 1;
  std::vector<std::pair<int, Listener>> listeners_;
};

}  // namespace streamcache::config

#endif  // STREAMCACHE_CONFIG_STREAMING_SETTINGS_HPP_
