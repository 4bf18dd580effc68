// Repository: Retrovue-streamcache
// Component: Streaming Settings Implementation
// Copyright (c) 2025 RetroVue

#include "streamcache/config/StreamingSettings.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <sstream>

#include "streamcache/util/Logger.hpp"

namespace streamcache::config {

using streamcache::util::Logger;

namespace {

template <typename T>
void ClampField(const char* name, T& value, T lo, T hi,
                std::vector<std::string>* notes) {
  T clamped = std::clamp(value, lo, hi);
  if (clamped != value) {
    if (notes) {
      std::ostringstream oss;
      oss << name << "=" << value << " clamped to " << clamped;
      notes->push_back(oss.str());
    }
    value = clamped;
  }
}

// Parses a base-10 integer env var.  Unset or malformed values leave |out|
// untouched; malformed ones are reported.
template <typename T>
void ReadEnvInt(const char* name, T& out) {
  const char* raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') return;
  errno = 0;
  char* end = nullptr;
  long long v = std::strtoll(raw, &end, 10);
  if (errno != 0 || end == raw || *end != '\0' || v < 0) {
    Logger::Warn(std::string("[SettingsProvider] IGNORED_ENV ") + name + "=" + raw);
    return;
  }
  out = static_cast<T>(v);
}

void ReadEnvBool(const char* name, bool& out) {
  const char* raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') return;
  std::string v(raw);
  if (v == "1" || v == "true" || v == "yes" || v == "on") {
    out = true;
  } else if (v == "0" || v == "false" || v == "no" || v == "off") {
    out = false;
  } else {
    Logger::Warn(std::string("[SettingsProvider] IGNORED_ENV ") + name + "=" + raw);
  }
}

}  // namespace

StreamingSettings Sanitize(const StreamingSettings& in,
                           std::vector<std::string>* notes) {
  StreamingSettings s = in;
  ClampField("max_global_downloads", s.max_global_downloads, 1, 20, notes);
  ClampField("max_video_downloads", s.max_video_downloads, 1, 10, notes);
  ClampField("max_thumb_downloads", s.max_thumb_downloads, 1, 10, notes);
  ClampField("video_priority", s.video_priority, 1, 32, notes);
  ClampField("thumb_priority", s.thumb_priority, 1, 32, notes);
  ClampField<uint64_t>("initial_prefix_bytes", s.initial_prefix_bytes,
                       4 * 1024, 64ull * 1024 * 1024, notes);
  ClampField<uint64_t>("seek_margin_bytes", s.seek_margin_bytes,
                       4 * 1024, 64ull * 1024 * 1024, notes);
  // The cap can never be smaller than the cold-start request.
  ClampField<uint64_t>("max_window_bytes", s.max_window_bytes,
                       s.initial_prefix_bytes, 4096ull * 1024 * 1024, notes);
  ClampField<int64_t>("poll_interval_ms", s.poll_interval_ms, 10, 5'000, notes);
  ClampField<int64_t>("ensure_ready_timeout_ms", s.ensure_ready_timeout_ms,
                      2'000, 60'000, notes);
  ClampField<uint64_t>("max_prefix_scan_bytes", s.max_prefix_scan_bytes,
                       s.initial_prefix_bytes, s.max_window_bytes, notes);
  ClampField<int64_t>("moov_incomplete_timeout_ms", s.moov_incomplete_timeout_ms,
                      0, 60'000, notes);
  ClampField("thumb_batch_size", s.thumb_batch_size, 1, 50, notes);
  ClampField<int64_t>("thumb_item_timeout_ms", s.thumb_item_timeout_ms,
                      100, 120'000, notes);
  return s;
}

SettingsProvider::SettingsProvider(const StreamingSettings& initial)
    : current_(Sanitize(initial)) {}

StreamingSettings SettingsProvider::FromEnvironment() {
  StreamingSettings s;
  ReadEnvInt("STREAMCACHE_MAX_GLOBAL_DOWNLOADS", s.max_global_downloads);
  ReadEnvInt("STREAMCACHE_MAX_VIDEO_DOWNLOADS", s.max_video_downloads);
  ReadEnvInt("STREAMCACHE_MAX_THUMB_DOWNLOADS", s.max_thumb_downloads);
  ReadEnvInt("STREAMCACHE_INITIAL_PREFIX_BYTES", s.initial_prefix_bytes);
  ReadEnvInt("STREAMCACHE_SEEK_MARGIN_BYTES", s.seek_margin_bytes);
  ReadEnvInt("STREAMCACHE_MAX_WINDOW_BYTES", s.max_window_bytes);
  ReadEnvInt("STREAMCACHE_POLL_INTERVAL_MS", s.poll_interval_ms);
  ReadEnvInt("STREAMCACHE_ENSURE_READY_TIMEOUT_MS", s.ensure_ready_timeout_ms);
  ReadEnvInt("STREAMCACHE_THUMB_BATCH_SIZE", s.thumb_batch_size);
  ReadEnvBool("STREAMCACHE_THUMB_PREFETCH", s.thumb_prefetch_enabled);
  ReadEnvBool("STREAMCACHE_THUMB_PAUSE_WHILE_BUFFERING", s.thumb_pause_while_buffering);
  ReadEnvBool("STREAMCACHE_FULL_FILE_FALLBACK", s.full_file_fallback);
  return Sanitize(s);
}

StreamingSettings SettingsProvider::Current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

void SettingsProvider::Update(const StreamingSettings& next) {
  std::vector<std::string> notes;
  StreamingSettings sanitized = Sanitize(next, &notes);
  for (const auto& note : notes) {
    Logger::Warn("[SettingsProvider] " + note);
  }

  std::vector<Listener> to_notify;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = sanitized;
    to_notify.reserve(listeners_.size());
    for (const auto& entry : listeners_) {
      to_notify.push_back(entry.second);
    }
  }

  std::ostringstream oss;
  oss << "[SettingsProvider] SETTINGS_UPDATED global=" << sanitized.max_global_downloads
      << " video=" << sanitized.max_video_downloads
      << " thumb=" << sanitized.max_thumb_downloads
      << " initial_prefix=" << sanitized.initial_prefix_bytes
      << " seek_margin=" << sanitized.seek_margin_bytes
      << " max_window=" << sanitized.max_window_bytes
      << " batch=" << sanitized.thumb_batch_size;
  Logger::Info(oss.str());

  for (const auto& listener : to_notify) {
    listener(sanitized);
  }
}

int SettingsProvider::Subscribe(Listener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  int token = next_token_++;
  listeners_.emplace_back(token, std::move(listener));
  return token;
}

void SettingsProvider::Unsubscribe(int token) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(
      std::remove_if(listeners_.begin(), listeners_.end(),
                     [token](const auto& entry) { return entry.first == token; }),
      listeners_.end());
}

}  // namespace streamcache::config
