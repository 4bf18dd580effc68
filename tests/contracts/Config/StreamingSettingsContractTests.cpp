// Repository: Retrovue-streamcache
// Component: Streaming Settings Contract Tests
// Purpose: Defaults, sanitizing, environment overrides and hot reload.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <cstdlib>
#include <mutex>
#include <string>
#include <vector>

#include "streamcache/config/StreamingSettings.hpp"
#include "streamcache/util/Logger.hpp"

namespace streamcache::config {
namespace {

using streamcache::util::Logger;

// Scoped STREAMCACHE_* environment override.
class ScopedEnv {
 public:
  ScopedEnv(const char* name, const char* value) : name_(name) {
    ::setenv(name, value, 1);
  }
  ~ScopedEnv() { ::unsetenv(name_); }

 private:
  const char* name_;
};

// -----------------------------------------------------------------------------
// TEST-CONFIG-001: Defaults
// -----------------------------------------------------------------------------
TEST(StreamingSettingsTest, DefaultsMatchDocumentedValues) {
  StreamingSettings s;
  EXPECT_EQ(s.max_global_downloads, 5);
  EXPECT_EQ(s.max_video_downloads, 3);
  EXPECT_EQ(s.max_thumb_downloads, 3);
  EXPECT_EQ(s.initial_prefix_bytes, 256u * 1024u);
  EXPECT_EQ(s.seek_margin_bytes, 1024u * 1024u);
  EXPECT_EQ(s.max_window_bytes, 50ull * 1024 * 1024);
  EXPECT_EQ(s.poll_interval_ms, 100);
  EXPECT_EQ(s.ensure_ready_timeout_ms, 30'000);
  EXPECT_EQ(s.thumb_batch_size, 8);
  EXPECT_TRUE(s.thumb_pause_while_buffering);

  std::vector<std::string> notes;
  Sanitize(s, &notes);
  EXPECT_TRUE(notes.empty());
}

// -----------------------------------------------------------------------------
// TEST-CONFIG-002: Out-of-range values are clamped with one note each
// -----------------------------------------------------------------------------
TEST(StreamingSettingsTest, SanitizeClampsToSupportedRanges) {
  StreamingSettings s;
  s.max_global_downloads = 0;
  s.max_video_downloads = 99;
  s.thumb_batch_size = 500;
  s.ensure_ready_timeout_ms = 10;
  s.max_window_bytes = 1024;  // below the initial prefix

  std::vector<std::string> notes;
  StreamingSettings out = Sanitize(s, &notes);
  EXPECT_EQ(out.max_global_downloads, 1);
  EXPECT_EQ(out.max_video_downloads, 10);
  EXPECT_EQ(out.thumb_batch_size, 50);
  EXPECT_EQ(out.ensure_ready_timeout_ms, 2'000);
  EXPECT_EQ(out.max_window_bytes, out.initial_prefix_bytes);
  EXPECT_GE(notes.size(), 5u);
}

// -----------------------------------------------------------------------------
// TEST-CONFIG-003: Environment overrides; malformed values are ignored
// -----------------------------------------------------------------------------
TEST(StreamingSettingsTest, EnvironmentOverridesDefaults) {
  ScopedEnv global("STREAMCACHE_MAX_GLOBAL_DOWNLOADS", "8");
  ScopedEnv batch("STREAMCACHE_THUMB_BATCH_SIZE", "twelve");
  ScopedEnv pause("STREAMCACHE_THUMB_PAUSE_WHILE_BUFFERING", "off");

  std::vector<std::string> warnings;
  std::mutex warn_mutex;
  Logger::SetWarnSink([&](const std::string& line) {
    std::lock_guard<std::mutex> lock(warn_mutex);
    warnings.push_back(line);
  });
  StreamingSettings s = SettingsProvider::FromEnvironment();
  Logger::SetWarnSink(nullptr);

  EXPECT_EQ(s.max_global_downloads, 8);
  EXPECT_EQ(s.thumb_batch_size, 8);
  EXPECT_FALSE(s.thumb_pause_while_buffering);
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_NE(warnings[0].find("STREAMCACHE_THUMB_BATCH_SIZE"), std::string::npos);
}

// -----------------------------------------------------------------------------
// TEST-CONFIG-004: Update swaps the snapshot and notifies subscribers
// -----------------------------------------------------------------------------
TEST(StreamingSettingsTest, UpdateNotifiesSubscribersWithSanitizedSnapshot) {
  SettingsProvider provider;
  int calls = 0;
  int seen_global = 0;
  int token = provider.Subscribe([&](const StreamingSettings& s) {
    ++calls;
    seen_global = s.max_global_downloads;
    // Re-entrant read from a listener.
    EXPECT_EQ(provider.Current().max_global_downloads, s.max_global_downloads);
  });

  StreamingSettings next = provider.Current();
  next.max_global_downloads = 40;
  provider.Update(next);
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(seen_global, 20);
  EXPECT_EQ(provider.Current().max_global_downloads, 20);

  provider.Unsubscribe(token);
  provider.Update(next);
  EXPECT_EQ(calls, 1);
}

}  // namespace
}  // namespace streamcache::config
