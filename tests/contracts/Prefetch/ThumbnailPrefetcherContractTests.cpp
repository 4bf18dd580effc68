// Repository: Retrovue-streamcache
// Component: Thumbnail Prefetcher Contract Tests
// Purpose: Bounded batches, deduplication, buffering pause, per-item timeout
//          and stale-id handling for background thumbnail downloads.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "streamcache/config/StreamingSettings.hpp"
#include "streamcache/prefetch/ThumbnailPrefetcher.hpp"
#include "streamcache/resolver/RemoteIdentityResolver.hpp"
#include "streamcache/scheduler/ConcurrencyScheduler.hpp"

#include "../../fixtures/FakeTransportClient.h"

namespace streamcache::prefetch {
namespace {

using streamcache::config::SettingsProvider;
using streamcache::config::StreamingSettings;
using streamcache::resolver::RemoteIdentityResolver;
using streamcache::scheduler::ConcurrencyScheduler;
using streamcache::scheduler::DownloadJob;
using streamcache::scheduler::SchedulerLimits;
using streamcache::test::FakeTransportClient;

constexpr uint64_t kThumbSize = 16 * 1024;

StreamingSettings PrefetchSettings() {
  StreamingSettings s;
  s.poll_interval_ms = 10;
  s.thumb_batch_size = 2;
  return s;
}

bool WaitFor(const std::function<bool()>& pred, int timeout_ms = 3000) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

class ThumbnailPrefetcherTest : public ::testing::Test {
 protected:
  ThumbnailPrefetcherTest()
      : transport_("prefetch"),
        settings_(PrefetchSettings()),
        scheduler_(
            SchedulerLimits{5, 3, 3},
            [this](const DownloadJob& job) {
              return transport_.StartPartialDownload(job.local_id, job.offset,
                                                     job.required_bytes, job.priority);
            },
            [this](const DownloadJob& job) { transport_.CancelDownload(job.local_id); }),
        resolver_(&transport_),
        prefetcher_(&transport_, &resolver_, &scheduler_, &settings_) {
    transport_.SetProgressCallback(
        [this](int32_t local_id) { prefetcher_.OnProgress(local_id); });
    prefetcher_.SetBatchHook([this](const std::vector<std::string>& batch) {
      std::lock_guard<std::mutex> lock(hook_mutex_);
      batches_.push_back(batch);
    });
  }

  ~ThumbnailPrefetcherTest() override {
    prefetcher_.Stop();
    transport_.SetProgressCallback(nullptr);
  }

  // T<i> -> local 100 + i.
  void AddThumbs(int count) {
    for (int i = 1; i <= count; ++i) {
      transport_.AddFile("T" + std::to_string(i), 100 + i, kThumbSize);
    }
  }

  std::vector<std::string> Ids(int count) const {
    std::vector<std::string> ids;
    for (int i = 1; i <= count; ++i) ids.push_back("T" + std::to_string(i));
    return ids;
  }

  size_t BatchCount() {
    std::lock_guard<std::mutex> lock(hook_mutex_);
    return batches_.size();
  }

  std::vector<std::vector<std::string>> Batches() {
    std::lock_guard<std::mutex> lock(hook_mutex_);
    return batches_;
  }

  void Tweak(const std::function<void(StreamingSettings&)>& fn) {
    StreamingSettings s = settings_.Current();
    fn(s);
    settings_.Update(s);
  }

  FakeTransportClient transport_;
  SettingsProvider settings_;
  ConcurrencyScheduler scheduler_;
  RemoteIdentityResolver resolver_;
  ThumbnailPrefetcher prefetcher_;

  std::mutex hook_mutex_;
  std::vector<std::vector<std::string>> batches_;
};

// -----------------------------------------------------------------------------
// TEST-PREFETCH-001: Offers are deduplicated against pending work
// -----------------------------------------------------------------------------
TEST_F(ThumbnailPrefetcherTest, OfferDeduplicates) {
  prefetcher_.Offer({"T1", "T1", "T2", "", "T2"});
  EXPECT_EQ(prefetcher_.PendingCount(), 2u);
  EXPECT_TRUE(prefetcher_.IsKnown("T1"));
  EXPECT_TRUE(prefetcher_.IsKnown("T2"));
  EXPECT_FALSE(prefetcher_.IsKnown("T3"));

  prefetcher_.Offer({"T2", "T3"});
  EXPECT_EQ(prefetcher_.PendingCount(), 3u);
}

// -----------------------------------------------------------------------------
// TEST-PREFETCH-002: One bounded batch in flight at a time
// -----------------------------------------------------------------------------
TEST_F(ThumbnailPrefetcherTest, BatchesAreBoundedAndSequential) {
  AddThumbs(5);
  prefetcher_.Offer(Ids(5));
  prefetcher_.Start();

  ASSERT_TRUE(WaitFor([this] { return transport_.StartCalls() >= 2; }));
  EXPECT_EQ(BatchCount(), 1u);
  EXPECT_EQ(prefetcher_.InFlightCount(), 2u);
  EXPECT_EQ(prefetcher_.PendingCount(), 3u);

  auto starts = transport_.Starts();
  ASSERT_EQ(starts.size(), 2u);
  EXPECT_EQ(starts[0].priority, 16);
  EXPECT_EQ(starts[0].limit, 0u);
  EXPECT_LE(scheduler_.Snapshot().active_thumb, 3);

  // The first batch has not settled; no second batch yet.
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(BatchCount(), 1u);
  EXPECT_EQ(transport_.StartCalls(), 2);

  // Later items land in cache first so their batches skip them.
  transport_.DeliverAll(103);
  transport_.DeliverAll(104);
  transport_.DeliverAll(105);
  transport_.DeliverAll(101);
  transport_.DeliverAll(102);

  ASSERT_TRUE(WaitFor([this] { return prefetcher_.Stats().batches == 3; }));
  auto batches = Batches();
  ASSERT_EQ(batches.size(), 3u);
  EXPECT_EQ(batches[0], (std::vector<std::string>{"T1", "T2"}));
  EXPECT_EQ(batches[1], (std::vector<std::string>{"T3", "T4"}));
  EXPECT_EQ(batches[2], (std::vector<std::string>{"T5"}));

  PrefetchStats stats = prefetcher_.Stats();
  EXPECT_EQ(stats.submitted, 2u);
  EXPECT_EQ(stats.succeeded, 2u);
  EXPECT_EQ(stats.skipped, 3u);
  EXPECT_EQ(stats.failed, 0u);
  EXPECT_EQ(scheduler_.Snapshot().active_thumb, 0);
}

// -----------------------------------------------------------------------------
// TEST-PREFETCH-003: Completed ids are not fetched again until ClearCache
// -----------------------------------------------------------------------------
TEST_F(ThumbnailPrefetcherTest, CompletedIdsAreRemembered) {
  AddThumbs(1);
  transport_.DeliverAll(101);
  prefetcher_.Start();
  prefetcher_.Offer({"T1"});
  ASSERT_TRUE(WaitFor([this] { return prefetcher_.Stats().skipped == 1; }));

  prefetcher_.Offer({"T1"});
  EXPECT_EQ(prefetcher_.PendingCount(), 0u);
  EXPECT_TRUE(prefetcher_.IsKnown("T1"));
  EXPECT_EQ(transport_.StartCalls(), 0);

  prefetcher_.ClearCache();
  EXPECT_FALSE(prefetcher_.IsKnown("T1"));
  prefetcher_.Offer({"T1"});
  ASSERT_TRUE(WaitFor([this] { return prefetcher_.Stats().skipped == 2; }));
  EXPECT_EQ(transport_.StartCalls(), 0);
}

// -----------------------------------------------------------------------------
// TEST-PREFETCH-004: No new batch while video is buffering
// -----------------------------------------------------------------------------
TEST_F(ThumbnailPrefetcherTest, BufferingPausesNewBatches) {
  AddThumbs(2);
  prefetcher_.SetBuffering(true);
  EXPECT_TRUE(prefetcher_.IsBuffering());
  prefetcher_.Start();
  prefetcher_.Offer(Ids(2));

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_EQ(BatchCount(), 0u);
  EXPECT_EQ(prefetcher_.PendingCount(), 2u);
  EXPECT_EQ(transport_.StartCalls(), 0);

  prefetcher_.SetBuffering(false);
  ASSERT_TRUE(WaitFor([this] { return BatchCount() == 1; }));
  ASSERT_TRUE(WaitFor([this] { return transport_.StartCalls() == 2; }));
}

// -----------------------------------------------------------------------------
// TEST-PREFETCH-005: Buffering is ignored when the pause flag is off
// -----------------------------------------------------------------------------
TEST_F(ThumbnailPrefetcherTest, PauseFlagOffKeepsPrefetching) {
  Tweak([](StreamingSettings& s) { s.thumb_pause_while_buffering = false; });
  AddThumbs(1);
  prefetcher_.SetBuffering(true);
  prefetcher_.Start();
  prefetcher_.Offer({"T1"});
  ASSERT_TRUE(WaitFor([this] { return BatchCount() == 1; }));
}

// -----------------------------------------------------------------------------
// TEST-PREFETCH-006: Disabled prefetch starts nothing until re-enabled
// -----------------------------------------------------------------------------
TEST_F(ThumbnailPrefetcherTest, DisabledFlagHoldsQueue) {
  Tweak([](StreamingSettings& s) { s.thumb_prefetch_enabled = false; });
  AddThumbs(1);
  prefetcher_.Start();
  prefetcher_.Offer({"T1"});

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_EQ(BatchCount(), 0u);

  Tweak([](StreamingSettings& s) { s.thumb_prefetch_enabled = true; });
  ASSERT_TRUE(WaitFor([this] { return BatchCount() == 1; }));
}

// -----------------------------------------------------------------------------
// TEST-PREFETCH-007: An item that never completes times out and is cancelled
// -----------------------------------------------------------------------------
TEST_F(ThumbnailPrefetcherTest, ItemTimeoutCancelsJob) {
  Tweak([](StreamingSettings& s) { s.thumb_item_timeout_ms = 100; });
  AddThumbs(1);
  prefetcher_.Start();
  prefetcher_.Offer({"T1"});

  ASSERT_TRUE(WaitFor([this] { return prefetcher_.Stats().timed_out == 1; }));
  auto cancels = transport_.Cancels();
  EXPECT_NE(std::find(cancels.begin(), cancels.end(), 101), cancels.end());
  EXPECT_FALSE(prefetcher_.IsKnown("T1"));
  EXPECT_EQ(scheduler_.Snapshot().active_thumb, 0);

  // Timed-out ids may be offered again.
  prefetcher_.Offer({"T1"});
  EXPECT_TRUE(prefetcher_.IsKnown("T1"));
}

// -----------------------------------------------------------------------------
// TEST-PREFETCH-008: A stale local id fails the item and drops the mapping
// -----------------------------------------------------------------------------
TEST_F(ThumbnailPrefetcherTest, StaleLocalIdInvalidatesMapping) {
  AddThumbs(1);
  prefetcher_.Start();
  prefetcher_.Offer({"T1"});
  ASSERT_TRUE(WaitFor([this] { return transport_.StartCalls() == 1; }));
  EXPECT_EQ(resolver_.CachedLocalId("T1"), 101);

  transport_.MarkStale(101);
  ASSERT_TRUE(WaitFor([this] { return prefetcher_.Stats().failed == 1; }));
  EXPECT_FALSE(resolver_.CachedLocalId("T1").has_value());
  EXPECT_EQ(scheduler_.Snapshot().active_thumb, 0);
}

// -----------------------------------------------------------------------------
// TEST-PREFETCH-009: Unresolvable ids fail without a job
// -----------------------------------------------------------------------------
TEST_F(ThumbnailPrefetcherTest, ResolutionFailureCountsAsFailed) {
  prefetcher_.Start();
  prefetcher_.Offer({"NOPE"});
  ASSERT_TRUE(WaitFor([this] { return prefetcher_.Stats().failed == 1; }));
  EXPECT_EQ(prefetcher_.Stats().submitted, 0u);
  EXPECT_EQ(transport_.StartCalls(), 0);
}

// -----------------------------------------------------------------------------
// TEST-PREFETCH-010: Stop abandons the in-flight batch and cancels its jobs
// -----------------------------------------------------------------------------
TEST_F(ThumbnailPrefetcherTest, StopCancelsInFlightJobs) {
  AddThumbs(2);
  prefetcher_.Start();
  prefetcher_.Offer(Ids(2));
  ASSERT_TRUE(WaitFor([this] { return transport_.StartCalls() == 2; }));

  prefetcher_.Stop();
  EXPECT_EQ(transport_.CancelCalls(), 2);
  EXPECT_EQ(prefetcher_.InFlightCount(), 0u);
  EXPECT_EQ(scheduler_.Snapshot().active_thumb, 0);

  // Start/Stop are idempotent.
  prefetcher_.Stop();
}

// -----------------------------------------------------------------------------
// TEST-PREFETCH-011: Null dependencies are a construction error
// -----------------------------------------------------------------------------
TEST(ThumbnailPrefetcherConstructionTest, NullDependencyThrows) {
  SettingsProvider settings;
  EXPECT_THROW(ThumbnailPrefetcher(nullptr, nullptr, nullptr, &settings),
               std::invalid_argument);
}

}  // namespace
}  // namespace streamcache::prefetch
