// Repository: Retrovue-streamcache
// Component: Fake Transport Client
// Purpose: In-process ITransportClient backed by real sparse files under
//          /tmp.  Tests decide which byte ranges "arrive" and when.
// Copyright (c) 2025 RetroVue

#ifndef STREAMCACHE_TESTS_FIXTURES_FAKE_TRANSPORT_CLIENT_H_
#define STREAMCACHE_TESTS_FIXTURES_FAKE_TRANSPORT_CLIENT_H_

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <functional>
#include <iterator>
#include <map>
#include <optional>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "streamcache/transport/ITransportClient.hpp"

namespace streamcache::test {

using transport::FileStateResult;
using transport::ResolveResult;
using transport::TransportStatus;

inline std::string MakeTempRoot(const std::string& tag) {
  std::string root = "/tmp/streamcache_test_" + std::to_string(getpid()) + "_" + tag;
  if (mkdir(root.c_str(), 0755) != 0 && errno != EEXIST) {
    root = "/tmp";
  }
  return root;
}

// Deterministic content for delivered bytes.
inline uint8_t PatternByte(uint64_t offset) {
  return static_cast<uint8_t>((offset * 31 + 7) & 0xFF);
}

class FakeTransportClient : public transport::ITransportClient {
 public:
  struct StartCall {
    int32_t local_id;
    uint64_t offset;
    uint64_t limit;
    int priority;
  };

  explicit FakeTransportClient(const std::string& tag) : root_(MakeTempRoot(tag)) {}

  ~FakeTransportClient() override {
    for (auto& entry : files_) {
      ::unlink(entry.second.path.c_str());
    }
    ::rmdir(root_.c_str());
  }

  // ---------------------------------------------------------------------------
  // Setup
  // ---------------------------------------------------------------------------

  // Register |remote_id| -> |local_id| and create a sparse cache file of |size|.
  void AddFile(const std::string& remote_id, int32_t local_id, uint64_t size,
               bool report_size = true) {
    std::lock_guard<std::mutex> lock(mutex_);
    remotes_[remote_id] = Remote{local_id, report_size ? std::optional<uint64_t>(size)
                                                        : std::nullopt};
    CreateLocked(local_id, size);
  }

  // Point |remote_id| at a new local id (the old one is left as is).
  void Remap(const std::string& remote_id, int32_t new_local_id, uint64_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    remotes_[remote_id].local_id = new_local_id;
    remotes_[remote_id].size_hint = size;
    CreateLocked(new_local_id, size);
  }

  // Queries and starts for |local_id| report NotFound from now on.
  void MarkStale(int32_t local_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    stale_.insert(local_id);
  }

  void RemoveFromDisk(int32_t local_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(local_id);
    if (it != files_.end()) ::unlink(it->second.path.c_str());
  }

  void FailResolve(const std::string& remote_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    remotes_.erase(remote_id);
  }

  void FailStarts(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_starts_ = fail;
  }

  // Write |bytes| at |offset| without marking them as downloaded.  Later
  // Deliver() calls over a staged file only mark ranges present.
  void Stage(int32_t local_id, uint64_t offset, const std::vector<uint8_t>& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    File& f = files_.at(local_id);
    f.staged = true;
    WriteLocked(f, offset, bytes.data(), bytes.size());
  }

  void SetProgressCallback(std::function<void(int32_t)> cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_cb_ = std::move(cb);
  }

  // Runs on the caller's thread after every accepted StartPartialDownload,
  // outside the fake's lock.  Lets a test deliver bytes synchronously.
  void SetStartHook(std::function<void(const StartCall&)> hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    start_hook_ = std::move(hook);
  }

  // ---------------------------------------------------------------------------
  // Arrival
  // ---------------------------------------------------------------------------

  // Mark [offset, offset + len) downloaded, writing pattern bytes unless the
  // file was staged.  Fires the progress callback outside the lock.
  void Deliver(int32_t local_id, uint64_t offset, uint64_t len) {
    std::function<void(int32_t)> cb;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      File& f = files_.at(local_id);
      if (offset >= f.size) return;
      len = std::min(len, f.size - offset);
      if (!f.staged) {
        std::vector<uint8_t> chunk(static_cast<size_t>(len));
        for (size_t i = 0; i < chunk.size(); ++i) chunk[i] = PatternByte(offset + i);
        WriteLocked(f, offset, chunk.data(), chunk.size());
      }
      MarkPresentLocked(f, offset, offset + len);
      cb = progress_cb_;
    }
    if (cb) cb(local_id);
  }

  void DeliverAll(int32_t local_id) {
    uint64_t size = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      size = files_.at(local_id).size;
    }
    Deliver(local_id, 0, size);
  }

  // ---------------------------------------------------------------------------
  // Observation
  // ---------------------------------------------------------------------------

  int ResolveCalls() const { std::lock_guard<std::mutex> l(mutex_); return resolve_calls_; }
  int QueryCalls() const { std::lock_guard<std::mutex> l(mutex_); return query_calls_; }
  int StartCalls() const { std::lock_guard<std::mutex> l(mutex_); return static_cast<int>(starts_.size()); }
  int CancelCalls() const { std::lock_guard<std::mutex> l(mutex_); return static_cast<int>(cancels_.size()); }

  std::vector<StartCall> Starts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return starts_;
  }

  std::vector<int32_t> Cancels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancels_;
  }

  std::string PathOf(int32_t local_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.at(local_id).path;
  }

  // ---------------------------------------------------------------------------
  // ITransportClient
  // ---------------------------------------------------------------------------

  ResolveResult ResolveRemoteFile(const std::string& remote_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++resolve_calls_;
    ResolveResult r;
    auto it = remotes_.find(remote_id);
    if (it == remotes_.end()) {
      r.status = TransportStatus::kNotFound;
      r.message = "remote file not found: " + remote_id;
      return r;
    }
    r.status = TransportStatus::kOk;
    r.info.local_id = it->second.local_id;
    r.info.size_hint = it->second.size_hint;
    return r;
  }

  TransportStatus StartPartialDownload(int32_t local_id, uint64_t offset, uint64_t limit,
                                       int priority) override {
    const StartCall call{local_id, offset, limit, priority};
    std::function<void(const StartCall&)> hook;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      starts_.push_back(call);
      if (stale_.count(local_id) || files_.count(local_id) == 0) {
        return TransportStatus::kNotFound;
      }
      if (fail_starts_) return TransportStatus::kError;
      files_.at(local_id).download_offset = offset;
      hook = start_hook_;
    }
    if (hook) hook(call);
    return TransportStatus::kOk;
  }

  FileStateResult QueryLocalFileState(int32_t local_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++query_calls_;
    FileStateResult r;
    if (stale_.count(local_id) || files_.count(local_id) == 0) {
      r.status = TransportStatus::kNotFound;
      r.message = "local id " + std::to_string(local_id) + " not found";
      return r;
    }
    const File& f = files_.at(local_id);
    r.status = TransportStatus::kOk;
    r.state.local_path = f.path;
    r.state.total_size = f.size;
    r.state.download_offset = f.download_offset;
    r.state.downloaded_prefix_bytes = ContiguousFromLocked(f, f.download_offset);
    r.state.complete = ContiguousFromLocked(f, 0) >= f.size;
    return r;
  }

  void CancelDownload(int32_t local_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    cancels_.push_back(local_id);
  }

 private:
  struct Remote {
    int32_t local_id = 0;
    std::optional<uint64_t> size_hint;
  };

  struct File {
    std::string path;
    uint64_t size = 0;
    uint64_t download_offset = 0;
    bool staged = false;
    std::map<uint64_t, uint64_t> present;  // start -> end, disjoint
  };

  void CreateLocked(int32_t local_id, uint64_t size) {
    if (files_.count(local_id)) return;
    File f;
    f.path = root_ + "/file_" + std::to_string(local_id) + ".bin";
    f.size = size;
    const int fd = ::open(f.path.c_str(), O_CREAT | O_TRUNC | O_RDWR, 0644);
    if (fd >= 0) {
      if (::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        // Leave the short file; reads past its end fail in the test.
      }
      ::close(fd);
    }
    files_.emplace(local_id, std::move(f));
  }

  void WriteLocked(File& f, uint64_t offset, const uint8_t* data, size_t len) {
    const int fd = ::open(f.path.c_str(), O_WRONLY);
    if (fd < 0) return;
    size_t done = 0;
    while (done < len) {
      ssize_t n = ::pwrite(fd, data + done, len - done, static_cast<off_t>(offset + done));
      if (n <= 0) break;
      done += static_cast<size_t>(n);
    }
    ::close(fd);
  }

  static void MarkPresentLocked(File& f, uint64_t start, uint64_t end) {
    auto it = f.present.upper_bound(start);
    if (it != f.present.begin()) {
      auto prev = std::prev(it);
      if (prev->second >= start) {
        start = prev->first;
        end = std::max(end, prev->second);
        it = f.present.erase(prev);
      }
    }
    while (it != f.present.end() && it->first <= end) {
      end = std::max(end, it->second);
      it = f.present.erase(it);
    }
    f.present.emplace(start, end);
  }

  static uint64_t ContiguousFromLocked(const File& f, uint64_t offset) {
    auto it = f.present.upper_bound(offset);
    if (it == f.present.begin()) return 0;
    --it;
    return it->second > offset ? it->second - offset : 0;
  }

  const std::string root_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Remote> remotes_;
  std::unordered_map<int32_t, File> files_;
  std::set<int32_t> stale_;
  bool fail_starts_ = false;
  std::function<void(int32_t)> progress_cb_;
  std::function<void(const StartCall&)> start_hook_;

  int resolve_calls_ = 0;
  int query_calls_ = 0;
  std::vector<StartCall> starts_;
  std::vector<int32_t> cancels_;
};

}  // namespace streamcache::test

#endif  // STREAMCACHE_TESTS_FIXTURES_FAKE_TRANSPORT_CLIENT_H_
