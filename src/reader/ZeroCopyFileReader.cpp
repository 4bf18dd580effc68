// Repository: Retrovue-streamcache
// Component: Zero-Copy File Reader Implementation
// Copyright (c) 2025 RetroVue

#include "streamcache/reader/ZeroCopyFileReader.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iterator>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

#include "streamcache/util/Logger.hpp"

namespace streamcache::reader {

using streamcache::util::Logger;

// =============================================================================
// CacheHandle
// =============================================================================

CacheHandle::CacheHandle(StreamId stream_id, std::string path, int fd)
    : stream_id_(std::move(stream_id)), path_(std::move(path)), fd_(fd) {}

CacheHandle::~CacheHandle() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

void CacheHandle::Confirm(uint64_t start, uint64_t end) {
  if (end <= start) return;
  std::lock_guard<std::mutex> lock(mutex_);

  // Merge with every range that overlaps or touches [start, end).
  auto it = confirmed_.upper_bound(start);
  if (it != confirmed_.begin()) {
    auto prev = std::prev(it);
    if (prev->second >= start) {
      start = prev->first;
      end = std::max(end, prev->second);
      it = confirmed_.erase(prev);
    }
  }
  while (it != confirmed_.end() && it->first <= end) {
    end = std::max(end, it->second);
    it = confirmed_.erase(it);
  }
  confirmed_.emplace(start, end);
}

void CacheHandle::MarkComplete(uint64_t total_size) {
  std::lock_guard<std::mutex> lock(mutex_);
  complete_size_ = total_size;
}

std::optional<uint64_t> CacheHandle::ReadableFrom(uint64_t position) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (complete_size_) {
    return position >= *complete_size_ ? 0 : *complete_size_ - position;
  }
  auto it = confirmed_.upper_bound(position);
  if (it == confirmed_.begin()) return std::nullopt;
  --it;
  if (position >= it->second) return std::nullopt;
  return it->second - position;
}

// =============================================================================
// ZeroCopyFileReader
// =============================================================================

ZeroCopyFileReader::~ZeroCopyFileReader() {
  std::lock_guard<std::mutex> lock(mutex_);
  handles_.clear();
  by_stream_.clear();
}

std::shared_ptr<CacheHandle> ZeroCopyFileReader::Lookup(ReaderHandle handle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = handles_.find(handle);
  return it == handles_.end() ? nullptr : it->second;
}

ReaderOpenResult ZeroCopyFileReader::Open(const StreamId& stream_id, const std::string& path) {
  if (stream_id.empty() || path.empty()) {
    return ReaderOpenResult::Failure(StreamError::kInvalidHandle, "empty stream id or path");
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (by_stream_.count(stream_id) != 0) {
      return ReaderOpenResult::Failure(StreamError::kReaderBusy,
                                       "reader already open for " + stream_id);
    }
  }

  const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    const int err = errno;
    std::ostringstream oss;
    oss << "[ZeroCopyFileReader] OPEN_FAILED stream=" << stream_id
        << " path=" << path << " errno=" << err << " (" << std::strerror(err) << ")";
    Logger::Error(oss.str());
    return ReaderOpenResult::Failure(
        err == ENOENT ? StreamError::kStaleLocalIdentity : StreamError::kIoError,
        std::strerror(err));
  }

  auto cache_handle = std::make_shared<CacheHandle>(stream_id, path, fd);
  ReaderHandle handle = kInvalidReaderHandle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // Lost a race with another Open() for the same stream; cache_handle's
    // destructor closes our descriptor.
    if (by_stream_.count(stream_id) != 0) {
      return ReaderOpenResult::Failure(StreamError::kReaderBusy,
                                       "reader already open for " + stream_id);
    }
    handle = next_handle_++;
    handles_.emplace(handle, cache_handle);
    by_stream_.emplace(stream_id, handle);
  }

  Logger::Debug("[ZeroCopyFileReader] OPENED stream=" + stream_id + " path=" + path +
                " handle=" + std::to_string(handle));
  return ReaderOpenResult::Success(handle);
}

ReadResult ZeroCopyFileReader::Read(ReaderHandle handle, uint64_t position, uint8_t* buffer,
                                    size_t length) {
  auto h = Lookup(handle);
  if (!h) return ReadResult::Failure(StreamError::kInvalidHandle);
  if (length == 0) return ReadResult::Success(0);
  if (buffer == nullptr) return ReadResult::Failure(StreamError::kIoError);

  const std::optional<uint64_t> readable = h->ReadableFrom(position);
  if (!readable) return ReadResult::Failure(StreamError::kRangeNotReady);
  if (*readable == 0) return ReadResult::Success(0);  // end of a complete file

  const size_t want = static_cast<size_t>(std::min<uint64_t>(length, *readable));
  size_t done = 0;
  while (done < want) {
    ssize_t n = ::pread(h->fd(), buffer + done, want - done,
                        static_cast<off_t>(position + done));
    if (n < 0) {
      if (errno == EINTR) continue;
      const int err = errno;
      std::ostringstream oss;
      oss << "[ZeroCopyFileReader] READ_FAILED stream=" << h->stream_id()
          << " position=" << position + done << " errno=" << err
          << " (" << std::strerror(err) << ")";
      Logger::Error(oss.str());
      return ReadResult::Failure(StreamError::kIoError);
    }
    if (n == 0) break;
    done += static_cast<size_t>(n);
  }

  if (done == 0) {
    // Confirmed bytes that the file does not hold.
    Logger::Error("[ZeroCopyFileReader] SHORT_FILE stream=" + h->stream_id() +
                  " position=" + std::to_string(position));
    return ReadResult::Failure(StreamError::kIoError);
  }
  return ReadResult::Success(done);
}

StreamError ZeroCopyFileReader::Confirm(ReaderHandle handle, uint64_t start, uint64_t end) {
  auto h = Lookup(handle);
  if (!h) return StreamError::kInvalidHandle;
  h->Confirm(start, end);
  return StreamError::kNone;
}

StreamError ZeroCopyFileReader::MarkComplete(ReaderHandle handle, uint64_t total_size) {
  auto h = Lookup(handle);
  if (!h) return StreamError::kInvalidHandle;
  h->MarkComplete(total_size);
  return StreamError::kNone;
}

bool ZeroCopyFileReader::Close(ReaderHandle handle) {
  std::shared_ptr<CacheHandle> h;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(handle);
    if (it == handles_.end()) return false;
    h = it->second;
    by_stream_.erase(h->stream_id());
    handles_.erase(it);
  }
  Logger::Debug("[ZeroCopyFileReader] CLOSED stream=" + h->stream_id() +
                " handle=" + std::to_string(handle));
  return true;
}

std::optional<ReaderHandle> ZeroCopyFileReader::HandleFor(const StreamId& stream_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_stream_.find(stream_id);
  if (it == by_stream_.end()) return std::nullopt;
  return it->second;
}

std::optional<std::string> ZeroCopyFileReader::PathOf(ReaderHandle handle) const {
  auto h = Lookup(handle);
  if (!h) return std::nullopt;
  return h->path();
}

size_t ZeroCopyFileReader::OpenCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handles_.size();
}

}  // namespace streamcache::reader
