// Repository: Retrovue-streamcache
// Component: Zero-Copy File Reader
// Purpose: Positioned reads straight from the transport's on-disk cache file
//          into the caller's buffer.  Only confirmed byte ranges are served;
//          a read never waits for the network.
// Copyright (c) 2025 RetroVue

#ifndef STREAMCACHE_READER_ZERO_COPY_FILE_READER_HPP_
#define STREAMCACHE_READER_ZERO_COPY_FILE_READER_HPP_

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "streamcache/engine/StreamTypes.hpp"

namespace streamcache::reader {

using ReaderHandle = uint64_t;
inline constexpr ReaderHandle kInvalidReaderHandle = 0;

struct ReaderOpenResult {
  bool ok;
  StreamError error;
  ReaderHandle handle;
  std::string detail;

  static ReaderOpenResult Success(ReaderHandle h) {
    return {true, StreamError::kNone, h, ""};
  }

  static ReaderOpenResult Failure(StreamError err, const std::string& detail = "") {
    return {false, err, kInvalidReaderHandle, detail};
  }
};

// Exclusive read access to one stream's cache file.  Owns the descriptor;
// destruction closes it and never touches the file itself.
class CacheHandle {
 public:
  CacheHandle(StreamId stream_id, std::string path, int fd);
  ~CacheHandle();

  CacheHandle(const CacheHandle&) = delete;
  CacheHandle& operator=(const CacheHandle&) = delete;

  const StreamId& stream_id() const { return stream_id_; }
  const std::string& path() const { return path_; }
  int fd() const { return fd_; }

  // Record [start, end) as present on disk.  Overlapping and adjacent ranges
  // are merged.
  void Confirm(uint64_t start, uint64_t end);
  void MarkComplete(uint64_t total_size);

  // Bytes readable from |position| without crossing unconfirmed data, or
  // nullopt if |position| itself is unconfirmed.  0 at end of a complete file.
  std::optional<uint64_t> ReadableFrom(uint64_t position) const;

 private:
  StreamId stream_id_;
  std::string path_;
  int fd_;

  mutable std::mutex mutex_;
  std::map<uint64_t, uint64_t> confirmed_;  // start -> end, disjoint
  std::optional<uint64_t> complete_size_;
};

// ZeroCopyFileReader
//
// One open CacheHandle per stream (read-exclusive); a second Open() for the
// same stream fails with kReaderBusy until Close().  Read() copies directly
// from the file into the caller's buffer with pread(); a position outside
// every confirmed range returns kRangeNotReady, and a read that starts inside
// one is truncated at its end so no unconfirmed byte is ever returned.
class ZeroCopyFileReader {
 public:
  ZeroCopyFileReader() = default;
  ~ZeroCopyFileReader();

  ZeroCopyFileReader(const ZeroCopyFileReader&) = delete;
  ZeroCopyFileReader& operator=(const ZeroCopyFileReader&) = delete;

  // ENOENT maps to kStaleLocalIdentity (the transport dropped the file),
  // other open() failures to kIoError.
  ReaderOpenResult Open(const StreamId& stream_id, const std::string& path);

  ReadResult Read(ReaderHandle handle, uint64_t position, uint8_t* buffer, size_t length);

  StreamError Confirm(ReaderHandle handle, uint64_t start, uint64_t end);
  StreamError MarkComplete(ReaderHandle handle, uint64_t total_size);

  // Releases the descriptor only.  Returns false for an unknown handle.
  bool Close(ReaderHandle handle);

  std::optional<ReaderHandle> HandleFor(const StreamId& stream_id) const;
  std::optional<std::string> PathOf(ReaderHandle handle) const;
  size_t OpenCount() const;

 private:
  std::shared_ptr<CacheHandle> Lookup(ReaderHandle handle) const;

  mutable std::mutex mutex_;
  ReaderHandle next_handle_ = 1;
  std::unordered_map<ReaderHandle, std::shared_ptr<CacheHandle>> handles_;
  std::unordered_map<StreamId, ReaderHandle> by_stream_;
};

}  // namespace streamcache::reader

#endif  // STREAMCACHE_READER_ZERO_COPY_FILE_READER_HPP_
