// Repository: Retrovue-streamcache
// Component: Progressive Container Validator
// Purpose: Walks the top-level boxes of an ISO base-media file prefix and
//          decides whether the movie header ('moov') is fully present.
//          Not a demuxer: only box headers are read.
// Copyright (c) 2025 RetroVue

#ifndef STREAMCACHE_CONTAINER_PROGRESSIVE_CONTAINER_VALIDATOR_HPP_
#define STREAMCACHE_CONTAINER_PROGRESSIVE_CONTAINER_VALIDATOR_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace streamcache::container {

// =============================================================================
// Byte sources
// =============================================================================

// Positioned read access to a (possibly partially downloaded) file.
class ByteSource {
 public:
  virtual ~ByteSource() = default;

  // Fill |dst| with exactly |len| bytes starting at |offset|.  Returns false
  // on I/O error or short read.
  virtual bool ReadAt(uint64_t offset, uint8_t* dst, size_t len) = 0;
};

// Non-owning view over an in-memory buffer.
class MemoryByteSource : public ByteSource {
 public:
  MemoryByteSource(const uint8_t* data, size_t size) : data_(data), size_(size) {}

  bool ReadAt(uint64_t offset, uint8_t* dst, size_t len) override;

 private:
  const uint8_t* data_;
  size_t size_;
};

// pread() over a cache file.  Owns the descriptor.
class FileByteSource : public ByteSource {
 public:
  explicit FileByteSource(const std::string& path);
  ~FileByteSource() override;

  FileByteSource(const FileByteSource&) = delete;
  FileByteSource& operator=(const FileByteSource&) = delete;

  bool IsOpen() const { return fd_ >= 0; }
  int OpenErrno() const { return open_errno_; }

  bool ReadAt(uint64_t offset, uint8_t* dst, size_t len) override;

 private:
  int fd_ = -1;
  int open_errno_ = 0;
};

// =============================================================================
// Validation result
// =============================================================================

struct ContainerComplete {
  uint64_t moov_offset = 0;
  uint64_t moov_size = 0;
};

// 'moov' starts inside the prefix but ends past it.
struct ContainerIncomplete {
  uint64_t bytes_needed = 0;  // prefix length required: box start + declared size
};

// The prefix ended before the next box header was complete.
struct ContainerNotFound {
  uint64_t scanned_bytes = 0;  // offset of the first unread box header
};

struct ContainerInvalid {
  std::string reason;
};

using ContainerValidationResult =
    std::variant<ContainerComplete, ContainerIncomplete, ContainerNotFound,
                 ContainerInvalid>;

inline bool IsComplete(const ContainerValidationResult& r) {
  return std::holds_alternative<ContainerComplete>(r);
}

inline bool IsInvalid(const ContainerValidationResult& r) {
  return std::holds_alternative<ContainerInvalid>(r);
}

// One-line summary for logs and the probe CLI, e.g. "INCOMPLETE needed=5024".
std::string Describe(const ContainerValidationResult& r);

// =============================================================================
// ProgressiveContainerValidator
// =============================================================================
//
// Box header: 4-byte big-endian size, 4-byte type.  size == 1 means a 64-bit
// size follows the type.  Walks from offset 0:
//
//   moov fully inside [0, available)       -> Complete
//   moov starts inside, ends past          -> Incomplete(box start + size)
//   header of the next box not in prefix   -> NotFound
//   size 0, size < header, non-printable
//   type, overflow or past total_size      -> Invalid
//   end of file reached without moov       -> Invalid
//
// A non-fast-start file (moov after mdat) reports NotFound / Incomplete until
// the whole mdat has arrived.
class ProgressiveContainerValidator {
 public:
  static constexpr size_t kBoxHeaderSize = 8;
  static constexpr size_t kLargeBoxHeaderSize = 16;

  // |available| is the contiguous prefix length readable from |src|.
  // |total_size| is the full file size when known.
  static ContainerValidationResult Validate(ByteSource& src, uint64_t available,
                                            std::optional<uint64_t> total_size = std::nullopt);

  static ContainerValidationResult ValidateBuffer(const uint8_t* data, size_t size,
                                                  std::optional<uint64_t> total_size = std::nullopt);
};

}  // namespace streamcache::container

#endif  // STREAMCACHE_CONTAINER_PROGRESSIVE_CONTAINER_VALIDATOR_HPP_
