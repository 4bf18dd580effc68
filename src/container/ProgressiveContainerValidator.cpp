// Repository: Retrovue-streamcache
// Component: Progressive Container Validator Implementation
// Copyright (c) 2025 RetroVue

#include "streamcache/container/ProgressiveContainerValidator.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace streamcache::container {

namespace {

uint32_t ReadBE32(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

uint64_t ReadBE64(const uint8_t* p) {
  return (static_cast<uint64_t>(ReadBE32(p)) << 32) | ReadBE32(p + 4);
}

bool IsPrintableType(const uint8_t* t) {
  for (int i = 0; i < 4; ++i) {
    if (t[i] < 0x20 || t[i] > 0x7E) return false;
  }
  return true;
}

ContainerInvalid MakeInvalid(const std::string& what, uint64_t offset) {
  std::ostringstream oss;
  oss << what << " at offset " << offset;
  return ContainerInvalid{oss.str()};
}

}  // namespace

// =============================================================================
// Byte sources
// =============================================================================

bool MemoryByteSource::ReadAt(uint64_t offset, uint8_t* dst, size_t len) {
  if (offset > size_ || len > size_ - offset) return false;
  std::memcpy(dst, data_ + offset, len);
  return true;
}

FileByteSource::FileByteSource(const std::string& path) {
  fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd_ < 0) open_errno_ = errno;
}

FileByteSource::~FileByteSource() {
  if (fd_ >= 0) ::close(fd_);
}

bool FileByteSource::ReadAt(uint64_t offset, uint8_t* dst, size_t len) {
  if (fd_ < 0) return false;
  size_t done = 0;
  while (done < len) {
    ssize_t n = ::pread(fd_, dst + done, len - done, static_cast<off_t>(offset + done));
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (n == 0) return false;  // short file
    done += static_cast<size_t>(n);
  }
  return true;
}

// =============================================================================
// Describe
// =============================================================================

std::string Describe(const ContainerValidationResult& r) {
  std::ostringstream oss;
  if (const auto* c = std::get_if<ContainerComplete>(&r)) {
    oss << "COMPLETE moov_offset=" << c->moov_offset << " moov_size=" << c->moov_size;
  } else if (const auto* i = std::get_if<ContainerIncomplete>(&r)) {
    oss << "INCOMPLETE needed=" << i->bytes_needed;
  } else if (const auto* n = std::get_if<ContainerNotFound>(&r)) {
    oss << "NOT_FOUND scanned=" << n->scanned_bytes;
  } else if (const auto* v = std::get_if<ContainerInvalid>(&r)) {
    oss << "INVALID reason=\"" << v->reason << "\"";
  }
  return oss.str();
}

// =============================================================================
// Validate
// =============================================================================

ContainerValidationResult ProgressiveContainerValidator::Validate(
    ByteSource& src, uint64_t available, std::optional<uint64_t> total_size) {
  if (total_size && available > *total_size) {
    available = *total_size;
  }

  uint64_t offset = 0;
  uint8_t header[kLargeBoxHeaderSize];

  while (true) {
    if (total_size && offset >= *total_size) {
      return MakeInvalid("no moov box before end of file", offset);
    }
    if (available < offset || available - offset < kBoxHeaderSize) {
      return ContainerNotFound{offset};
    }
    if (!src.ReadAt(offset, header, kBoxHeaderSize)) {
      return MakeInvalid("unreadable box header", offset);
    }

    const uint32_t size32 = ReadBE32(header);
    const uint8_t* type = header + 4;
    if (!IsPrintableType(type)) {
      return MakeInvalid("non-printable box type", offset);
    }

    uint64_t box_size = size32;
    uint64_t header_size = kBoxHeaderSize;
    if (size32 == 0) {
      return MakeInvalid("zero-size box", offset);
    }
    if (size32 == 1) {
      if (available - offset < kLargeBoxHeaderSize) {
        return ContainerNotFound{offset};
      }
      if (!src.ReadAt(offset + kBoxHeaderSize, header + kBoxHeaderSize, 8)) {
        return MakeInvalid("unreadable 64-bit box size", offset);
      }
      box_size = ReadBE64(header + kBoxHeaderSize);
      header_size = kLargeBoxHeaderSize;
    }

    if (box_size < header_size) {
      return MakeInvalid("box size smaller than its header", offset);
    }
    if (box_size > UINT64_MAX - offset) {
      return MakeInvalid("box size overflows file offset", offset);
    }
    const uint64_t box_end = offset + box_size;
    if (total_size && box_end > *total_size) {
      return MakeInvalid("box extends past end of file", offset);
    }

    if (std::memcmp(type, "moov", 4) == 0) {
      if (box_end <= available) {
        return ContainerComplete{offset, box_size};
      }
      return ContainerIncomplete{box_end};
    }

    offset = box_end;
  }
}

ContainerValidationResult ProgressiveContainerValidator::ValidateBuffer(
    const uint8_t* data, size_t size, std::optional<uint64_t> total_size) {
  MemoryByteSource src(data, size);
  return Validate(src, size, total_size);
}

}  // namespace streamcache::container
