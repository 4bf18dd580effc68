// Repository: Retrovue-streamcache
// Component: MP4 Box Builder
// Purpose: Assembles minimal ISO-BMFF top-level box layouts for container
//          tests.  Box payloads are filler; only the headers matter.
// Copyright (c) 2025 RetroVue

#ifndef STREAMCACHE_TESTS_FIXTURES_MP4_BUILDER_H_
#define STREAMCACHE_TESTS_FIXTURES_MP4_BUILDER_H_

#include <cstdint>
#include <string>
#include <vector>

namespace streamcache::test {

class Mp4Builder {
 public:
  // Box of |total_size| bytes including its 8-byte header.
  Mp4Builder& Box(const std::string& type, uint32_t total_size) {
    PutBE32(total_size);
    PutType(type);
    Fill(total_size - 8);
    return *this;
  }

  // Box using the 64-bit size escape (size field == 1).
  Mp4Builder& LargeBox(const std::string& type, uint64_t total_size) {
    PutBE32(1);
    PutType(type);
    PutBE32(static_cast<uint32_t>(total_size >> 32));
    PutBE32(static_cast<uint32_t>(total_size & 0xFFFFFFFFu));
    Fill(total_size - 16);
    return *this;
  }

  // 'ftyp' with major brand isom; 24 bytes.
  Mp4Builder& Ftyp() {
    PutBE32(24);
    PutType("ftyp");
    PutType("isom");
    PutBE32(0x200);
    PutType("isom");
    PutType("mp41");
    return *this;
  }

  // Only the header of a box, for declared sizes larger than we want to build.
  Mp4Builder& Header(const std::string& type, uint32_t declared_size) {
    PutBE32(declared_size);
    PutType(type);
    return *this;
  }

  Mp4Builder& Raw(const std::vector<uint8_t>& bytes) {
    bytes_.insert(bytes_.end(), bytes.begin(), bytes.end());
    return *this;
  }

  const std::vector<uint8_t>& bytes() const { return bytes_; }
  size_t size() const { return bytes_.size(); }

 private:
  void PutBE32(uint32_t v) {
    bytes_.push_back(static_cast<uint8_t>(v >> 24));
    bytes_.push_back(static_cast<uint8_t>(v >> 16));
    bytes_.push_back(static_cast<uint8_t>(v >> 8));
    bytes_.push_back(static_cast<uint8_t>(v));
  }

  void PutType(const std::string& type) {
    for (size_t i = 0; i < 4; ++i) {
      bytes_.push_back(static_cast<uint8_t>(i < type.size() ? type[i] : ' '));
    }
  }

  void Fill(uint64_t n) { bytes_.insert(bytes_.end(), static_cast<size_t>(n), 0xAB); }

  std::vector<uint8_t> bytes_;
};

}  // namespace streamcache::test

#endif  // STREAMCACHE_TESTS_FIXTURES_MP4_BUILDER_H_
