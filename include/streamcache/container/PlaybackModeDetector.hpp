// Repository: Retrovue-streamcache
// Component: Playback Mode Detector
// Purpose: Decides whether a file can start playing from a prefix
//          (progressive ISO-BMFF) or must be fully downloaded first.
// Copyright (c) 2025 RetroVue

#ifndef STREAMCACHE_CONTAINER_PLAYBACK_MODE_DETECTOR_HPP_
#define STREAMCACHE_CONTAINER_PLAYBACK_MODE_DETECTOR_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace streamcache::container {

enum class PlaybackMode {
  kProgressive,  // ready once the movie header is present
  kFullFile,     // ready once the transport reports the file complete
};

inline const char* PlaybackModeToString(PlaybackMode m) {
  switch (m) {
    case PlaybackMode::kProgressive: return "PROGRESSIVE";
    case PlaybackMode::kFullFile: return "FULL_FILE";
  }
  return "UNKNOWN";
}

class PlaybackModeDetector {
 public:
  // Minimum bytes worth handing to Sniff().
  static constexpr size_t kSniffBytes = 4096;

  // nullopt when |mime| is empty (caller should sniff).  ISO-BMFF family
  // types map to kProgressive, every other non-empty type to kFullFile.
  static std::optional<PlaybackMode> FromMime(const std::string& mime);

  // Probe the leading bytes with libavformat.  A mov/mp4 family match is
  // kProgressive; no match or any other format is kFullFile.
  static PlaybackMode Sniff(const uint8_t* data, size_t size);

  // FromMime(), falling back to Sniff() when the MIME hint is empty.  With no
  // hint and no bytes the answer is kFullFile.
  static PlaybackMode Detect(const std::string& mime, const uint8_t* data, size_t size);

  // Name of the libavformat demuxer matched by the probe, or "" if none.
  static std::string ProbeFormatName(const uint8_t* data, size_t size);
};

}  // namespace streamcache::container

#endif  // STREAMCACHE_CONTAINER_PLAYBACK_MODE_DETECTOR_HPP_
