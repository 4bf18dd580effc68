// Repository: Retrovue-streamcache
// Component: Playback Mode Detector Implementation
// Copyright (c) 2025 RetroVue

#include "streamcache/container/PlaybackModeDetector.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <vector>

extern "C" {
#include <libavformat/avformat.h>
}

namespace streamcache::container {

namespace {

// ISO base-media family: moov/mdat layout, so a prefix can be validated.
constexpr const char* kProgressiveMimeTypes[] = {
    "video/mp4",
    "video/quicktime",
    "video/3gpp",
    "video/3gpp2",
    "video/x-m4v",
    "audio/mp4",
    "audio/x-m4a",
    "application/mp4",
};

std::string NormalizeMime(const std::string& mime) {
  // Drop parameters ("video/mp4; codecs=...") and surrounding whitespace.
  std::string base = mime.substr(0, mime.find(';'));
  auto not_space = [](unsigned char c) { return !std::isspace(c); };
  base.erase(base.begin(), std::find_if(base.begin(), base.end(), not_space));
  base.erase(std::find_if(base.rbegin(), base.rend(), not_space).base(), base.end());
  std::transform(base.begin(), base.end(), base.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return base;
}

}  // namespace

std::optional<PlaybackMode> PlaybackModeDetector::FromMime(const std::string& mime) {
  const std::string normalized = NormalizeMime(mime);
  if (normalized.empty()) return std::nullopt;
  for (const char* candidate : kProgressiveMimeTypes) {
    if (normalized == candidate) return PlaybackMode::kProgressive;
  }
  return PlaybackMode::kFullFile;
}

std::string PlaybackModeDetector::ProbeFormatName(const uint8_t* data, size_t size) {
  if (data == nullptr || size == 0) return "";

  // av_probe_input_format2 reads up to AVPROBE_PADDING_SIZE past buf_size.
  std::vector<uint8_t> padded(size + AVPROBE_PADDING_SIZE, 0);
  std::memcpy(padded.data(), data, size);

  AVProbeData pd;
  std::memset(&pd, 0, sizeof(pd));
  pd.filename = "";
  pd.buf = padded.data();
  pd.buf_size = static_cast<int>(std::min<size_t>(size, 1 << 20));

  int score = AVPROBE_SCORE_RETRY;
  const AVInputFormat* fmt = av_probe_input_format2(&pd, 1, &score);
  if (fmt == nullptr || fmt->name == nullptr) return "";
  return fmt->name;
}

PlaybackMode PlaybackModeDetector::Sniff(const uint8_t* data, size_t size) {
  const std::string name = ProbeFormatName(data, size);
  // libavformat names the ISO-BMFF demuxer "mov,mp4,m4a,3gp,3g2,mj2".
  if (name.find("mov") != std::string::npos || name.find("mp4") != std::string::npos) {
    return PlaybackMode::kProgressive;
  }
  return PlaybackMode::kFullFile;
}

PlaybackMode PlaybackModeDetector::Detect(const std::string& mime, const uint8_t* data,
                                          size_t size) {
  if (auto by_mime = FromMime(mime)) return *by_mime;
  return Sniff(data, size);
}

}  // namespace streamcache::container
