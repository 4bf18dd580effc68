// Repository: Retrovue-streamcache
// Component: Container Probe CLI
// Purpose: Runs the progressive container validator and playback mode
//          detector over a local file, optionally pretending only a prefix
//          has been downloaded.
// Copyright (c) 2025 RetroVue
//
// Usage:
//   streamcache_probe --file <path> [--prefix <bytes>] [--mime <type>] [--version]
//
// Exit codes: 0 Complete, 2 Incomplete / NotFound, 3 Invalid, 1 usage or I/O.

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <sys/stat.h>

extern "C" {
#include <libavutil/avutil.h>
}

#include "streamcache/container/PlaybackModeDetector.hpp"
#include "streamcache/container/ProgressiveContainerValidator.hpp"

using namespace streamcache::container;

struct Args {
  std::string file;
  std::optional<uint64_t> prefix;
  std::string mime;
  bool version = false;
};

static void PrintUsage(const char* prog) {
  std::cerr << "Usage: " << prog
            << " --file <path> [--prefix <bytes>] [--mime <type>] [--version]\n";
}

static bool ParseArgs(int argc, char** argv, Args& args) {
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--file" && i + 1 < argc) {
      args.file = argv[++i];
    } else if (arg == "--prefix" && i + 1 < argc) {
      const std::string value = argv[++i];
      if (value.empty() ||
          !std::all_of(value.begin(), value.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        std::cerr << "Error: --prefix expects a byte count, got '" << value << "'\n";
        return false;
      }
      args.prefix = std::stoull(value);
    } else if (arg == "--mime" && i + 1 < argc) {
      args.mime = argv[++i];
    } else if (arg == "--version") {
      args.version = true;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      return false;
    }
  }

  if (!args.version && args.file.empty()) {
    std::cerr << "Error: --file is required\n";
    return false;
  }
  return true;
}

int main(int argc, char** argv) {
  Args args;
  if (!ParseArgs(argc, argv, args)) {
    PrintUsage(argv[0]);
    return 1;
  }

  if (args.version) {
    std::cout << "streamcache_probe (ffmpeg " << av_version_info() << ")\n";
    if (args.file.empty()) return 0;
  }

  struct stat st;
  if (::stat(args.file.c_str(), &st) != 0) {
    std::cerr << "Error: cannot stat " << args.file << ": " << std::strerror(errno) << "\n";
    return 1;
  }
  const uint64_t total = static_cast<uint64_t>(st.st_size);
  const uint64_t available = std::min(args.prefix.value_or(total), total);

  FileByteSource src(args.file);
  if (!src.IsOpen()) {
    std::cerr << "Error: cannot open " << args.file << ": "
              << std::strerror(src.OpenErrno()) << "\n";
    return 1;
  }

  std::vector<uint8_t> head(static_cast<size_t>(
      std::min<uint64_t>(available, PlaybackModeDetector::kSniffBytes)));
  if (!head.empty() && !src.ReadAt(0, head.data(), head.size())) {
    std::cerr << "Error: short read on " << args.file << "\n";
    return 1;
  }

  const ContainerValidationResult result =
      ProgressiveContainerValidator::Validate(src, available, total);
  const PlaybackMode mode = PlaybackModeDetector::Detect(args.mime, head.data(), head.size());

  std::cout << "[Probe] file=" << args.file
            << " size=" << total
            << " prefix=" << available << "\n";
  std::cout << "[Probe] container=" << Describe(result) << "\n";
  std::cout << "[Probe] mode=" << PlaybackModeToString(mode);
  if (!args.mime.empty()) std::cout << " mime=" << args.mime;
  std::cout << "\n";

  if (IsComplete(result)) return 0;
  if (IsInvalid(result)) return 3;
  return 2;
}
