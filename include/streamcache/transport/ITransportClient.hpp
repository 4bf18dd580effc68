// Repository: Retrovue-streamcache
// Component: Transport Client Interface
// Purpose: Injected boundary to the remote blob store.  The engine never
//          talks to the wire protocol directly; production wires a TDLib-style
//          client, tests wire FakeTransportClient.
// Copyright (c) 2025 RetroVue

#ifndef STREAMCACHE_TRANSPORT_ITRANSPORT_CLIENT_HPP_
#define STREAMCACHE_TRANSPORT_ITRANSPORT_CLIENT_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace streamcache::transport {

enum class TransportStatus {
  kOk,
  kNotFound,  // remote id unknown, or local id no longer valid in this session
  kError,
};

inline const char* TransportStatusToString(TransportStatus s) {
  switch (s) {
    case TransportStatus::kOk: return "OK";
    case TransportStatus::kNotFound: return "NOT_FOUND";
    case TransportStatus::kError: return "ERROR";
  }
  return "UNKNOWN";
}

struct RemoteFileInfo {
  int32_t local_id = 0;
  std::optional<uint64_t> size_hint;
};

struct ResolveResult {
  TransportStatus status = TransportStatus::kError;
  RemoteFileInfo info;
  std::string message;
};

// Snapshot of the transport's on-disk cache for one file.
//
// downloaded_prefix_bytes counts the contiguous bytes present starting at
// download_offset (the offset of the most recent partial request), not at 0.
struct LocalFileState {
  uint64_t download_offset = 0;
  uint64_t downloaded_prefix_bytes = 0;
  std::string local_path;
  bool complete = false;
  std::optional<uint64_t> total_size;
};

struct FileStateResult {
  TransportStatus status = TransportStatus::kError;
  LocalFileState state;
  std::string message;
};

// Progress notifications (StreamingEngine::OnFileUpdated) may be delivered
// from any thread, including synchronously from inside StartPartialDownload()
// or CancelDownload().  Implementations must not hold their own locks while
// delivering them.
class ITransportClient {
 public:
  virtual ~ITransportClient() = default;

  virtual ResolveResult ResolveRemoteFile(const std::string& remote_id) = 0;

  // limit == 0 means unbounded (to end of file).  A new request for the same
  // local id replaces the previous one in the transport.
  virtual TransportStatus StartPartialDownload(int32_t local_id, uint64_t offset,
                                               uint64_t limit, int priority) = 0;

  virtual FileStateResult QueryLocalFileState(int32_t local_id) = 0;

  // Idempotent.  Downloaded bytes stay in the transport cache.
  virtual void CancelDownload(int32_t local_id) = 0;
};

}  // namespace streamcache::transport

#endif  // STREAMCACHE_TRANSPORT_ITRANSPORT_CLIENT_HPP_
