// Repository: Retrovue-streamcache
// Component: Remote Identity Resolver
// Purpose: Maps stable remote ids to session-scoped local ids through the
//          transport, caching each mapping until it is explicitly invalidated.
// Copyright (c) 2025 RetroVue

#ifndef STREAMCACHE_RESOLVER_REMOTE_IDENTITY_RESOLVER_HPP_
#define STREAMCACHE_RESOLVER_REMOTE_IDENTITY_RESOLVER_HPP_

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "streamcache/engine/StreamTypes.hpp"
#include "streamcache/transport/ITransportClient.hpp"

namespace streamcache::resolver {

struct ResolveOutcome {
  bool ok;
  StreamError error;
  int32_t local_id;
  std::optional<uint64_t> size_hint;
  std::string detail;

  static ResolveOutcome Success(int32_t local_id, std::optional<uint64_t> size_hint) {
    return {true, StreamError::kNone, local_id, size_hint, ""};
  }

  static ResolveOutcome Failure(const std::string& detail) {
    return {false, StreamError::kResolutionFailed, 0, std::nullopt, detail};
  }
};

// RemoteIdentityResolver
//
// Cache keyed by remote id, no TTL.  A local id stays valid until a caller
// observes it stale and invalidates it.  Failures are never cached and never
// retried here; the caller decides.  Concurrent Resolve() calls for the same
// remote id share a single transport round trip.
class RemoteIdentityResolver {
 public:
  // |transport| must outlive the resolver.  Throws std::invalid_argument if null.
  explicit RemoteIdentityResolver(transport::ITransportClient* transport);

  RemoteIdentityResolver(const RemoteIdentityResolver&) = delete;
  RemoteIdentityResolver& operator=(const RemoteIdentityResolver&) = delete;

  ResolveOutcome Resolve(const std::string& remote_id);

  // Drop the mapping; the next Resolve() asks the transport again.
  void Invalidate(const std::string& remote_id);

  // Drop the mapping only if it still points at |stale_local_id|.  Returns
  // true if an entry was removed.  Lets two readers that both saw the same
  // stale id race without discarding a fresh mapping.
  bool InvalidateIfStale(const std::string& remote_id, int32_t stale_local_id);

  std::optional<int32_t> CachedLocalId(const std::string& remote_id) const;
  size_t CacheSize() const;

 private:
  transport::ITransportClient* transport_;

  mutable std::mutex mutex_;
  std::condition_variable in_flight_cv_;
  std::unordered_map<std::string, transport::RemoteFileInfo> cache_;
  std::unordered_set<std::string> in_flight_;
};

}  // namespace streamcache::resolver

#endif  // STREAMCACHE_RESOLVER_REMOTE_IDENTITY_RESOLVER_HPP_
