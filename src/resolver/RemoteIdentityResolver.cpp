// Repository: Retrovue-streamcache
// Component: Remote Identity Resolver Implementation
// Copyright (c) 2025 RetroVue

#include "streamcache/resolver/RemoteIdentityResolver.hpp"

#include <sstream>
#include <stdexcept>

#include "streamcache/util/Logger.hpp"

namespace streamcache::resolver {

using streamcache::util::Logger;

RemoteIdentityResolver::RemoteIdentityResolver(transport::ITransportClient* transport)
    : transport_(transport) {
  if (transport_ == nullptr) {
    throw std::invalid_argument("RemoteIdentityResolver: transport is null");
  }
}

ResolveOutcome RemoteIdentityResolver::Resolve(const std::string& remote_id) {
  if (remote_id.empty()) {
    return ResolveOutcome::Failure("empty remote id");
  }

  {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
      auto it = cache_.find(remote_id);
      if (it != cache_.end()) {
        return ResolveOutcome::Success(it->second.local_id, it->second.size_hint);
      }
      if (in_flight_.count(remote_id) == 0) break;
      in_flight_cv_.wait(lock);
    }
    in_flight_.insert(remote_id);
  }

  // Transport round trip outside the lock.
  transport::ResolveResult rr = transport_->ResolveRemoteFile(remote_id);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(remote_id);
    if (rr.status == transport::TransportStatus::kOk) {
      cache_[remote_id] = rr.info;
    }
  }
  in_flight_cv_.notify_all();

  if (rr.status != transport::TransportStatus::kOk) {
    std::ostringstream oss;
    oss << "[RemoteIdentityResolver] RESOLVE_FAILED remote_id=" << remote_id
        << " status=" << transport::TransportStatusToString(rr.status)
        << " message=" << rr.message;
    Logger::Warn(oss.str());
    return ResolveOutcome::Failure(rr.message.empty()
                                       ? transport::TransportStatusToString(rr.status)
                                       : rr.message);
  }

  {
    std::ostringstream oss;
    oss << "[RemoteIdentityResolver] RESOLVED remote_id=" << remote_id
        << " local_id=" << rr.info.local_id;
    if (rr.info.size_hint) oss << " size_hint=" << *rr.info.size_hint;
    Logger::Debug(oss.str());
  }
  return ResolveOutcome::Success(rr.info.local_id, rr.info.size_hint);
}

void RemoteIdentityResolver::Invalidate(const std::string& remote_id) {
  bool removed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    removed = cache_.erase(remote_id) > 0;
  }
  if (removed) {
    Logger::Info("[RemoteIdentityResolver] INVALIDATED remote_id=" + remote_id);
  }
}

bool RemoteIdentityResolver::InvalidateIfStale(const std::string& remote_id,
                                               int32_t stale_local_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(remote_id);
    if (it == cache_.end() || it->second.local_id != stale_local_id) {
      return false;
    }
    cache_.erase(it);
  }
  std::ostringstream oss;
  oss << "[RemoteIdentityResolver] INVALIDATED remote_id=" << remote_id
      << " stale_local_id=" << stale_local_id;
  Logger::Info(oss.str());
  return true;
}

std::optional<int32_t> RemoteIdentityResolver::CachedLocalId(
    const std::string& remote_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = cache_.find(remote_id);
  if (it == cache_.end()) return std::nullopt;
  return it->second.local_id;
}

size_t RemoteIdentityResolver::CacheSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

}  // namespace streamcache::resolver
