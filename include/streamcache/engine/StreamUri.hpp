// Repository: Retrovue-streamcache
// Component: Stream URI
// Purpose: Parses and formats tg://file/<localId>?remoteId=...&mimeType=...&size=...
//          player URIs into a StreamIdentity plus MIME hint.
// Copyright (c) 2025 RetroVue

#ifndef STREAMCACHE_ENGINE_STREAM_URI_HPP_
#define STREAMCACHE_ENGINE_STREAM_URI_HPP_

#include <string>

#include "streamcache/engine/StreamTypes.hpp"

namespace streamcache {

struct StreamUriResult {
  bool ok;
  StreamError error;
  StreamIdentity identity;
  std::string mime_type;
  std::string detail;

  static StreamUriResult Success(const StreamIdentity& identity, const std::string& mime) {
    return {true, StreamError::kNone, identity, mime, ""};
  }

  static StreamUriResult Failure(const std::string& detail) {
    return {false, StreamError::kInvalidUri, StreamIdentity{}, "", detail};
  }
};

class StreamUri {
 public:
  static constexpr const char* kScheme = "tg://file/";

  // remoteId is required; the local id in the path is only a hint.  Query
  // values are percent-decoded.  Unknown parameters are ignored.
  static StreamUriResult Parse(const std::string& uri);

  // Inverse of Parse().  Omits absent fields; values are percent-encoded.
  static std::string Format(const StreamIdentity& identity, const std::string& mime_type);
};

}  // namespace streamcache

#endif  // STREAMCACHE_ENGINE_STREAM_URI_HPP_
