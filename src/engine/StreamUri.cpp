// Repository: Retrovue-streamcache
// Component: Stream URI Implementation
// Copyright (c) 2025 RetroVue

#include "streamcache/engine/StreamUri.hpp"

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <sstream>

namespace streamcache {

namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::optional<std::string> PercentDecode(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    const char c = in[i];
    if (c == '%') {
      if (i + 2 >= in.size()) return std::nullopt;
      const int hi = HexValue(in[i + 1]);
      const int lo = HexValue(in[i + 2]);
      if (hi < 0 || lo < 0) return std::nullopt;
      out.push_back(static_cast<char>((hi << 4) | lo));
      i += 2;
    } else if (c == '+') {
      out.push_back(' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string PercentEncode(const std::string& in) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : in) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

bool AllDigits(const std::string& s) {
  if (s.empty()) return false;
  for (unsigned char c : s) {
    if (!std::isdigit(c)) return false;
  }
  return true;
}

}  // namespace

StreamUriResult StreamUri::Parse(const std::string& uri) {
  const std::string scheme(kScheme);
  if (uri.compare(0, scheme.size(), scheme) != 0) {
    return StreamUriResult::Failure("expected scheme " + scheme);
  }

  const size_t query_pos = uri.find('?', scheme.size());
  const std::string path = uri.substr(scheme.size(), query_pos == std::string::npos
                                                         ? std::string::npos
                                                         : query_pos - scheme.size());
  if (!AllDigits(path)) {
    return StreamUriResult::Failure("local id is not a number: '" + path + "'");
  }
  errno = 0;
  const long long local = std::strtoll(path.c_str(), nullptr, 10);
  if (errno == ERANGE || local > INT32_MAX) {
    return StreamUriResult::Failure("local id out of range: " + path);
  }

  StreamIdentity identity;
  identity.local_id = static_cast<int32_t>(local);
  std::string mime;

  if (query_pos != std::string::npos) {
    std::istringstream query(uri.substr(query_pos + 1));
    std::string pair;
    while (std::getline(query, pair, '&')) {
      if (pair.empty()) continue;
      const size_t eq = pair.find('=');
      const std::string key = pair.substr(0, eq);
      const std::string raw = eq == std::string::npos ? "" : pair.substr(eq + 1);
      std::optional<std::string> value = PercentDecode(raw);
      if (!value) {
        return StreamUriResult::Failure("bad percent-encoding in " + key);
      }
      if (key == "remoteId") {
        identity.remote_id = *value;
      } else if (key == "mimeType") {
        mime = *value;
      } else if (key == "size") {
        if (!AllDigits(*value)) {
          return StreamUriResult::Failure("size is not a number: '" + *value + "'");
        }
        errno = 0;
        const unsigned long long size = std::strtoull(value->c_str(), nullptr, 10);
        if (errno == ERANGE) {
          return StreamUriResult::Failure("size out of range: " + *value);
        }
        if (size > 0) identity.size_hint = static_cast<uint64_t>(size);
      }
    }
  }

  if (identity.remote_id.empty()) {
    return StreamUriResult::Failure("missing remoteId");
  }
  return StreamUriResult::Success(identity, mime);
}

std::string StreamUri::Format(const StreamIdentity& identity, const std::string& mime_type) {
  std::ostringstream oss;
  oss << kScheme << identity.local_id.value_or(0)
      << "?remoteId=" << PercentEncode(identity.remote_id);
  if (!mime_type.empty()) oss << "&mimeType=" << PercentEncode(mime_type);
  if (identity.size_hint) oss << "&size=" << *identity.size_hint;
  return oss.str();
}

}  // namespace streamcache
