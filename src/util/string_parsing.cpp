#include "util/string_parsing.hpp"
#include <algorithm>
#include <cctype>

namespace whisperlink {
namespace util {

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  try {
    // Reject empty or whitespace-only strings
    if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
      return std::nullopt;
    }

    size_t pos = 0;
    long value = std::stol(str, &pos);

    // Check entire string was consumed
    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int>(value);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = SafeParseInt(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

bool IsValidHex(const std::string& str) {
  if (str.empty()) {
    return false;
  }

  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::optional<std::pair<std::string, uint16_t>> SplitHostPort(const std::string& str) {
  std::string host;
  std::string port_str;

  if (!str.empty() && str.front() == '[') {
    auto close = str.find(']');
    if (close == std::string::npos || close + 1 >= str.size() || str[close + 1] != ':') {
      return std::nullopt;
    }
    host = str.substr(1, close - 1);
    port_str = str.substr(close + 2);
  } else {
    auto colon = str.rfind(':');
    if (colon == std::string::npos) {
      return std::nullopt;
    }
    host = str.substr(0, colon);
    port_str = str.substr(colon + 1);
    // Unbracketed IPv6 is ambiguous
    if (host.find(':') != std::string::npos) {
      return std::nullopt;
    }
  }

  if (host.empty()) {
    return std::nullopt;
  }

  auto port = SafeParsePort(port_str);
  if (!port) {
    return std::nullopt;
  }
  return std::make_pair(host, *port);
}

std::optional<ParsedUrl> ParseUrl(const std::string& url) {
  auto sep = url.find("://");
  if (sep == std::string::npos || sep == 0) {
    return std::nullopt;
  }

  ParsedUrl out;
  out.scheme = url.substr(0, sep);
  std::transform(out.scheme.begin(), out.scheme.end(), out.scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  uint16_t default_port = 0;
  if (out.scheme == "http" || out.scheme == "ws") {
    default_port = 80;
  } else if (out.scheme == "https" || out.scheme == "wss") {
    default_port = 443;
  } else {
    return std::nullopt;
  }

  std::string rest = url.substr(sep + 3);
  auto slash = rest.find_first_of("/?");
  std::string authority = slash == std::string::npos ? rest : rest.substr(0, slash);
  out.target = slash == std::string::npos ? "/" : rest.substr(slash);
  if (!out.target.empty() && out.target.front() == '?') {
    out.target = "/" + out.target;
  }

  if (authority.empty() || authority.find('@') != std::string::npos) {
    return std::nullopt;
  }

  bool has_port = authority.front() == '['
                      ? authority.find("]:") != std::string::npos
                      : authority.find(':') != std::string::npos;
  if (has_port) {
    auto hp = SplitHostPort(authority);
    if (!hp) {
      return std::nullopt;
    }
    out.host = hp->first;
    out.port = hp->second;
  } else {
    out.host = authority;
    if (out.host.size() > 2 && out.host.front() == '[' && out.host.back() == ']') {
      out.host = out.host.substr(1, out.host.size() - 2);
    }
    out.port = default_port;
  }

  if (out.host.empty()) {
    return std::nullopt;
  }
  return out;
}

std::optional<std::string> ToWebSocketUrl(const std::string& url) {
  auto parsed = ParseUrl(url);
  if (!parsed) {
    return std::nullopt;
  }

  auto sep = url.find("://");
  std::string scheme = parsed->scheme;
  if (scheme == "https") {
    scheme = "wss";
  } else if (scheme == "http") {
    scheme = "ws";
  }
  return scheme + url.substr(sep);
}

} // namespace util
} // namespace whisperlink
