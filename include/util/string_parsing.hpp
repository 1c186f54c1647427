#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of strings to numeric types with validation
 - Parsing of contact addresses ("host:port") and tunnel URLs
 - Centralized input validation for command-line args, config files and
   contact records

 Key functions:
 - SafeParseInt: Parse integer with bounds checking
 - SafeParsePort: Parse port number (1-65535)
 - SplitHostPort: Parse "host:port" / "[v6]:port"
 - ParseUrl: Split an http(s)/ws(s) URL into scheme, host, port and target
 - ToWebSocketUrl: Rewrite http(s) tunnel URLs to ws(s)

 Security:
 - All functions validate entire input is consumed (no trailing garbage)
 - Returns std::nullopt on any parsing error (no exceptions thrown)
*/

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace whisperlink {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse port number string (1-65535)
 *
 * Examples:
 *   SafeParsePort("9001") -> 9001
 *   SafeParsePort("0") -> std::nullopt (port 0 invalid)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * Validate hexadecimal string
 *
 * @return true if non-empty and all characters are hex digits [0-9a-fA-F]
 */
bool IsValidHex(const std::string& str);

/**
 * Split "host:port" into its parts
 *
 * Accepts bracketed IPv6 ("[::1]:9001"). Host must be non-empty and the port
 * must parse with SafeParsePort.
 *
 * Examples:
 *   SplitHostPort("127.0.0.1:9001") -> {"127.0.0.1", 9001}
 *   SplitHostPort("[::1]:9001") -> {"::1", 9001}
 *   SplitHostPort("localhost") -> std::nullopt (no port)
 */
std::optional<std::pair<std::string, uint16_t>> SplitHostPort(const std::string& str);

struct ParsedUrl {
  std::string scheme;  // lowercase: http, https, ws, wss
  std::string host;
  uint16_t port{0};    // explicit port or scheme default
  std::string target;  // path + query, "/" when absent

  bool secure() const { return scheme == "https" || scheme == "wss"; }
};

/**
 * Parse an absolute http/https/ws/wss URL
 *
 * Examples:
 *   ParseUrl("https://abc.ngrok.app") -> {https, abc.ngrok.app, 443, "/"}
 *   ParseUrl("ws://127.0.0.1:8765/ws") -> {ws, 127.0.0.1, 8765, "/ws"}
 *   ParseUrl("ftp://x") -> std::nullopt (unsupported scheme)
 */
std::optional<ParsedUrl> ParseUrl(const std::string& url);

/**
 * Rewrite a tunnel URL to its WebSocket equivalent
 *
 * https -> wss, http -> ws; ws/wss are returned unchanged.
 * Returns std::nullopt if the URL cannot be parsed.
 */
std::optional<std::string> ToWebSocketUrl(const std::string& url);

} // namespace util
} // namespace whisperlink
