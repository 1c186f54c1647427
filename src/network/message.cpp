#include "network/message.hpp"
#include "util/logging.hpp"
#include <nlohmann/json.hpp>

namespace whisperlink {
namespace message {

using json = nlohmann::json;
using network::HandshakeError;

namespace {

std::string Dump(const json &j) {
  // Replace invalid UTF-8 instead of throwing
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// Parse body into an object; nullopt on any JSON error
std::optional<json> ParseObject(const std::string &body) {
  try {
    json j = json::parse(body);
    if (!j.is_object()) {
      return std::nullopt;
    }
    return j;
  } catch (const json::exception &e) {
    LOG_NET_TRACE("json parse error: {}", e.what());
    return std::nullopt;
  }
}

// Distinguishes absent/empty (INCOMPLETE_FIELDS) from wrong type (MALFORMED)
bool ReadRequired(const json &j, const char *key, std::string &out, HandshakeError &error) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    error = HandshakeError::INCOMPLETE_FIELDS;
    return false;
  }
  if (!it->is_string()) {
    error = HandshakeError::MALFORMED;
    return false;
  }
  out = it->get<std::string>();
  if (out.empty()) {
    error = HandshakeError::INCOMPLETE_FIELDS;
    return false;
  }
  return true;
}

} // namespace

std::string MessageKindAsString(MessageKind kind) {
  switch (kind) {
  case MessageKind::CHAT:
    return protocol::envelope_type::CHAT;
  case MessageKind::SIGNAL:
    return protocol::envelope_type::SIGNAL;
  }
  return "unknown";
}

std::string EncodeHandshake(const HandshakeFrame &frame) {
  json j;
  j["user_id"] = frame.user_id;
  j["username"] = frame.username;
  j["public_key"] = frame.public_key;
  return Dump(j);
}

std::string EncodeHandshakeResponse(const HandshakeResponse &response) {
  json j;
  j["user_id"] = response.user_id;
  j["username"] = response.username;
  j["public_key"] = response.public_key;
  j["status"] = response.status;
  return Dump(j);
}

std::string EncodeEnvelope(const Envelope &envelope) {
  json j;
  j["type"] = MessageKindAsString(envelope.kind);
  j["message"] = envelope.ciphertext;
  j["timestamp"] = envelope.timestamp;
  if (envelope.group_id) {
    j["group_id"] = *envelope.group_id;
  }
  if (envelope.group_name) {
    j["group_name"] = *envelope.group_name;
  }
  return Dump(j);
}

std::optional<HandshakeFrame> DecodeHandshake(const std::string &body, HandshakeError &error) {
  auto j = ParseObject(body);
  if (!j) {
    error = HandshakeError::MALFORMED;
    return std::nullopt;
  }

  HandshakeFrame frame;
  if (!ReadRequired(*j, "user_id", frame.user_id, error) ||
      !ReadRequired(*j, "username", frame.username, error) ||
      !ReadRequired(*j, "public_key", frame.public_key, error)) {
    return std::nullopt;
  }
  error = HandshakeError::NONE;
  return frame;
}

std::optional<HandshakeResponse> DecodeHandshakeResponse(const std::string &body,
                                                         HandshakeError &error) {
  auto j = ParseObject(body);
  if (!j) {
    error = HandshakeError::MALFORMED;
    return std::nullopt;
  }

  HandshakeResponse response;
  // A rejection may carry empty identity fields; status decides first
  if (!ReadRequired(*j, "status", response.status, error)) {
    return std::nullopt;
  }
  if (!response.accepted()) {
    error = HandshakeError::NONE;
    return response;
  }
  if (!ReadRequired(*j, "user_id", response.user_id, error) ||
      !ReadRequired(*j, "username", response.username, error) ||
      !ReadRequired(*j, "public_key", response.public_key, error)) {
    return std::nullopt;
  }
  error = HandshakeError::NONE;
  return response;
}

std::optional<Envelope> DecodeEnvelope(const std::string &body) {
  auto j = ParseObject(body);
  if (!j) {
    return std::nullopt;
  }

  auto type = j->find("type");
  auto msg = j->find("message");
  if (type == j->end() || !type->is_string() || msg == j->end() || !msg->is_string()) {
    return std::nullopt;
  }

  Envelope envelope;
  const auto &type_str = type->get_ref<const std::string &>();
  if (type_str == protocol::envelope_type::CHAT) {
    envelope.kind = MessageKind::CHAT;
  } else if (type_str == protocol::envelope_type::SIGNAL) {
    envelope.kind = MessageKind::SIGNAL;
  } else {
    return std::nullopt;
  }

  envelope.ciphertext = msg->get<std::string>();
  if (envelope.ciphertext.empty()) {
    return std::nullopt;
  }

  auto ts = j->find("timestamp");
  if (ts != j->end() && ts->is_string()) {
    envelope.timestamp = ts->get<std::string>();
  }

  auto gid = j->find("group_id");
  if (gid != j->end() && gid->is_string()) {
    envelope.group_id = gid->get<std::string>();
  }
  auto gname = j->find("group_name");
  if (gname != j->end() && gname->is_string()) {
    envelope.group_name = gname->get<std::string>();
  }
  return envelope;
}

std::vector<uint8_t> EncodeFrame(const std::string &body) {
  if (body.size() > protocol::MAX_FRAME_SIZE) {
    return {};
  }
  const uint32_t len = static_cast<uint32_t>(body.size());
  std::vector<uint8_t> out;
  out.reserve(protocol::FRAME_HEADER_SIZE + body.size());
  out.push_back(static_cast<uint8_t>((len >> 24) & 0xFF));
  out.push_back(static_cast<uint8_t>((len >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(len & 0xFF));
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

FrameDecoder::FrameDecoder(uint32_t max_frame_size) : max_frame_size_(max_frame_size) {}

bool FrameDecoder::feed(const uint8_t *data, size_t len, std::vector<std::string> &frames) {
  if (failed_) {
    return false;
  }

  // Compact once over half the buffer has been consumed
  if (offset_ > 0 && offset_ >= buffer_.size() / 2) {
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
    offset_ = 0;
    if (buffer_.empty()) {
      buffer_.shrink_to_fit();
    }
  }

  buffer_.insert(buffer_.end(), data, data + len);

  while (buffer_.size() - offset_ >= protocol::FRAME_HEADER_SIZE) {
    const uint8_t *p = buffer_.data() + offset_;
    const uint32_t body_len = (static_cast<uint32_t>(p[0]) << 24) |
                              (static_cast<uint32_t>(p[1]) << 16) |
                              (static_cast<uint32_t>(p[2]) << 8) |
                              static_cast<uint32_t>(p[3]);
    if (body_len > max_frame_size_) {
      LOG_NET_WARN("frame length {} exceeds limit {}", body_len, max_frame_size_);
      failed_ = true;
      buffer_.clear();
      offset_ = 0;
      return false;
    }
    if (buffer_.size() - offset_ < protocol::FRAME_HEADER_SIZE + body_len) {
      break; // wait for more bytes
    }
    const char *body = reinterpret_cast<const char *>(p + protocol::FRAME_HEADER_SIZE);
    frames.emplace_back(body, body_len);
    offset_ += protocol::FRAME_HEADER_SIZE + body_len;
  }

  if (offset_ == buffer_.size()) {
    buffer_.clear();
    offset_ = 0;
  }
  return true;
}

} // namespace message
} // namespace whisperlink
