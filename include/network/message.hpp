#pragma once

#include "network/errors.hpp"
#include "network/protocol.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace whisperlink {
namespace message {

/**
 * Wire messages of the connection layer
 *
 * Every unit on a byte stream is a frame: 4-byte big-endian length followed
 * by a UTF-8 JSON object. Three JSON shapes exist:
 *
 *   handshake  {"user_id", "username", "public_key"}
 *   response   {"user_id", "username", "public_key", "status"}
 *   envelope   {"type": "chat"|"signal", "message": <base64>, "timestamp",
 *               ["group_id", "group_name"]}
 *
 * Decoders never throw; JSON errors are reported through the return value.
 */

enum class MessageKind { CHAT, SIGNAL };

std::string MessageKindAsString(MessageKind kind);

struct HandshakeFrame {
  std::string user_id;
  std::string username;
  std::string public_key;
};

struct HandshakeResponse {
  std::string user_id;
  std::string username;
  std::string public_key;
  std::string status;

  bool accepted() const { return status == protocol::status::ACCEPTED; }
};

struct Envelope {
  MessageKind kind{MessageKind::CHAT};
  std::string ciphertext; // base64(nonce || ct || tag)
  std::string timestamp;  // ISO-8601 UTC
  std::optional<std::string> group_id;
  std::optional<std::string> group_name;
};

// JSON bodies (unframed)
std::string EncodeHandshake(const HandshakeFrame &frame);
std::string EncodeHandshakeResponse(const HandshakeResponse &response);
std::string EncodeEnvelope(const Envelope &envelope);

// On failure returns std::nullopt and sets error to MALFORMED (bad JSON, not
// an object, wrong field type) or INCOMPLETE_FIELDS (missing/empty field)
std::optional<HandshakeFrame> DecodeHandshake(const std::string &body,
                                              network::HandshakeError &error);
std::optional<HandshakeResponse> DecodeHandshakeResponse(const std::string &body,
                                                         network::HandshakeError &error);

// Unknown type, missing fields or bad JSON -> std::nullopt
std::optional<Envelope> DecodeEnvelope(const std::string &body);

/**
 * Prefix body with its 4-byte big-endian length.
 * Returns an empty vector if body exceeds MAX_FRAME_SIZE.
 */
std::vector<uint8_t> EncodeFrame(const std::string &body);

/**
 * FrameDecoder - reassembles frames from arbitrary read boundaries
 *
 * Handles both coalesced delivery (several frames in one read) and
 * fragmented delivery (one frame split over many reads, including inside the
 * length prefix). A declared length above MAX_FRAME_SIZE poisons the decoder:
 * feed() returns false from then on and the caller must close the transport.
 */
class FrameDecoder {
public:
  explicit FrameDecoder(uint32_t max_frame_size = protocol::MAX_FRAME_SIZE);

  // Append bytes and move every completed frame body into frames.
  // Returns false on protocol violation.
  bool feed(const uint8_t *data, size_t len, std::vector<std::string> &frames);
  bool feed(const std::vector<uint8_t> &data, std::vector<std::string> &frames) {
    return feed(data.data(), data.size(), frames);
  }

  bool failed() const { return failed_; }

  // Bytes held waiting for the rest of a frame
  size_t buffered() const { return buffer_.size() - offset_; }

private:
  uint32_t max_frame_size_;
  // Read offset pattern avoids O(n^2) erase-from-front
  std::vector<uint8_t> buffer_;
  size_t offset_{0};
  bool failed_{false};
};

} // namespace message
} // namespace whisperlink
