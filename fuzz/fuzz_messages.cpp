// Fuzz target for handshake and envelope decoding
// Tests JSON bodies as they arrive from untrusted peers

#include "network/errors.hpp"
#include "network/message.hpp"
#include <cstdint>
#include <cstddef>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace whisperlink::message;
    using whisperlink::network::HandshakeError;

    if (size < 1) return 0;

    // First byte selects the decoder
    uint8_t selector = data[0];
    std::string body(reinterpret_cast<const char*>(data + 1), size - 1);

    switch (selector % 3) {
        case 0: {
            HandshakeError err = HandshakeError::NONE;
            auto frame = DecodeHandshake(body, err);
            if (frame) {
                // A decoded handshake must carry every field
                if (frame->user_id.empty() || frame->username.empty() || frame->public_key.empty()) {
                    __builtin_trap();
                }
                HandshakeError err2 = HandshakeError::NONE;
                auto again = DecodeHandshake(EncodeHandshake(*frame), err2);
                if (!again || again->user_id != frame->user_id ||
                    again->public_key != frame->public_key) {
                    __builtin_trap();
                }
            } else if (err == HandshakeError::NONE) {
                // Failure must say why
                __builtin_trap();
            }
            break;
        }
        case 1: {
            HandshakeError err = HandshakeError::NONE;
            auto response = DecodeHandshakeResponse(body, err);
            if (!response && err == HandshakeError::NONE) {
                __builtin_trap();
            }
            break;
        }
        case 2: {
            auto envelope = DecodeEnvelope(body);
            if (envelope) {
                auto again = DecodeEnvelope(EncodeEnvelope(*envelope));
                if (!again || again->ciphertext != envelope->ciphertext ||
                    again->kind != envelope->kind || again->group_id != envelope->group_id) {
                    __builtin_trap();
                }
            }
            break;
        }
    }

    return 0;
}
