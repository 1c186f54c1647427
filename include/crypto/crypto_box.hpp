// Copyright (c) 2025 The WhisperLink developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace whisperlink {
namespace crypto {

/**
 * Long-lived X25519 identity key pair, both halves as lowercase hex of the
 * 32-byte raw keys.
 */
struct KeyPair {
  std::string public_key;
  std::string private_key;
};

/**
 * CryptoBox - public-key authenticated encryption between two identities
 *
 * Construction:
 * - X25519(own_private, peer_public) -> shared secret
 * - HKDF-SHA256(shared secret, salt = sorted public keys) -> 32-byte pair key
 * - ChaCha20-Poly1305 with a fresh random 96-bit nonce per message
 *
 * Wire form of a sealed message: base64(nonce || ciphertext || tag).
 *
 * Both directions of a pair derive the same key, so
 * Decrypt(skB, pkA, Encrypt(skA, pkB, m)) == m. No forward secrecy: the key
 * is fixed for the lifetime of the two identities.
 *
 * All failures (malformed hex, bad base64, truncated input, authentication
 * failure) return std::nullopt; nothing throws.
 */
class CryptoBox {
public:
  static constexpr size_t KEY_SIZE = 32;
  static constexpr size_t NONCE_SIZE = 12;
  static constexpr size_t TAG_SIZE = 16;

  // Generate a fresh identity key pair (nullopt only if the RNG/EVP layer fails)
  static std::optional<KeyPair> GenerateKeyPair();

  // Recompute the public half from a hex private key
  static std::optional<std::string> DerivePublicKey(const std::string &private_key_hex);

  // Returns base64(nonce || ct || tag)
  static std::optional<std::string> Encrypt(const std::string &own_private_hex,
                                            const std::string &peer_public_hex,
                                            const std::string &plaintext);

  static std::optional<std::string> Decrypt(const std::string &own_private_hex,
                                            const std::string &peer_public_hex,
                                            const std::string &sealed_b64);

  // Validates a hex-encoded 32-byte key
  static bool IsValidKey(const std::string &key_hex);
};

// Encoding helpers shared with the codec and tests
std::string HexEncode(const std::vector<uint8_t> &data);
std::optional<std::vector<uint8_t>> HexDecode(const std::string &hex);
std::string Base64Encode(const std::vector<uint8_t> &data);
std::optional<std::vector<uint8_t>> Base64Decode(const std::string &b64);

} // namespace crypto
} // namespace whisperlink
