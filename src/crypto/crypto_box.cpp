// Copyright (c) 2025 The WhisperLink developers
// Distributed under the MIT software license

#include "crypto/crypto_box.hpp"
#include "util/logging.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <memory>

namespace whisperlink {
namespace crypto {

namespace {

constexpr const char *kHkdfInfo = "whisperlink-box-v1";

using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using KdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;

using Key = std::array<uint8_t, CryptoBox::KEY_SIZE>;

std::optional<Key> DecodeKey(const std::string &hex) {
  auto raw = HexDecode(hex);
  if (!raw || raw->size() != CryptoBox::KEY_SIZE) {
    return std::nullopt;
  }
  Key key{};
  std::copy(raw->begin(), raw->end(), key.begin());
  return key;
}

PkeyPtr LoadPrivate(const Key &raw) {
  return PkeyPtr(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, raw.data(), raw.size()),
                 EVP_PKEY_free);
}

PkeyPtr LoadPublic(const Key &raw) {
  return PkeyPtr(EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, raw.data(), raw.size()),
                 EVP_PKEY_free);
}

std::optional<Key> RawPublic(EVP_PKEY *pkey) {
  Key out{};
  size_t len = out.size();
  if (EVP_PKEY_get_raw_public_key(pkey, out.data(), &len) != 1 || len != out.size()) {
    return std::nullopt;
  }
  return out;
}

std::optional<std::vector<uint8_t>> X25519(EVP_PKEY *own, EVP_PKEY *peer) {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new(own, nullptr), EVP_PKEY_CTX_free);
  if (!ctx || EVP_PKEY_derive_init(ctx.get()) != 1 ||
      EVP_PKEY_derive_set_peer(ctx.get(), peer) != 1) {
    return std::nullopt;
  }
  size_t len = 0;
  if (EVP_PKEY_derive(ctx.get(), nullptr, &len) != 1 || len == 0) {
    return std::nullopt;
  }
  std::vector<uint8_t> secret(len);
  if (EVP_PKEY_derive(ctx.get(), secret.data(), &len) != 1) {
    return std::nullopt;
  }
  secret.resize(len);
  return secret;
}

std::optional<Key> HkdfSha256(const std::vector<uint8_t> &ikm, const std::vector<uint8_t> &salt) {
  EVP_KDF *kdf = EVP_KDF_fetch(nullptr, "HKDF", nullptr);
  if (!kdf) {
    return std::nullopt;
  }
  KdfCtxPtr kctx(EVP_KDF_CTX_new(kdf), EVP_KDF_CTX_free);
  EVP_KDF_free(kdf);
  if (!kctx) {
    return std::nullopt;
  }

  Key out{};
  OSSL_PARAM params[5];
  params[0] = OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, const_cast<char *>("SHA256"), 0);
  params[1] = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT,
                                                const_cast<uint8_t *>(salt.data()), salt.size());
  params[2] = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_KEY,
                                                const_cast<uint8_t *>(ikm.data()), ikm.size());
  params[3] = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_INFO, const_cast<char *>(kHkdfInfo),
                                                std::char_traits<char>::length(kHkdfInfo));
  params[4] = OSSL_PARAM_construct_end();

  if (EVP_KDF_derive(kctx.get(), out.data(), out.size(), params) != 1) {
    return std::nullopt;
  }
  return out;
}

// Same key in both directions: salt orders the two public keys
std::optional<Key> PairKey(const std::string &own_private_hex, const std::string &peer_public_hex) {
  auto own_raw = DecodeKey(own_private_hex);
  auto peer_raw = DecodeKey(peer_public_hex);
  if (!own_raw || !peer_raw) {
    return std::nullopt;
  }

  auto own = LoadPrivate(*own_raw);
  auto peer = LoadPublic(*peer_raw);
  if (!own || !peer) {
    return std::nullopt;
  }

  auto own_pub = RawPublic(own.get());
  if (!own_pub) {
    return std::nullopt;
  }

  auto secret = X25519(own.get(), peer.get());
  if (!secret) {
    return std::nullopt;
  }

  const Key &lo = std::min(*own_pub, *peer_raw);
  const Key &hi = std::max(*own_pub, *peer_raw);
  std::vector<uint8_t> salt;
  salt.reserve(lo.size() + hi.size());
  salt.insert(salt.end(), lo.begin(), lo.end());
  salt.insert(salt.end(), hi.begin(), hi.end());

  return HkdfSha256(*secret, salt);
}

} // namespace

std::optional<KeyPair> CryptoBox::GenerateKeyPair() {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr), EVP_PKEY_CTX_free);
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    LOG_CRYPTO_WARN("X25519 keygen init failed");
    return std::nullopt;
  }
  EVP_PKEY *raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) != 1 || !raw) {
    LOG_CRYPTO_WARN("X25519 keygen failed");
    return std::nullopt;
  }
  PkeyPtr pkey(raw, EVP_PKEY_free);

  Key priv{};
  size_t len = priv.size();
  if (EVP_PKEY_get_raw_private_key(pkey.get(), priv.data(), &len) != 1 || len != priv.size()) {
    return std::nullopt;
  }
  auto pub = RawPublic(pkey.get());
  if (!pub) {
    return std::nullopt;
  }

  KeyPair out;
  out.public_key = HexEncode(std::vector<uint8_t>(pub->begin(), pub->end()));
  out.private_key = HexEncode(std::vector<uint8_t>(priv.begin(), priv.end()));
  OPENSSL_cleanse(priv.data(), priv.size());
  return out;
}

std::optional<std::string> CryptoBox::DerivePublicKey(const std::string &private_key_hex) {
  auto raw = DecodeKey(private_key_hex);
  if (!raw) {
    return std::nullopt;
  }
  auto pkey = LoadPrivate(*raw);
  if (!pkey) {
    return std::nullopt;
  }
  auto pub = RawPublic(pkey.get());
  if (!pub) {
    return std::nullopt;
  }
  return HexEncode(std::vector<uint8_t>(pub->begin(), pub->end()));
}

bool CryptoBox::IsValidKey(const std::string &key_hex) {
  return DecodeKey(key_hex).has_value();
}

std::optional<std::string> CryptoBox::Encrypt(const std::string &own_private_hex,
                                              const std::string &peer_public_hex,
                                              const std::string &plaintext) {
  auto key = PairKey(own_private_hex, peer_public_hex);
  if (!key) {
    LOG_CRYPTO_DEBUG("encrypt: invalid key material");
    return std::nullopt;
  }

  std::vector<uint8_t> out(NONCE_SIZE + plaintext.size() + TAG_SIZE);
  if (RAND_bytes(out.data(), static_cast<int>(NONCE_SIZE)) != 1) {
    LOG_CRYPTO_WARN("encrypt: RAND_bytes failed");
    return std::nullopt;
  }

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
  if (!ctx) {
    return std::nullopt;
  }

  int len = 0;
  bool ok = EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) == 1;
  ok = ok && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, NONCE_SIZE, nullptr) == 1;
  ok = ok && EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key->data(), out.data()) == 1;
  ok = ok && EVP_EncryptUpdate(ctx.get(), out.data() + NONCE_SIZE, &len,
                               reinterpret_cast<const uint8_t *>(plaintext.data()),
                               static_cast<int>(plaintext.size())) == 1;
  int final_len = 0;
  ok = ok && EVP_EncryptFinal_ex(ctx.get(), out.data() + NONCE_SIZE + len, &final_len) == 1;
  ok = ok && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, TAG_SIZE,
                                 out.data() + NONCE_SIZE + plaintext.size()) == 1;
  OPENSSL_cleanse(key->data(), key->size());
  if (!ok) {
    LOG_CRYPTO_WARN("encrypt: AEAD failure");
    return std::nullopt;
  }

  return Base64Encode(out);
}

std::optional<std::string> CryptoBox::Decrypt(const std::string &own_private_hex,
                                              const std::string &peer_public_hex,
                                              const std::string &sealed_b64) {
  auto sealed = Base64Decode(sealed_b64);
  if (!sealed || sealed->size() < NONCE_SIZE + TAG_SIZE) {
    LOG_CRYPTO_DEBUG("decrypt: malformed ciphertext");
    return std::nullopt;
  }

  auto key = PairKey(own_private_hex, peer_public_hex);
  if (!key) {
    LOG_CRYPTO_DEBUG("decrypt: invalid key material");
    return std::nullopt;
  }

  const size_t ct_len = sealed->size() - NONCE_SIZE - TAG_SIZE;
  const uint8_t *nonce = sealed->data();
  const uint8_t *ct = sealed->data() + NONCE_SIZE;
  uint8_t *tag = sealed->data() + NONCE_SIZE + ct_len;

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
  if (!ctx) {
    return std::nullopt;
  }

  std::string plaintext(ct_len, '\0');
  int len = 0;
  bool ok = EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) == 1;
  ok = ok && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, NONCE_SIZE, nullptr) == 1;
  ok = ok && EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key->data(), nonce) == 1;
  ok = ok && EVP_DecryptUpdate(ctx.get(), reinterpret_cast<uint8_t *>(plaintext.data()), &len, ct,
                               static_cast<int>(ct_len)) == 1;
  ok = ok && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, TAG_SIZE, tag) == 1;
  int final_len = 0;
  // Tag check happens in Final
  ok = ok && EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<uint8_t *>(plaintext.data()) + len,
                                 &final_len) == 1;
  OPENSSL_cleanse(key->data(), key->size());
  if (!ok) {
    LOG_CRYPTO_DEBUG("decrypt: authentication failed");
    return std::nullopt;
  }
  return plaintext;
}

std::string HexEncode(const std::vector<uint8_t> &data) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (uint8_t b : data) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0f]);
  }
  return out;
}

std::optional<std::vector<uint8_t>> HexDecode(const std::string &hex) {
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  std::vector<uint8_t> out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = nibble(hex[i]);
    int lo = nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::string Base64Encode(const std::vector<uint8_t> &data) {
  if (data.empty()) {
    return {};
  }
  std::string out(4 * ((data.size() + 2) / 3), '\0');
  int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()), data.data(),
                          static_cast<int>(data.size()));
  out.resize(n < 0 ? 0 : static_cast<size_t>(n));
  return out;
}

std::optional<std::vector<uint8_t>> Base64Decode(const std::string &b64) {
  if (b64.empty()) {
    return std::vector<uint8_t>{};
  }
  if (b64.size() % 4 != 0) {
    return std::nullopt;
  }
  // '=' only as one or two trailing pad characters
  const size_t first_pad = b64.find('=');
  if (first_pad != std::string::npos &&
      (first_pad < b64.size() - 2 || b64.find_first_not_of('=', first_pad) != std::string::npos)) {
    return std::nullopt;
  }
  std::vector<uint8_t> out(3 * (b64.size() / 4));
  int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char *>(b64.data()),
                          static_cast<int>(b64.size()));
  if (n < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
  size_t pad = 0;
  if (b64.back() == '=') ++pad;
  if (b64.size() > 1 && b64[b64.size() - 2] == '=') ++pad;
  out.resize(static_cast<size_t>(n) - pad);
  return out;
}

} // namespace crypto
} // namespace whisperlink
