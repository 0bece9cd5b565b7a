#include "aes_gcm_encryptor.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace relay::transform {

namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherCtx NewContext() {
  CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if (!ctx) {
    throw std::runtime_error("EVP_CIPHER_CTX_new failed");
  }
  return ctx;
}

std::array<unsigned char, 4> EpochAad(std::uint32_t epoch) {
  return {static_cast<unsigned char>(epoch >> 24), static_cast<unsigned char>(epoch >> 16), static_cast<unsigned char>(epoch >> 8),
          static_cast<unsigned char>(epoch)};
}

} // namespace

AesGcmEncryptor::AesGcmEncryptor(std::shared_ptr<KeyRing> keys) : keys_(std::move(keys)) {
  if (!keys_) {
    throw std::invalid_argument("AesGcmEncryptor requires a key ring");
  }
}

EncryptedPayload AesGcmEncryptor::Encode(std::string_view plaintext) {
  const auto key = keys_->Current();

  std::array<unsigned char, kNonceSize> nonce{};
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed generating a nonce");
  }

  auto       ctx = NewContext();
  const auto aad = EpochAad(key.epoch);
  int        len = 0;

  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.key.data(), nonce.data()) != 1 ||
      EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
    throw std::runtime_error("AES-256-GCM encrypt init failed");
  }

  std::string out(kNonceSize + kTagSize + plaintext.size(), '\0');
  auto*       cipher = reinterpret_cast<unsigned char*>(out.data()) + kNonceSize + kTagSize;

  int written = 0;
  if (!plaintext.empty() &&
      EVP_EncryptUpdate(ctx.get(), cipher, &len, reinterpret_cast<const unsigned char*>(plaintext.data()), static_cast<int>(plaintext.size())) != 1) {
    throw std::runtime_error("AES-256-GCM encrypt failed");
  }
  written = plaintext.empty() ? 0 : len;

  if (EVP_EncryptFinal_ex(ctx.get(), cipher + written, &len) != 1) {
    throw std::runtime_error("AES-256-GCM encrypt final failed");
  }

  std::array<unsigned char, kTagSize> tag{};
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), tag.data()) != 1) {
    throw std::runtime_error("AES-256-GCM tag extraction failed");
  }

  std::copy(nonce.begin(), nonce.end(), out.begin());
  std::copy(tag.begin(), tag.end(), out.begin() + kNonceSize);

  return EncryptedPayload{.bytes = std::move(out), .key_epoch = key.epoch};
}

std::string AesGcmEncryptor::Decode(std::string_view ciphertext, std::uint32_t key_epoch) const {
  if (ciphertext.size() < kNonceSize + kTagSize) {
    throw util::DecryptionError("ciphertext shorter than nonce and tag");
  }

  const auto key = keys_->Find(key_epoch);
  if (!key) {
    throw util::DecryptionError("unknown or expired key epoch " + std::to_string(key_epoch));
  }

  const auto* raw    = reinterpret_cast<const unsigned char*>(ciphertext.data());
  const auto* nonce  = raw;
  std::array<unsigned char, kTagSize> tag{};
  std::copy(raw + kNonceSize, raw + kNonceSize + kTagSize, tag.begin());
  const auto* body     = raw + kNonceSize + kTagSize;
  const auto  body_len = ciphertext.size() - kNonceSize - kTagSize;

  auto       ctx = NewContext();
  const auto aad = EpochAad(key_epoch);
  int        len = 0;

  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key->key.data(), nonce) != 1 ||
      EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
    throw util::DecryptionError("AES-256-GCM decrypt init failed");
  }

  std::string out(body_len, '\0');
  auto*       plain   = reinterpret_cast<unsigned char*>(out.data());
  int         written = 0;
  if (body_len > 0) {
    if (EVP_DecryptUpdate(ctx.get(), plain, &len, body, static_cast<int>(body_len)) != 1) {
      throw util::DecryptionError("AES-256-GCM decrypt failed");
    }
    written = len;
  }

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), tag.data()) != 1) {
    throw util::DecryptionError("AES-256-GCM tag setup failed");
  }
  if (EVP_DecryptFinal_ex(ctx.get(), plain + written, &len) <= 0) {
    throw util::DecryptionError("authentication failed: ciphertext was modified or the key does not match");
  }

  out.resize(static_cast<std::size_t>(written + len));
  return out;
}

bool AesGcmEncryptor::ShouldRotate(util::TimePoint now) const {
  return keys_->ShouldRotate(now);
}

std::uint32_t AesGcmEncryptor::Rotate(util::TimePoint now) {
  return keys_->Rotate(now);
}

KeyInfo AesGcmEncryptor::CurrentKey() const {
  const auto current = keys_->Current();
  return KeyInfo{.epoch             = current.epoch,
                 .created_at        = current.created_at,
                 .last_rotation     = keys_->LastRotation(),
                 .rotation_interval = keys_->RotationInterval(),
                 .retained_keys     = keys_->Size()};
}

std::string AesGcmEncryptor::Name() const {
  return "aes-256-gcm";
}

} // namespace relay::transform
