#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/transform/aes_gcm_encryptor.hpp"
#include "internal/transform/checksum.hpp"
#include "internal/transform/key_ring.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using relay::transform::AesGcmEncryptor;
using relay::transform::KeyRing;

const relay::util::TimePoint kEpoch = relay::util::TimePoint{} + std::chrono::hours(24 * 365 * 50);

std::shared_ptr<KeyRing> MakeRing(std::chrono::milliseconds interval = 24h, std::chrono::milliseconds retention = 7 * 24h) {
  return std::make_shared<KeyRing>(interval, retention, kEpoch);
}

template <typename Fn>
bool ThrowsDecryptionError(Fn&& fn) {
  try {
    fn();
  } catch (const relay::util::DecryptionError&) {
    return true;
  }
  return false;
}

void TestRoundTrip() {
  AesGcmEncryptor encryptor(MakeRing());
  const std::string plaintext = "data: {\"content\":\"hello\"}";

  auto sealed = encryptor.Encode(plaintext);
  assert(sealed.key_epoch == 1);
  assert(sealed.bytes.size() == AesGcmEncryptor::kNonceSize + AesGcmEncryptor::kTagSize + plaintext.size());
  assert(sealed.bytes.find("hello") == std::string::npos);
  assert(encryptor.Decode(sealed.bytes, sealed.key_epoch) == plaintext);
}

void TestEmptyPlaintext() {
  AesGcmEncryptor encryptor(MakeRing());
  auto            sealed = encryptor.Encode("");
  assert(sealed.bytes.size() == AesGcmEncryptor::kNonceSize + AesGcmEncryptor::kTagSize);
  assert(encryptor.Decode(sealed.bytes, sealed.key_epoch).empty());
}

void TestNoncesDiffer() {
  AesGcmEncryptor encryptor(MakeRing());
  auto            first  = encryptor.Encode("same input");
  auto            second = encryptor.Encode("same input");
  assert(first.bytes != second.bytes);
}

void TestTamperingIsDetected() {
  AesGcmEncryptor encryptor(MakeRing());
  auto            sealed = encryptor.Encode("sensitive chunk");

  auto flipped = sealed.bytes;
  flipped.back() ^= 0x01;
  assert(ThrowsDecryptionError([&] { (void)encryptor.Decode(flipped, sealed.key_epoch); }));

  auto bad_tag = sealed.bytes;
  bad_tag[AesGcmEncryptor::kNonceSize] ^= 0x80;
  assert(ThrowsDecryptionError([&] { (void)encryptor.Decode(bad_tag, sealed.key_epoch); }));

  assert(ThrowsDecryptionError([&] { (void)encryptor.Decode("short", sealed.key_epoch); }));
}

void TestUnknownEpochIsRejected() {
  AesGcmEncryptor encryptor(MakeRing());
  auto            sealed = encryptor.Encode("payload");
  assert(ThrowsDecryptionError([&] { (void)encryptor.Decode(sealed.bytes, 7); }));
}

void TestWrongEpochFailsAuthentication() {
  auto ring = std::make_shared<KeyRing>(relay::transform::GenerateKey(), 24h, 7 * 24h, kEpoch);
  ring->Rotate(kEpoch + 1s);
  AesGcmEncryptor encryptor(ring);

  auto sealed = encryptor.Encode("payload");
  assert(sealed.key_epoch == 2);
  assert(ThrowsDecryptionError([&] { (void)encryptor.Decode(sealed.bytes, 1); }));
}

void TestRotationKeepsRetiredKeysReadable() {
  auto            ring = MakeRing(1h, 2h);
  AesGcmEncryptor encryptor(ring);

  auto before = encryptor.Encode("written under epoch 1");
  assert(!encryptor.ShouldRotate(kEpoch + 30min));
  assert(encryptor.ShouldRotate(kEpoch + 61min));

  assert(encryptor.Rotate(kEpoch + 61min) == 2);
  auto after = encryptor.Encode("written under epoch 2");
  assert(after.key_epoch == 2);

  assert(encryptor.Decode(before.bytes, before.key_epoch) == "written under epoch 1");
  assert(encryptor.Decode(after.bytes, after.key_epoch) == "written under epoch 2");

  const auto info = encryptor.CurrentKey();
  assert(info.epoch == 2);
  assert(info.retained_keys == 2);
  assert(info.last_rotation == kEpoch + 61min);
  assert(info.rotation_interval == 1h);
}

void TestExpiredKeysArePruned() {
  auto            ring = MakeRing(1h, 2h);
  AesGcmEncryptor encryptor(ring);

  auto old = encryptor.Encode("old");
  encryptor.Rotate(kEpoch + 1h);
  // epoch 1 retired at +1h, retention 2h, pruned on the first rotation after +3h
  encryptor.Rotate(kEpoch + 2h);
  assert(ring->Find(1).has_value());
  encryptor.Rotate(kEpoch + 4h);
  assert(!ring->Find(1).has_value());
  assert(ring->Current().epoch == 4);

  assert(ThrowsDecryptionError([&] { (void)encryptor.Decode(old.bytes, old.key_epoch); }));
}

void TestSha256Hex() {
  assert(relay::transform::Sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  assert(relay::transform::Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

} // namespace

int main() {
  TestRoundTrip();
  TestEmptyPlaintext();
  TestNoncesDiffer();
  TestTamperingIsDetected();
  TestUnknownEpochIsRejected();
  TestWrongEpochFailsAuthentication();
  TestRotationKeepsRetiredKeysReadable();
  TestExpiredKeysArePruned();
  TestSha256Hex();

  std::cout << "relay_unit_encryption: pass\n";
  return 0;
}
