#include "dv/core/filename_cipher.h"

#include <array>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "dv/errors.h"
#include "test_support.h"

namespace {

void TestRoundTrip() {
  auto cipher = dv::test::FixedCipher(1);
  const std::vector<std::string> names = {
      "docs", "a", "with space", "UPPER and lower", "report.final.v2.pdf", "\xc3\xa5\xc3\xa4\xc3\xb6",
      std::string(dv::core::DeterministicFilenameCipher::kMaxSegmentBytes, 'x'), "...hidden", ".profile"};
  for (const auto& name : names) {
    dv::core::ValidateSegmentName(name);
    const auto encrypted = cipher->EncryptSegment(name);
    assert(encrypted.find('/') == std::string::npos && "encrypted names must be single path segments");
    [[maybe_unused]] const auto decrypted = cipher->DecryptSegment(encrypted);
    assert(decrypted == name && "decrypt(encrypt(x)) must equal x");
  }
}

void TestDeterministicAndKeyed() {
  auto cipher = dv::test::FixedCipher(1);
  auto other = dv::test::FixedCipher(2);
  assert(cipher->EncryptSegment("docs") == cipher->EncryptSegment("docs") &&
         "same key and name must produce the same ciphertext");
  assert(cipher->EncryptSegment("docs") != cipher->EncryptSegment("archive") &&
         "different names must not collide");
  assert(cipher->EncryptSegment("docs") != other->EncryptSegment("docs") &&
         "different keys must produce different ciphertexts");

  auto error = dv::test::CaptureError([&] { other->DecryptSegment(cipher->EncryptSegment("docs")); });
  assert(error && error->code == dv::errors::crypto::kFilenameAuthenticationFailed &&
         "names from another key must fail authentication");
}

void TestTamperingDetected() {
  auto cipher = dv::test::FixedCipher(3);
  auto encrypted = cipher->EncryptSegment("sensitive");
  encrypted[5] = encrypted[5] == 'A' ? 'B' : 'A';
  auto error = dv::test::CaptureError([&] { cipher->DecryptSegment(encrypted); });
  assert(error && error->domain == dv::ErrorDomain::Crypto &&
         error->code == dv::errors::crypto::kFilenameAuthenticationFailed && "tampered names must be rejected");

  auto malformed = dv::test::CaptureError([&] { cipher->DecryptSegment("not-base32!"); });
  assert(malformed && malformed->code == dv::errors::crypto::kMalformedCiphertext &&
         "non base32 names must be reported as malformed");
  auto truncated = dv::test::CaptureError([&] { cipher->DecryptSegment("MZXW6YTB"); });
  assert(truncated && truncated->code == dv::errors::crypto::kMalformedCiphertext &&
         "envelopes shorter than nonce and tag must be malformed");
}

void TestSegmentValidation() {
  const std::vector<std::string> invalid = {
      "", ".", "..", "a/b", std::string("nul\0byte", 8),
      std::string(dv::core::DeterministicFilenameCipher::kMaxSegmentBytes + 1, 'x')};
  for (const auto& name : invalid) {
    [[maybe_unused]] auto error = dv::test::CaptureError([&] { dv::core::ValidateSegmentName(name); });
    assert(error && dv::KindOf(*error) == dv::FailureKind::kOther &&
           error->code == dv::errors::validation::kInvalidSegmentName && "invalid segment must be rejected");
  }
}

void TestKeyMaterialLength() {
  std::array<uint8_t, 32> short_key{};
  auto error = dv::test::CaptureError([&] { dv::core::DeterministicFilenameCipher::FromKeyMaterial(short_key); });
  assert(error && error->domain == dv::ErrorDomain::Config && "filename keys must be 64 bytes");

  auto generated = dv::core::DeterministicFilenameCipher::Generate();
  auto again = dv::core::DeterministicFilenameCipher::Generate();
  assert(generated->EncryptSegment("x") != again->EncryptSegment("x") && "generated keys must differ");
}

}  // namespace

int main() {
  dv::test::TempDir dir("dv_filename_cipher_");
  dv::test::RouteLogsTo(dir.path());
  TestRoundTrip();
  TestDeterministicAndKeyed();
  TestTamperingDetected();
  TestSegmentValidation();
  TestKeyMaterialLength();
  std::cout << "filename cipher test ok\n";
  return 0;
}
