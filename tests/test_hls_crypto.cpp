#include <catch2/catch.hpp>
#include "infrastructure/hls_crypto.hpp"
#include "support/crypto_fixtures.hpp"
#include "support/test_runtime.hpp"

using namespace download_service;
using namespace test_support;

TEST_CASE("cbc decrypt recovers plaintext", "[hls_crypto]") {
  auto key = blockOf("0123456789abcdef");
  auto iv = sequenceIv(3);
  auto plain = patternBytes(1000);
  auto decrypted = aes128CbcDecrypt(aes128CbcEncrypt(plain, key, iv), key, iv);
  REQUIRE(decrypted.has_value());
  CHECK(*decrypted == plain);
}

TEST_CASE("cbc rejects partial blocks", "[hls_crypto]") {
  auto key = blockOf("0123456789abcdef");
  auto result = aes128CbcDecrypt(std::string(17, 'x'), key, sequenceIv(0));
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == ErrorKind::DecryptError);
  CHECK_FALSE(aes128CbcDecrypt("", key, sequenceIv(0)).has_value());
}

TEST_CASE("ecb unwraps content key", "[hls_crypto]") {
  const std::string wrapping = "5d41402abc4b2a76";
  const std::string content = "ABCDEFGHIJKLMNOP";
  auto unwrapped = aes128EcbDecrypt(aes128EcbEncrypt(content, wrapping), wrapping);
  REQUIRE(unwrapped.has_value());
  CHECK(*unwrapped == content);
  CHECK(aes128EcbDecrypt(std::string(16, 'x'), "short").error().kind == ErrorKind::DecryptError);
}

TEST_CASE("sequence iv is big endian", "[hls_crypto]") {
  auto iv = sequenceIv(0x0102);
  for (size_t i = 0; i < 14; ++i) CHECK(iv[i] == 0);
  CHECK(iv[14] == 0x01);
  CHECK(iv[15] == 0x02);
}

TEST_CASE("parses hex iv", "[hls_crypto]") {
  auto iv = parseHexIv("0x000102030405060708090A0B0C0D0E0F");
  REQUIRE(iv.has_value());
  for (size_t i = 0; i < 16; ++i) CHECK((*iv)[i] == i);
  CHECK(parseHexIv("000102030405060708090a0b0c0d0e0f").has_value());
  CHECK(parseHexIv("0x0102").error().kind == ErrorKind::ManifestError);
  CHECK(parseHexIv("0xzz0102030405060708090a0b0c0d0e0f").error().kind == ErrorKind::ManifestError);
}

TEST_CASE("base64 decode handles padding", "[hls_crypto]") {
  CHECK(base64Decode("aGVsbG8=").value() == "hello");
  CHECK(base64Decode("aGk=").value() == "hi");
  CHECK(base64Decode("YWJj").value() == "abc");
  CHECK(base64Decode("aGVs\nbG8=").value() == "hello");
  CHECK_FALSE(base64Decode("abc").has_value());
}

TEST_CASE("md5 of data and files", "[hls_crypto]") {
  CHECK(md5Hex("") == "d41d8cd98f00b204e9800998ecf8427e");
  CHECK(md5Hex("hello") == "5d41402abc4b2a76b9719d911017c592");

  TempDir dir;
  writeFile(dir / "f.bin", "hello");
  CHECK(md5HexFile(dir / "f.bin").value() == "5d41402abc4b2a76b9719d911017c592");
  CHECK(md5HexFile(dir / "missing.bin").error().kind == ErrorKind::FilesystemError);
}

TEST_CASE("key block must be sixteen bytes", "[hls_crypto]") {
  CHECK(toKeyBlock("0123456789abcdef").has_value());
  CHECK(toKeyBlock("<html>404</html>!").error().kind == ErrorKind::DecryptError);
}
