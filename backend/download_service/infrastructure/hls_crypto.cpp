#include "hls_crypto.hpp"
#include <cctype>
#include <cstdio>
#include <fstream>
#include <memory>
#include <vector>
#include <openssl/evp.h>

namespace download_service {

namespace {

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

struct DigestCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using DigestCtx = std::unique_ptr<EVP_MD_CTX, DigestCtxDeleter>;

std::expected<std::string, Error> decrypt(
  const EVP_CIPHER* cipher,
  std::string_view ciphertext,
  const unsigned char* key,
  const unsigned char* iv
) {
  CipherCtx ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    return std::unexpected(makeError(ErrorKind::DecryptError, "Failed to allocate cipher context"));
  }
  if (EVP_DecryptInit_ex(ctx.get(), cipher, nullptr, key, iv) != 1) {
    return std::unexpected(makeError(ErrorKind::DecryptError, "Failed to initialise cipher"));
  }
  EVP_CIPHER_CTX_set_padding(ctx.get(), 1);

  std::string plain(ciphertext.size() + EVP_MAX_BLOCK_LENGTH, '\0');
  int out_len = 0;
  if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(plain.data()), &out_len,
                        reinterpret_cast<const unsigned char*>(ciphertext.data()),
                        static_cast<int>(ciphertext.size())) != 1) {
    return std::unexpected(makeError(ErrorKind::DecryptError, "Decryption failed"));
  }
  int final_len = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(plain.data()) + out_len, &final_len) != 1) {
    return std::unexpected(makeError(ErrorKind::DecryptError, "Bad padding or wrong key"));
  }
  plain.resize(static_cast<size_t>(out_len + final_len));
  return plain;
}

std::string toHex(const unsigned char* data, size_t size) {
  static const char* kDigits = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (size_t i = 0; i < size; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0F]);
  }
  return out;
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

std::expected<std::string, Error> aes128CbcDecrypt(std::string_view ciphertext, const AesBlock& key, const AesBlock& iv) {
  if (ciphertext.empty() || ciphertext.size() % 16 != 0) {
    return std::unexpected(makeError(ErrorKind::DecryptError,
      "Ciphertext length " + std::to_string(ciphertext.size()) + " is not a multiple of the block size"));
  }
  return decrypt(EVP_aes_128_cbc(), ciphertext, key.data(), iv.data());
}

std::expected<std::string, Error> aes128EcbDecrypt(std::string_view ciphertext, std::string_view key) {
  if (key.size() != 16) {
    return std::unexpected(makeError(ErrorKind::DecryptError, "AES-128 key must be 16 bytes"));
  }
  if (ciphertext.empty() || ciphertext.size() % 16 != 0) {
    return std::unexpected(makeError(ErrorKind::DecryptError, "Wrapped key has an invalid length"));
  }
  return decrypt(EVP_aes_128_ecb(), ciphertext, reinterpret_cast<const unsigned char*>(key.data()), nullptr);
}

std::expected<std::string, Error> base64Decode(std::string_view text) {
  std::string compact;
  compact.reserve(text.size());
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) compact.push_back(c);
  }
  if (compact.empty() || compact.size() % 4 != 0) {
    return std::unexpected(makeError(ErrorKind::ParseError, "Invalid base64 length"));
  }

  std::string out(compact.size() / 4 * 3, '\0');
  int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                reinterpret_cast<const unsigned char*>(compact.data()),
                                static_cast<int>(compact.size()));
  if (written < 0) {
    return std::unexpected(makeError(ErrorKind::ParseError, "Invalid base64 data"));
  }
  // EVP_DecodeBlock counts padding as zero bytes
  size_t padding = 0;
  if (compact.back() == '=') ++padding;
  if (compact.size() > 1 && compact[compact.size() - 2] == '=') ++padding;
  out.resize(static_cast<size_t>(written) - padding);
  return out;
}

std::string md5Hex(std::string_view data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  EVP_Digest(data.data(), data.size(), digest, &length, EVP_md5(), nullptr);
  return toHex(digest, length);
}

std::expected<std::string, Error> md5HexFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(makeError(ErrorKind::FilesystemError, "Cannot open " + path.string()));
  }
  DigestCtx ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
    return std::unexpected(makeError(ErrorKind::FilesystemError, "Failed to initialise MD5"));
  }
  std::vector<char> buffer(64 * 1024);
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = in.gcount();
    if (got > 0) {
      EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got));
    }
  }
  if (in.bad()) {
    return std::unexpected(makeError(ErrorKind::FilesystemError, "Read error on " + path.string()));
  }
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  EVP_DigestFinal_ex(ctx.get(), digest, &length);
  return toHex(digest, length);
}

std::expected<AesBlock, Error> parseHexIv(std::string_view text) {
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    text.remove_prefix(2);
  }
  if (text.size() != 32) {
    return std::unexpected(makeError(ErrorKind::ManifestError, "IV must be 32 hex digits"));
  }
  AesBlock iv{};
  for (size_t i = 0; i < 16; ++i) {
    int high = hexValue(text[2 * i]);
    int low = hexValue(text[2 * i + 1]);
    if (high < 0 || low < 0) {
      return std::unexpected(makeError(ErrorKind::ManifestError, "IV contains non-hex characters"));
    }
    iv[i] = static_cast<uint8_t>((high << 4) | low);
  }
  return iv;
}

AesBlock sequenceIv(uint64_t sequence) {
  AesBlock iv{};
  for (int i = 15; i >= 8; --i) {
    iv[i] = static_cast<uint8_t>(sequence & 0xFF);
    sequence >>= 8;
  }
  return iv;
}

std::expected<AesBlock, Error> toKeyBlock(std::string_view bytes) {
  if (bytes.size() != 16) {
    return std::unexpected(makeError(ErrorKind::DecryptError,
      "Content key must be 16 bytes, got " + std::to_string(bytes.size())));
  }
  AesBlock key{};
  for (size_t i = 0; i < 16; ++i) key[i] = static_cast<uint8_t>(bytes[i]);
  return key;
}

} // namespace download_service
