#pragma once
#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include "domain/errors.hpp"

namespace download_service {

using AesBlock = std::array<uint8_t, 16>;

// AES-128-CBC with PKCS#7 padding, as used by HLS segment encryption.
std::expected<std::string, Error> aes128CbcDecrypt(std::string_view ciphertext, const AesBlock& key, const AesBlock& iv);

// AES-128-ECB with PKCS#7 padding; unwraps the content key from the key service.
std::expected<std::string, Error> aes128EcbDecrypt(std::string_view ciphertext, std::string_view key);

std::expected<std::string, Error> base64Decode(std::string_view text);

std::string md5Hex(std::string_view data);
std::expected<std::string, Error> md5HexFile(const std::filesystem::path& path);

// "0x0123..." or "0123..." (32 hex digits).
std::expected<AesBlock, Error> parseHexIv(std::string_view text);

// Default IV: the media sequence number as a 128-bit big-endian integer.
AesBlock sequenceIv(uint64_t sequence);

std::expected<AesBlock, Error> toKeyBlock(std::string_view bytes);

} // namespace download_service
