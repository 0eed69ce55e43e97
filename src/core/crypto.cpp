#include "core/crypto.hpp"

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <cstdint>
#include <vector>

namespace egress::crypto {

namespace {

std::string to_hex(const uint8_t* data, size_t len) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += kDigits[data[i] >> 4];
        out += kDigits[data[i] & 0x0F];
    }
    return out;
}

} // anonymous namespace

std::optional<std::string> random_hex(size_t byte_count) {
    std::vector<uint8_t> bytes(byte_count);
    if (RAND_bytes(bytes.data(), static_cast<int>(byte_count)) != 1) {
        return std::nullopt;
    }
    return to_hex(bytes.data(), bytes.size());
}

std::string sha256_hex(std::string_view data) {
    uint8_t digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const uint8_t*>(data.data()), data.size(), digest);
    return to_hex(digest, SHA256_DIGEST_LENGTH);
}

} // namespace egress::crypto
