#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace egress::crypto {

// Hex string of `byte_count` bytes from RAND_bytes; nullopt if the CSPRNG fails
[[nodiscard]] std::optional<std::string> random_hex(size_t byte_count);

// Lower-case hex SHA-256 digest
[[nodiscard]] std::string sha256_hex(std::string_view data);

} // namespace egress::crypto
