#pragma once

#include <cstddef>
#include <string>

namespace execbox::random {

// Cryptographically secure random bytes as hex (2 chars per byte)
// @throws std::runtime_error if the OpenSSL generator fails
[[nodiscard]] std::string hex(size_t byte_count, bool uppercase = false);

} // namespace execbox::random
