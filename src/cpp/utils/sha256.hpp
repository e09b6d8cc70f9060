#pragma once
// SHA-256 (FIPS 180-4), pure C++. Checkpoint checksums are the hex digest of
// the canonical progress encoding.
#include <string>

namespace harvest {

// Lowercase hex digest, 64 characters
std::string sha256_hex(const std::string& data);

} // namespace harvest
