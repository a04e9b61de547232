#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace fetchledger::util {

/*
  SHA-256 helpers (OpenSSL EVP).

  Download checksums and config fingerprints are lowercase hex digests.
*/

std::string Sha256Hex(std::string_view data);

// Streams the file in fixed-size chunks. Throws IOError if it cannot be read.
std::string Sha256File(const std::filesystem::path& path);

} // namespace fetchledger::util
