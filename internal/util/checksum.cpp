#include "checksum.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <memory>

#include "internal/util/errors.hpp"

namespace fetchledger::util {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext NewSha256Context() {
  DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw InvalidState("sha256: digest init failed");
  }
  return ctx;
}

std::string FinishHex(EVP_MD_CTX* ctx) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int                               length = 0;
  if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1) {
    throw InvalidState("sha256: digest final failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    out.push_back(kHex[digest[i] >> 4]);
    out.push_back(kHex[digest[i] & 0x0F]);
  }
  return out;
}

} // namespace

std::string Sha256Hex(std::string_view data) {
  auto ctx = NewSha256Context();
  if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    throw InvalidState("sha256: digest update failed");
  }
  return FinishHex(ctx.get());
}

std::string Sha256File(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw IOError("cannot open " + path.string() + " for checksum");
  }

  auto                  ctx = NewSha256Context();
  std::array<char, 8192> chunk{};
  while (in) {
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    const auto got = in.gcount();
    if (got > 0 && EVP_DigestUpdate(ctx.get(), chunk.data(), static_cast<std::size_t>(got)) != 1) {
      throw InvalidState("sha256: digest update failed");
    }
  }
  if (in.bad()) {
    throw IOError("read failed while hashing " + path.string());
  }

  return FinishHex(ctx.get());
}

} // namespace fetchledger::util
