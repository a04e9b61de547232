#include "uuid.hpp"

#include <random>

namespace fetchledger::util {

namespace {

constexpr char kHex[] = "0123456789abcdef";

std::string Hex(const UUID& id) {
  std::string out;
  out.reserve(id.size() * 2);
  for (const auto b : id) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id) {
    b = static_cast<std::uint8_t>(rng());
  }

  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;
  return id;
}

std::string ToString(const UUID& id) {
  const auto hex = Hex(id);
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" + hex.substr(20);
}

std::string RandomTag(std::size_t length) {
  return Hex(GenerateUUID()).substr(0, length);
}

} // namespace fetchledger::util
