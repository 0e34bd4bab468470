#pragma once

#include <cstdint>
#include <string>

namespace negotiation_core {

// splitmix64-style mixing to decorrelate seeds
inline std::uint64_t mix_seed(std::uint64_t a, std::uint64_t b) {
  std::uint64_t z = a + 0x9e3779b97f4a7c15ULL + (b << 6) + (b >> 2);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

// FNV-1a over the id bytes (std::hash differs between standard libraries)
inline std::uint64_t hash_id(const std::string &id) {
  std::uint64_t h = 0xcbf29ce484222325ULL;
  for (const unsigned char c : id) {
    h ^= static_cast<std::uint64_t>(c);
    h *= 0x100000001b3ULL;
  }
  return h;
}

} // namespace negotiation_core
