#ifndef REFINERY_CORE_HASH_UTILS_HPP_
#define REFINERY_CORE_HASH_UTILS_HPP_

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace refinery::core {

constexpr std::uint64_t kFnv1a64OffsetBasis = 14695981039346656037ULL;
constexpr std::uint64_t kFnv1a64Prime = 1099511628211ULL;

inline std::uint64_t Fnv1a64(std::string_view bytes,
                             std::uint64_t hash = kFnv1a64OffsetBasis) {
  for (const char c : bytes) {
    hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
    hash *= kFnv1a64Prime;
  }
  return hash;
}

// Fixed-width lowercase hex, 16 characters.
inline std::string ToHex64(std::uint64_t value) {
  std::ostringstream out;
  out << std::hex << std::nouppercase << std::setw(16) << std::setfill('0') << value;
  return out.str();
}

} // namespace refinery::core

#endif // REFINERY_CORE_HASH_UTILS_HPP_
