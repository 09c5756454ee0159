#include "ids.hpp"

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace gateway {
namespace {

static uint64_t Rand64() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return rng();
}

static std::string Hex(uint64_t v, int width) {
  std::ostringstream oss;
  oss << std::hex << std::setw(width) << std::setfill('0') << v;
  return oss.str();
}

}  // namespace

std::string NewUuid() {
  uint64_t hi = Rand64();
  uint64_t lo = Rand64();
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  const std::string h = Hex(hi, 16);
  const std::string l = Hex(lo, 16);
  return h.substr(0, 8) + "-" + h.substr(8, 4) + "-" + h.substr(12, 4) + "-" + l.substr(0, 4) + "-" + l.substr(4, 12);
}

bool LooksLikeUuid(const std::string& s) {
  if (s.size() != 36) return false;
  for (size_t i = 0; i < s.size(); i++) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (s[i] != '-') return false;
      continue;
    }
    if (!std::isxdigit(static_cast<unsigned char>(s[i]))) return false;
  }
  return true;
}

std::string NewId(const std::string& prefix) {
  return prefix + "_" + Hex(Rand64(), 16);
}

}  // namespace gateway
