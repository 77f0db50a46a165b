#include "reclaim/hash.hpp"

// BLAKE3 is the sole hash primitive. Domain prefixes are part of the audit
// chain format; changing one invalidates every existing chain, so bump
// version::AUDIT_LOG_VERSION together with it.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace reclaim {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.version = blake3_version();
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string audit_line_digest(std::string_view line) {
  return hash_domain("audit:", line);
}

const std::string& audit_genesis_digest() {
  static const std::string kGenesis(64, '0');
  return kGenesis;
}

}  // namespace reclaim
