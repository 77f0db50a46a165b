#pragma once

// reclaim/hash.hpp - BLAKE3 hashing used by the audit chain.

#include <string>
#include <string_view>

namespace reclaim {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing. The audit log uses the "audit:" domain so a line
// digest can never collide with any other digest the tool may produce.
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string audit_line_digest(std::string_view line);

// Digest that precedes the first line of a log.
const std::string& audit_genesis_digest();

}  // namespace reclaim
