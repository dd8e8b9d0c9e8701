#pragma once

#include <string>

#include "nlohmann/json.hpp"

namespace sandforge::cache {

// Domain tag hashed ahead of every fingerprint. Bump it whenever the
// fingerprint layout or the meaning of a cached result changes.
constexpr const char* kFingerprintTag = "sandforge/fp/v2";

// CRLF folded to LF and trailing whitespace-only lines dropped. Nothing else
// changes, so whitespace inside string literals stays significant.
std::string NormalizeSource(const std::string& source);

// Compact JSON with object keys in sorted order.
std::string CanonicalContext(const nlohmann::json& context);

// SHA-256 (64 lowercase hex chars) over the tag, language, runtime version,
// normalized source and canonical context, each length-prefixed.
std::string Fingerprint(const std::string& language,
                        const std::string& runtime_version,
                        const std::string& source,
                        const nlohmann::json& context);

}  // namespace sandforge::cache
