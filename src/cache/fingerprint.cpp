#include "cache/fingerprint.hpp"

#include <iomanip>
#include <sstream>
#include <vector>

#include <openssl/sha.h>

namespace sandforge::cache {
namespace {

std::string Sha256Hex(const std::string& input) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    SHA256_Update(&ctx, input.data(), input.size());
    SHA256_Final(hash, &ctx);
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char byte : hash) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

void AppendField(std::string& buffer, const std::string& field) {
    buffer += std::to_string(field.size());
    buffer.push_back(':');
    buffer += field;
}

}  // namespace

std::string NormalizeSource(const std::string& source) {
    std::vector<std::string> lines;
    std::string line;
    for (std::size_t i = 0; i < source.size(); ++i) {
        const char c = source[i];
        if (c == '\r' && i + 1 < source.size() && source[i + 1] == '\n') {
            continue;
        }
        if (c == '\n') {
            lines.push_back(line);
            line.clear();
            continue;
        }
        line.push_back(c);
    }
    lines.push_back(line);
    // Interior whitespace is kept as is: it may sit inside a string literal.
    while (!lines.empty() &&
           lines.back().find_first_not_of(" \t\r\f\v") == std::string::npos) {
        lines.pop_back();
    }
    std::string normalized;
    for (const auto& entry : lines) {
        normalized += entry;
        normalized.push_back('\n');
    }
    return normalized;
}

std::string CanonicalContext(const nlohmann::json& context) {
    // nlohmann::json objects are ordered maps, so dump() is already sorted.
    return context.is_null() ? std::string("{}") : context.dump();
}

std::string Fingerprint(const std::string& language,
                        const std::string& runtime_version,
                        const std::string& source,
                        const nlohmann::json& context) {
    std::string buffer;
    AppendField(buffer, kFingerprintTag);
    AppendField(buffer, language);
    AppendField(buffer, runtime_version);
    AppendField(buffer, NormalizeSource(source));
    AppendField(buffer, CanonicalContext(context));
    return Sha256Hex(buffer);
}

}  // namespace sandforge::cache
