#include <execgate/core/redactor.hpp>

#include <cctype>
#include <cstring>

namespace execgate {

const char* const REDACTED_PLACEHOLDER = "***REDACTED***";

namespace {

struct SecretKey {
    const char* name;
    bool assignment;    // "name = value" when true, "name <ws> value" otherwise
};

const SecretKey SECRET_KEYS[] = {
    {"api_key", true},
    {"api-key", true},
    {"apikey", true},
    {"token", true},
    {"password", true},
    {"bearer", false},
};

bool is_value_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_quote(char c) {
    return c == '"' || c == '\'';
}

// Case-insensitive compare of `key` (lowercase) at text[pos]
bool key_at(const std::string& text, size_t pos, const char* key) {
    size_t len = std::strlen(key);
    if (pos + len > text.size()) return false;
    for (size_t i = 0; i < len; ++i) {
        if (std::tolower(static_cast<unsigned char>(text[pos + i])) != key[i]) return false;
    }
    return true;
}

// If a secret starts at `pos`, set [value_begin, value_end) to the span to
// mask (quotes included) and return true. Iterative, so the cost is linear
// in the value length and nothing recurses.
bool match_secret(const std::string& text, size_t pos, const SecretKey& key,
                  size_t& value_begin, size_t& value_end) {
    if (!key_at(text, pos, key.name)) return false;
    size_t i = pos + std::strlen(key.name);

    if (key.assignment) {
        while (i < text.size() && is_space(text[i])) ++i;
        if (i >= text.size() || text[i] != '=') return false;
        ++i;
        while (i < text.size() && is_space(text[i])) ++i;
    } else {
        size_t ws = i;
        while (i < text.size() && is_space(text[i])) ++i;
        if (i == ws) return false;
    }

    value_begin = i;
    if (key.assignment && i < text.size() && is_quote(text[i])) ++i;

    size_t run = i;
    while (i < text.size() && is_value_char(text[i])) ++i;
    if (i == run) return false;

    if (key.assignment && i < text.size() && is_quote(text[i])) ++i;
    value_end = i;
    return true;
}

} // anonymous namespace

std::string redact_secrets(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        bool masked = false;
        for (size_t k = 0; k < sizeof(SECRET_KEYS) / sizeof(SECRET_KEYS[0]); ++k) {
            size_t begin = 0, end = 0;
            if (match_secret(text, pos, SECRET_KEYS[k], begin, end)) {
                out.append(text, pos, begin - pos);
                out += REDACTED_PLACEHOLDER;
                pos = end;
                masked = true;
                break;
            }
        }
        if (!masked) out += text[pos++];
    }
    return out;
}

} // namespace execgate
