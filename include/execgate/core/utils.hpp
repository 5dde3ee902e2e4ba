#ifndef execgate_CORE_UTILS_HPP
#define execgate_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace execgate {

// ============ Math utilities ============

// Clamp a value between min and max
template<typename T>
T clamp(T value, T min_val, T max_val) {
    if (value < min_val) return min_val;
    if (value > max_val) return max_val;
    return value;
}

// ============ Time utilities ============

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Format a millisecond timestamp as ISO 8601 (YYYY-MM-DDTHH:MM:SS.mmmZ)
std::string format_timestamp_ms(int64_t timestamp_ms);

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Split string by any of the delimiter characters
std::vector<std::string> split_any(const std::string& s, const std::string& delimiters);

// ============ Path utilities ============

// Whether `path` equals `root` or lies beneath it (both absolute, normalized)
bool path_within(const std::string& path, const std::string& root);

// Canonical absolute path via realpath(3). Empty string if it cannot be resolved.
std::string canonical_path(const std::string& path);

// Current working directory of the process
std::string current_directory();

// Locate an executable: a name containing '/' is checked directly,
// anything else is searched on the absolute entries of $PATH. The result is
// a canonical absolute path, empty string if not found.
std::string find_executable(const std::string& name);

// ============ Hashing utilities ============

// Lowercase hex SHA-256 of `data`. Empty string if the digest could not be computed.
std::string sha256_hex(const std::string& data);

// Lowercase hex HMAC-SHA256 of `data` under `key`. Empty string if the key
// is empty or the MAC could not be computed.
std::string hmac_sha256_hex(const std::string& key, const std::string& data);

// `count` bytes from the OpenSSL CSPRNG. False (and `out` untouched) on failure.
bool random_bytes(size_t count, std::string& out);

} // namespace execgate

#endif // execgate_CORE_UTILS_HPP
