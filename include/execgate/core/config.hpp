/*
 * execgate C++17 - Configuration
 *
 * JSON configuration file with dotted-key access:
 *   cfg.get_int("policy.max_arg_len", 4096)
 */
#ifndef execgate_CORE_CONFIG_HPP
#define execgate_CORE_CONFIG_HPP

#include <execgate/core/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace execgate {

class Config {
public:
    Config();

    // Load from a JSON file. On failure the previous contents are kept
    // and last_error() describes the problem.
    bool load_file(const std::string& path);

    // Load from an in-memory JSON document
    bool load_string(const std::string& content);

    std::string get_string(const std::string& key, const std::string& def = "") const;
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    bool get_bool(const std::string& key, bool def = false) const;
    std::vector<std::string> get_string_list(const std::string& key) const;

    bool has(const std::string& key) const;

    void set_string(const std::string& key, const std::string& value);

    const std::string& last_error() const { return last_error_; }

private:
    // Walk a dotted key. Returns NULL if any segment is missing.
    const Json* lookup(const std::string& key) const;

    Json data_;
    std::string last_error_;
};

} // namespace execgate

#endif // execgate_CORE_CONFIG_HPP
