/*
 * execgate C++17 - Configuration Implementation
 */
#include <execgate/core/config.hpp>
#include <execgate/core/logger.hpp>
#include <execgate/core/utils.hpp>

#include <fstream>
#include <sstream>

namespace execgate {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        last_error_ = "Cannot open config file: " + path;
        return false;
    }

    std::ostringstream buf;
    buf << file.rdbuf();
    if (!load_string(buf.str())) {
        last_error_ = path + ": " + last_error_;
        return false;
    }
    return true;
}

bool Config::load_string(const std::string& content) {
    Json parsed;
    try {
        parsed = Json::parse(content);
    } catch (const Json::parse_error& e) {
        last_error_ = std::string("Invalid JSON: ") + e.what();
        return false;
    }

    if (!parsed.is_object()) {
        last_error_ = "Config root must be a JSON object";
        return false;
    }

    data_ = parsed;
    last_error_.clear();
    return true;
}

const Json* Config::lookup(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split_any(key, ".");
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return NULL;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return NULL;
        node = &(*it);
    }
    return node;
}

bool Config::has(const std::string& key) const {
    return lookup(key) != NULL;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json* v = lookup(key);
    if (!v || !v->is_string()) return def;
    return v->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json* v = lookup(key);
    if (!v || !v->is_number_integer()) {
        if (v && !v->is_null()) {
            LOG_WARN("Config key '%s' is not an integer, using default %lld",
                     key.c_str(), static_cast<long long>(def));
        }
        return def;
    }
    return v->get<int64_t>();
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json* v = lookup(key);
    if (!v || !v->is_boolean()) return def;
    return v->get<bool>();
}

std::vector<std::string> Config::get_string_list(const std::string& key) const {
    std::vector<std::string> out;
    const Json* v = lookup(key);
    if (!v || !v->is_array()) return out;

    for (Json::const_iterator it = v->begin(); it != v->end(); ++it) {
        if (it->is_string()) {
            out.push_back(it->get<std::string>());
        } else {
            LOG_WARN("Config key '%s' contains a non-string entry, skipped", key.c_str());
        }
    }
    return out;
}

void Config::set_string(const std::string& key, const std::string& value) {
    Json* node = &data_;
    std::vector<std::string> parts = split_any(key, ".");
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        Json& child = (*node)[parts[i]];
        if (!child.is_object()) {
            child = Json::object();
        }
        node = &child;
    }
    (*node)[parts.back()] = value;
}

} // namespace execgate
