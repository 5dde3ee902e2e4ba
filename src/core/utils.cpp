#include <execgate/core/utils.hpp>
#include <cstdio>
#include <ctime>
#include <cstdlib>
#include <cstring>
#include <climits>
#include <sstream>
#include <iomanip>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <errno.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace execgate {

// ============ Time utilities ============

int64_t current_timestamp_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

std::string format_timestamp_ms(int64_t timestamp_ms) {
    time_t t = static_cast<time_t>(timestamp_ms / 1000);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    char out[48];
    snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(timestamp_ms % 1000));
    return std::string(out);
}

// ============ String utilities ============

std::string trim(const std::string& s) {
    return rtrim(ltrim(s));
}

std::string ltrim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    return s.substr(start);
}

std::string rtrim(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\n\r\f\v");
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

std::vector<std::string> split_any(const std::string& s, const std::string& delimiters) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end;
    while ((end = s.find_first_of(delimiters, start)) != std::string::npos) {
        parts.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    parts.push_back(s.substr(start));
    return parts;
}

// ============ Path utilities ============

bool path_within(const std::string& path, const std::string& root) {
    if (root.empty()) return false;
    if (root == "/") return !path.empty() && path[0] == '/';
    if (path.size() >= root.size() &&
        path.compare(0, root.size(), root) == 0) {
        return (path.size() == root.size() || path[root.size()] == '/');
    }
    return false;
}

std::string canonical_path(const std::string& path) {
    char resolved[PATH_MAX];
    const char* rp = realpath(path.c_str(), resolved);
    if (!rp) return "";
    return std::string(rp);
}

std::string current_directory() {
    char buf[PATH_MAX];
    if (getcwd(buf, sizeof(buf)) == NULL) return "";
    return std::string(buf);
}

static bool is_executable_file(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

std::string find_executable(const std::string& name) {
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) {
        return is_executable_file(name) ? canonical_path(name) : "";
    }
    const char* path_env = getenv("PATH");
    std::string search = (path_env && path_env[0] != '\0') ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::vector<std::string> dirs = split_any(search, ":");
    for (size_t i = 0; i < dirs.size(); ++i) {
        // Empty and relative entries would resolve against whatever
        // directory the child later changes into
        if (dirs[i].empty() || dirs[i][0] != '/') continue;
        std::string candidate = dirs[i] + "/" + name;
        if (is_executable_file(candidate)) return canonical_path(candidate);
    }
    return "";
}

// ============ Hashing utilities ============

static std::string to_hex(const unsigned char* bytes, unsigned int len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), NULL) != 1) {
        return "";
    }
    return to_hex(digest, digest_len);
}

std::string hmac_sha256_hex(const std::string& key, const std::string& data) {
    if (key.empty()) return "";

    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;

    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(data.data()), data.size(),
             mac, &mac_len) == NULL) {
        return "";
    }
    return to_hex(mac, mac_len);
}

bool random_bytes(size_t count, std::string& out) {
    std::string buf(count, '\0');
    if (count > 0 && RAND_bytes(reinterpret_cast<unsigned char*>(&buf[0]),
                                static_cast<int>(count)) != 1) {
        return false;
    }
    out.swap(buf);
    return true;
}

} // namespace execgate
