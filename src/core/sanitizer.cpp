#include <execgate/core/sanitizer.hpp>
#include <execgate/core/utils.hpp>

#include <algorithm>

namespace execgate {

std::string sanitize_argument(const std::string& raw) {
    std::string out = raw;
    out.erase(std::remove(out.begin(), out.end(), '\0'), out.end());
    return trim(out);
}

std::vector<std::string> sanitize_arguments(const std::vector<std::string>& raw) {
    std::vector<std::string> out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        out.push_back(sanitize_argument(raw[i]));
    }
    return out;
}

CommandRequest sanitize_request(const CommandRequest& request) {
    CommandRequest out = request;
    out.args = sanitize_arguments(request.args);
    return out;
}

} // namespace execgate
