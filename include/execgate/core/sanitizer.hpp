/*
 * execgate C++17 - Argument Sanitizer
 *
 * Structural clean-up applied before any semantic check: trims surrounding
 * whitespace and drops embedded NUL bytes. Empty results pass through.
 */
#ifndef execgate_CORE_SANITIZER_HPP
#define execgate_CORE_SANITIZER_HPP

#include <execgate/core/types.hpp>
#include <string>
#include <vector>

namespace execgate {

std::string sanitize_argument(const std::string& raw);

std::vector<std::string> sanitize_arguments(const std::vector<std::string>& raw);

// Copy of the request with every argument sanitized
CommandRequest sanitize_request(const CommandRequest& request);

} // namespace execgate

#endif // execgate_CORE_SANITIZER_HPP
