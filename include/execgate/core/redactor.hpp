/*
 * execgate C++17 - Output Secret Redaction
 *
 * Masks credential-looking assignments in captured output:
 *   api_key=..., api-key=..., apikey=..., token=..., password=..., Bearer ...
 * Matching is case-insensitive; the key is kept, the value becomes
 * ***REDACTED***. The scan is a single linear pass, so output of any size
 * up to the capture cap is safe to redact.
 */
#ifndef execgate_CORE_REDACTOR_HPP
#define execgate_CORE_REDACTOR_HPP

#include <string>

namespace execgate {

extern const char* const REDACTED_PLACEHOLDER;

std::string redact_secrets(const std::string& text);

} // namespace execgate

#endif // execgate_CORE_REDACTOR_HPP
