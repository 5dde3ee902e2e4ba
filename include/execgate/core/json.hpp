#ifndef execgate_CORE_JSON_HPP
#define execgate_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace execgate {

typedef nlohmann::json Json;

} // namespace execgate

#endif // execgate_CORE_JSON_HPP
