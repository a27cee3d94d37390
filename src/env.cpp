#include "rainbow/env.hpp"
#include <cstdlib>
#include <string>

namespace rainbow {

CheckEnv detect_env(){
    CheckEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    // Nesting limit shared by the parser and every tree walk
    if (const char* v = get("RAINBOW_MAX_DEPTH")) {
        char* end = nullptr;
        unsigned long n = std::strtoul(v, &end, 10);
        if (end && *end == '\0' && n > 0) e.max_depth = n < kMaxDepthCeiling ? static_cast<size_t>(n) : kMaxDepthCeiling;
    }

    // Suggestions default ON; explicit 0 disables
    if (const char* v = get("RAINBOW_SUGGEST")) e.suggest = (v[0] != '0');

    if (const char* v = get("RAINBOW_DIAG_JSON")) e.diag_json = (std::string(v) == "1");
    if (const char* v = get("RAINBOW_TRACE")) e.trace = (std::string(v) == "1");

    return e;
}

} // namespace rainbow
