// Environment-driven checker configuration
#pragma once
#include <cstddef>

namespace rainbow
{

    // Upper bound on any nesting limit; parser and tree walks recurse once per level.
    inline constexpr size_t kMaxDepthCeiling = 4096;

    struct CheckEnv
    {
        size_t max_depth = 256; // RAINBOW_MAX_DEPTH
        bool suggest = true;    // RAINBOW_SUGGEST (0 disables)
        bool diag_json = false; // RAINBOW_DIAG_JSON=1
        bool trace = false;     // RAINBOW_TRACE=1
    };

    // Reads process env vars and constructs a CheckEnv; unset or malformed values keep the defaults,
    // and RAINBOW_MAX_DEPTH is clamped to kMaxDepthCeiling.
    CheckEnv detect_env();

} // namespace rainbow
