// Host-facing entry point: parse, resolve block coercions, type check, aggregate effects.
#pragma once
#include "rainbow/ast.hpp"
#include "rainbow/coercion.hpp"
#include "rainbow/effects.hpp"
#include "rainbow/env.hpp"
#include "rainbow/parser.hpp"
#include "rainbow/signature.hpp"
#include "rainbow/type_check.hpp"
#include "rainbow/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rainbow
{

    struct CheckOptions
    {
        // Typed script inputs (name, type in signature notation), the outermost scope.
        std::vector<std::pair<std::string, std::string>> inputs;
        // Unset fields fall back to detect_env().
        std::optional<size_t> max_depth;
        std::optional<bool> suggest;
        std::optional<bool> trace;
        std::string filename = "<script>";
    };

    struct ScriptResult
    {
        bool success{false};
        std::optional<ParseError> parse_error;
        EffectSet effects;       // only on success
        std::string output_type; // type of the script's last term, only on success
        std::vector<TypeError> errors;
        std::vector<TypeWarning> warnings;
    };

    // Deterministic for a given table and source. The table must be frozen
    // (config_error otherwise); malformed input types also throw config_error.
    // Parse and type errors are reported in the result, never thrown.
    ScriptResult check_script(const SignatureTable &table, std::string_view source, const CheckOptions &opts = {});

} // namespace rainbow
