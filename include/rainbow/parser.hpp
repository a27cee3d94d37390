// Rainbow surface parser (PEGTL front end)
#pragma once
#include "rainbow/ast.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace rainbow
{

    // Parsing stops at the first failure.
    struct ParseError
    {
        std::string message;  // human readable, e.g. "expected `]`"
        std::string expected; // what the parser was looking for, empty for semantic failures
        int line = 0;
        int col = 0;
        size_t offset = 0;
    };

    struct ParseResult
    {
        bool success{false};
        script ast;
        std::optional<ParseError> error;
    };

    class Parser
    {
    public:
        explicit Parser(size_t max_depth = 256) : max_depth_(max_depth) {}
        // Parse a whole script: one or more terms separated by whitespace.
        ParseResult parse_string(std::string_view src, std::string_view filename = "<script>") const;
        // Parse exactly one term (whitespace around it allowed).
        ParseResult parse_term(std::string_view src, std::string_view filename = "<term>") const;

    private:
        size_t max_depth_;
    };

} // namespace rainbow
