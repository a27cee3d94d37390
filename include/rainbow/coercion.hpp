// Syntactic block coercion at call-argument positions
#pragma once
#include "rainbow/ast.hpp"
#include "rainbow/signature.hpp"

namespace rainbow
{

    // Rewrites a tree so that every argument already has the block-ness its
    // parameter asks for:
    //   - parameter is a zero-input block, argument is not a block: wrap `T` as `{ T }`
    //   - parameter is not a block, argument is a zero-input block: unwrap `{ T }` to `T`
    //     (repeatedly)
    // Only declared parameter types are consulted; the arguments are never type checked.
    // Arguments of unknown functions or unknown keywords are left as written.
    class CoercionResolver
    {
    public:
        explicit CoercionResolver(const SignatureTable &table, size_t max_depth = 256) : table_(table), max_depth_(max_depth) {}

        term_ptr resolve(const term_ptr &t);
        script resolve(const script &s);

        size_t wrapped() const { return wrapped_; }
        size_t unwrapped() const { return unwrapped_; }

    private:
        enum class Expect
        {
            Unknown,
            ZeroInputBlock,
            InputBlock,
            Value
        };

        const SignatureTable &table_;
        size_t max_depth_;
        size_t depth_{0};
        size_t wrapped_{0};
        size_t unwrapped_{0};

        Expect expectation(const std::string &dispatch, const std::string &keyword) const;
        term_ptr resolve_argument(const term_ptr &value, Expect expect);
    };

} // namespace rainbow
