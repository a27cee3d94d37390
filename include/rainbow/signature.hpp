// Host-supplied function signature table
#pragma once
#include "rainbow/types.hpp"
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace rainbow
{

    // Reserved dispatch name of the built-in `try: { A } or: { A }` construct.
    inline constexpr const char *kTryKeyword = "try";
    inline constexpr const char *kOrKeyword = "or";

    // Parameters and output of a signature written in notation form, e.g.
    // "calc: number [plus]?: number [times]?: number :: number".
    struct SignatureText
    {
        std::vector<ParamType> params;
        TypeId output{0};
    };

    // Throws config_error on malformed text, duplicate parameter names, or a
    // variadic/optional dispatch keyword.
    SignatureText parse_signature(TypeContext &ctx, std::string_view text);

    class SignatureTable;

    // Fluent construction of one Function type; build() registers it.
    class FunctionBuilder
    {
    public:
        FunctionBuilder(SignatureTable &table, std::string name, TypeId type);
        FunctionBuilder &required(std::string name, TypeId type);
        FunctionBuilder &optional(std::string name, TypeId type);
        FunctionBuilder &variadic(std::string name, TypeId type);
        FunctionBuilder &required_variadic(std::string name, TypeId type);
        FunctionBuilder &returns(TypeId type);
        FunctionBuilder &partial(bool is_partial = true);
        FunctionBuilder &effect(std::string tag);
        TypeId build();

    private:
        SignatureTable &table_;
        std::vector<ParamType> params_;
        TypeId output_{0};
        bool partial_{false};
        std::vector<std::string> effects_;
    };

    // Maps dispatch names to Function types. Mutable until freeze(); afterwards it
    // is read-only and may be shared by any number of concurrent checks.
    class SignatureTable
    {
    public:
        SignatureTable() = default;
        SignatureTable(const SignatureTable &) = delete;
        SignatureTable &operator=(const SignatureTable &) = delete;

        // Type context owning every type the table refers to. Throws config_error once frozen.
        TypeContext &types();
        const TypeContext &types() const { return ctx_; }

        // `fn` must be a Function type of this table's context whose dispatch keyword is `name`.
        void register_function(const std::string &name, TypeId fn);
        TypeId register_signature(std::string_view text, bool partial = false, std::vector<std::string> effects = {});
        FunctionBuilder define(std::string name, TypeId type) { return FunctionBuilder(*this, std::move(name), type); }

        void freeze() { frozen_ = true; }
        bool frozen() const { return frozen_; }

        // Function type registered under `name`, or nullptr.
        const Type *lookup(std::string_view name) const;
        TypeId lookup_id(std::string_view name) const;
        std::vector<std::string> names() const;
        size_t size() const { return functions_.size(); }
        // Signature notation plus partial/effects annotations, for listings.
        std::string describe(std::string_view name) const;

    private:
        TypeContext ctx_;
        std::map<std::string, TypeId, std::less<>> functions_;
        bool frozen_{false};

        void check_mutable(const char *what) const;
    };

} // namespace rainbow
