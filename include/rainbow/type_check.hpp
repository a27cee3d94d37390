// Rainbow type checker: inference, arity matching and the partiality guard
#pragma once
#include "rainbow/ast.hpp"
#include "rainbow/signature.hpp"
#include "rainbow/types.hpp"
#include <llvm/ADT/ImmutableMap.h>
#include <llvm/ADT/StringMap.h>
#include <string>
#include <vector>

namespace rainbow
{

    struct TypeNote
    {
        std::string message;
        int line = -1;
        int col = -1;
    };
    struct TypeError
    {
        std::string code;
        std::string message;
        std::string hint;
        int line = -1;
        int col = -1;
        std::vector<TypeNote> notes;
    };
    struct TypeWarning
    {
        std::string code;
        std::string message;
        std::string hint;
        int line = -1;
        int col = -1;
        std::vector<TypeNote> notes;
    };

    // Central reporter so every component shares one diagnostic shape.
    struct ErrorReporter
    {
        std::vector<TypeError> *errors = nullptr;
        std::vector<TypeWarning> *warnings = nullptr;
        void emit_error(const TypeError &e)
        {
            if (errors)
                errors->push_back(e);
        }
        void emit_warning(const TypeWarning &w)
        {
            if (warnings)
                warnings->push_back(w);
        }
        TypeError make_error(std::string code, std::string message, std::string hint, int line, int col) { return TypeError{std::move(code), std::move(message), std::move(hint), line, col, {}}; }
        TypeWarning make_warning(std::string code, std::string message, std::string hint, int line, int col) { return TypeWarning{std::move(code), std::move(message), std::move(hint), line, col, {}}; }
    };

    struct TypeCheckResult
    {
        bool success;
        std::vector<TypeError> errors;
        std::vector<TypeWarning> warnings;
    };

    namespace codes
    {
        inline constexpr const char *UnknownIdentifier = "E2001";
        inline constexpr const char *UnknownFunction = "E2002";
        inline constexpr const char *FieldMissing = "E2003";
        inline constexpr const char *ElementTypeMismatch = "E2004";
        inline constexpr const char *ArityMismatch = "E2005";
        inline constexpr const char *Mismatch = "E2006";
        inline constexpr const char *BlockArityMismatch = "E2007";
        inline constexpr const char *UnhandledPartiality = "E2008";
        inline constexpr const char *BranchTypeDivergence = "E2009";
        inline constexpr const char *EmptyListType = "E2010";
        inline constexpr const char *NestingTooDeep = "E2011";
        // warnings
        inline constexpr const char *UnusedBlockParam = "W2101";
        inline constexpr const char *TryCannotFail = "W2102";
    } // namespace codes

    struct CheckerConfig
    {
        size_t max_depth = 256;
        bool suggest = true; // "did you mean" notes
        bool trace = false;  // [rainbow][check] lines on stderr
    };

    // Checks one coercion-resolved script against a frozen signature table.
    // `ctx` is a per-check context layered over the table's types; the checker
    // interns the list/record/block types it infers there.
    class TypeChecker
    {
    public:
        TypeChecker(const SignatureTable &table, TypeContext &ctx, CheckerConfig cfg = {});

        // Outermost scope layer (script inputs). Later bindings shadow earlier ones.
        void bind_input(const std::string &name, TypeId type);

        TypeCheckResult check(const script &s);
        TypeCheckResult check(const term_ptr &t);

        // Type of the last top-level term after a check; 0 when it could not be determined.
        TypeId result_type() const { return result_type_; }

    private:
        struct Binding
        {
            std::string name;
            TypeId type;
            source_pos pos;
            bool used;
            bool input;
        };
        using Scope = llvm::ImmutableMap<unsigned, unsigned>; // symbol -> binding index

        const SignatureTable &table_;
        TypeContext &ctx_;
        CheckerConfig cfg_;
        Scope::Factory scope_factory_;
        Scope inputs_;
        llvm::StringMap<unsigned> symbols_;
        std::vector<std::string> symbol_names_;
        std::vector<Binding> bindings_;
        size_t depth_{0};
        bool depth_reported_{false};
        TypeId result_type_{0};

        unsigned intern(const std::string &name);
        Scope bind(Scope scope, const std::string &name, TypeId type, source_pos pos, bool input);
        Binding *lookup(const Scope &scope, const std::string &name);
        std::vector<std::string> scope_names(const Scope &scope) const;

        // `guarded`: the term is the direct body of a `try:` arm (a block there passes it on to its body).
        TypeId check_term(TypeCheckResult &r, const term_ptr &t, TypeId expected, const Scope &scope, bool guarded = false);
        TypeId check_variable(TypeCheckResult &r, const term &t, const variable_term &v, const Scope &scope);
        TypeId check_list(TypeCheckResult &r, const term &t, const list_term &l, TypeId expected, const Scope &scope);
        TypeId check_record(TypeCheckResult &r, const term &t, const record_term &rec, TypeId expected, const Scope &scope);
        TypeId check_block(TypeCheckResult &r, const term &t, const block_term &b, TypeId expected, const Scope &scope, bool guard_body);
        TypeId check_apply(TypeCheckResult &r, const term &t, const apply_term &a, const Scope &scope, bool guarded);
        TypeId check_try(TypeCheckResult &r, const term &t, const apply_term &a, TypeId expected, const Scope &scope);
        // Type produced by a try/or arm (the block's output, or the term itself when not a block).
        void check_unmatched(TypeCheckResult &r, const term_ptr &value, const Scope &scope);
        TypeId check_arm(TypeCheckResult &r, const term_ptr &arm, TypeId expected, const Scope &scope, bool guarded);
        // Matches keyword arguments to parameters; returns the parameter for each argument (nullptr if unmatched).
        std::vector<const ParamType *> match_arguments(TypeCheckResult &r, const term &t, const apply_term &a, const Type &fn);
        bool can_fail(const term_ptr &arm_body) const;

        void error_code(TypeCheckResult &r, source_pos pos, std::string code, std::string msg, std::string hint = "");
        // Mismatch with expected/found notes plus the first structural reason.
        void type_mismatch(TypeCheckResult &r, source_pos pos, const std::string &code, const std::string &role, TypeId expected, TypeId actual);
        void warn_code(TypeCheckResult &r, source_pos pos, std::string code, std::string msg, std::string hint = "");
        void trace(const term &t, TypeId ty) const;

        static int edit_distance(const std::string &a, const std::string &b);
        static std::vector<std::string> fuzzy_candidates(const std::string &target, const std::vector<std::string> &pool, int maxDist = 2);
        void append_suggestions(TypeError &err, const std::vector<std::string> &suggs) const;
    };

} // namespace rainbow
