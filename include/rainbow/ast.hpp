// Immutable Rainbow syntax tree with source positions
#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace rainbow
{

    struct source_pos
    {
        int line = -1;
        int col = -1;
        size_t offset = 0;
    };

    struct term;
    using term_ptr = std::shared_ptr<const term>;

    struct keyword_arg
    {
        std::string keyword;
        term_ptr value;
        source_pos pos; // position of the keyword token
    };
    // First keyword is the dispatch name.
    struct apply_term
    {
        std::vector<keyword_arg> args;
    };
    struct variable_term
    {
        std::vector<std::string> path;
    };
    struct record_entry
    {
        std::string name;
        term_ptr value;
    };
    // Entries keep source order; names are unique.
    struct record_term
    {
        std::vector<record_entry> entries;
    };
    struct list_term
    {
        std::vector<term_ptr> elems;
    };
    struct string_term
    {
        std::string value;
    };
    struct number_term
    {
        double value = 0;
    };
    struct bool_term
    {
        bool value = false;
    };
    struct block_term
    {
        std::vector<std::string> params;
        term_ptr body;
    };

    using term_data = std::variant<apply_term, variable_term, record_term, list_term, string_term, number_term, bool_term, block_term>;

    struct term
    {
        term_data data;
        source_pos pos;
    };

    // A script is one or more top-level terms; its value is the last one.
    struct script
    {
        std::vector<term_ptr> terms;
    };

    inline term_ptr make_term(term_data d, source_pos pos = {}) { return std::make_shared<const term>(term{std::move(d), pos}); }

    inline bool is_apply(const term &t) { return std::holds_alternative<apply_term>(t.data); }
    inline bool is_block(const term &t) { return std::holds_alternative<block_term>(t.data); }
    inline const apply_term *as_apply(const term &t) { return std::get_if<apply_term>(&t.data); }
    inline const block_term *as_block(const term &t) { return std::get_if<block_term>(&t.data); }
    inline bool is_zero_input_block(const term &t)
    {
        auto *b = as_block(t);
        return b && b->params.empty();
    }
    // Dispatch name of an apply, empty when the term is not a call.
    inline const std::string &dispatch_name(const apply_term &a)
    {
        static const std::string none;
        return a.args.empty() ? none : a.args.front().keyword;
    }

    // ------ Factory helpers (mostly for tests and hosts building terms directly) ------

    inline term_ptr t_str(std::string s, source_pos p = {}) { return make_term(string_term{std::move(s)}, p); }
    inline term_ptr t_num(double v, source_pos p = {}) { return make_term(number_term{v}, p); }
    inline term_ptr t_bool(bool b, source_pos p = {}) { return make_term(bool_term{b}, p); }
    inline term_ptr t_var(std::vector<std::string> path, source_pos p = {}) { return make_term(variable_term{std::move(path)}, p); }
    inline term_ptr t_list(std::vector<term_ptr> elems, source_pos p = {}) { return make_term(list_term{std::move(elems)}, p); }
    inline term_ptr t_record(std::vector<record_entry> entries, source_pos p = {}) { return make_term(record_term{std::move(entries)}, p); }
    inline term_ptr t_block(std::vector<std::string> params, term_ptr body, source_pos p = {}) { return make_term(block_term{std::move(params), std::move(body)}, p); }
    inline term_ptr t_apply(std::vector<std::pair<std::string, term_ptr>> kvs, source_pos p = {})
    {
        apply_term a;
        for (auto &kv : kvs)
            a.args.push_back(keyword_arg{std::move(kv.first), std::move(kv.second), p});
        return make_term(std::move(a), p);
    }

    // Render a term back to Rainbow surface syntax.
    std::string to_string(const term &t);
    inline std::string to_string(const term_ptr &t) { return to_string(*t); }
    std::string to_string(const script &s);

    // Structural equality ignoring source positions.
    bool equal(const term_ptr &a, const term_ptr &b);

    // Maximum nesting depth of a term (leaf = 1), computed with an explicit work stack.
    size_t depth(const term_ptr &t);

} // namespace rainbow
