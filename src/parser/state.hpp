#pragma once
#include "rainbow/ast.hpp"
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace rainbow::pegtl_front {

// Shared state for the actions: finished terms and pending names live on flat
// stacks; a mark remembers where an open compound term started.
struct parse_state {
    struct mark {
        size_t terms;
        size_t names;
        source_pos pos;
    };
    std::vector<term_ptr> terms;
    std::vector<std::pair<std::string, source_pos>> names;
    std::vector<mark> marks;
    source_pos open_pos; // last `[` or `{` seen
    size_t depth{0};
    size_t max_depth{256};
    std::string expected;     // set by control::raise
    std::string semantic_msg; // set by actions rejecting well-formed syntax
    source_pos semantic_pos;

    void open(source_pos p){ marks.push_back(mark{terms.size(), names.size(), p}); }
    mark close(){ mark m = marks.back(); marks.pop_back(); return m; }
    std::vector<term_ptr> take_terms(size_t from){
        std::vector<term_ptr> out(std::make_move_iterator(terms.begin() + from), std::make_move_iterator(terms.end()));
        terms.resize(from);
        return out;
    }
    std::vector<std::pair<std::string, source_pos>> take_names(size_t from){
        std::vector<std::pair<std::string, source_pos>> out(std::make_move_iterator(names.begin() + from), std::make_move_iterator(names.end()));
        names.resize(from);
        return out;
    }
};

template<typename Position>
inline source_pos to_source_pos(const Position& p){
    return source_pos{static_cast<int>(p.line), static_cast<int>(p.column), static_cast<size_t>(p.byte)};
}

std::string unescape(const std::string& raw);
std::vector<std::string> split_path(const std::string& raw);

} // namespace rainbow::pegtl_front
