// Static effect aggregation: union of the declared effect tags of every call
#pragma once
#include "rainbow/ast.hpp"
#include "rainbow/signature.hpp"
#include <set>
#include <string>

namespace rainbow
{

    using EffectSet = std::set<std::string>;

    // Upper bound on the effects a script may perform: every call in every
    // subterm counts, including block bodies and both try/or arms. Calls to
    // unknown functions contribute nothing. Subterms deeper than `max_depth`
    // are not visited.
    EffectSet collect_effects(const SignatureTable &table, const term_ptr &t, size_t max_depth = 256);
    EffectSet collect_effects(const SignatureTable &table, const script &s, size_t max_depth = 256);

    std::string to_string(const EffectSet &effects);

} // namespace rainbow
