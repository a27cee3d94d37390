#include "rainbow/rainbow.hpp"
#include "rainbow/diagnostics_json.hpp"
#include <algorithm>
#include <cstdio>

namespace rainbow {

ScriptResult check_script(const SignatureTable& table, std::string_view source, const CheckOptions& opts){
	if(!table.frozen()) throw config_error("signature table must be frozen before checking scripts");
	CheckEnv env = detect_env();
	CheckerConfig cfg;
	cfg.max_depth = std::min(opts.max_depth.value_or(env.max_depth), kMaxDepthCeiling);
	cfg.suggest = opts.suggest.value_or(env.suggest);
	cfg.trace = opts.trace.value_or(env.trace);

	// Per-check types are interned in a child context so the shared table stays untouched.
	TypeContext ctx(&table.types());
	std::vector<std::pair<std::string, TypeId>> inputs;
	for(auto& in : opts.inputs) inputs.emplace_back(in.first, ctx.parse_type(in.second));

	ScriptResult out;
	Parser parser(cfg.max_depth);
	ParseResult parsed = parser.parse_string(source, opts.filename);
	if(!parsed.success){
		out.parse_error = parsed.error;
		if(cfg.trace) std::fprintf(stderr, "[rainbow][parse] %s:%d:%d %s\n", opts.filename.c_str(), parsed.error->line, parsed.error->col, parsed.error->message.c_str());
		maybe_print_json(out);
		return out;
	}

	CoercionResolver resolver(table, cfg.max_depth);
	script resolved = resolver.resolve(parsed.ast);
	if(cfg.trace) std::fprintf(stderr, "[rainbow][coerce] wrapped=%zu unwrapped=%zu\n", resolver.wrapped(), resolver.unwrapped());

	TypeChecker checker(table, ctx, cfg);
	for(auto& in : inputs) checker.bind_input(in.first, in.second);
	TypeCheckResult r = checker.check(resolved);
	out.errors = std::move(r.errors);
	out.warnings = std::move(r.warnings);
	out.success = r.success;
	if(out.success){
		out.output_type = ctx.to_string(checker.result_type());
		out.effects = collect_effects(table, resolved, cfg.max_depth);
		if(cfg.trace) std::fprintf(stderr, "[rainbow][check] ok: %s effects=%s\n", out.output_type.c_str(), to_string(out.effects).c_str());
	}
	maybe_print_json(out);
	return out;
}

} // namespace rainbow
