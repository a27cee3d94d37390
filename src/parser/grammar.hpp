#pragma once
#include <tao/pegtl.hpp>

// Every alternative of `term` commits (fires an action) only after a
// lookahead has decided it, so actions never need to be rolled back.
namespace rainbow::pegtl_front::grammar {
using namespace tao::pegtl;

struct ws : star< space > {};
// ident = ("_" | alpha) ("_" | alnum)*; a leading "_" marks a parameter as intentionally unused
struct ident : identifier {};

struct term;

// tokens
struct lbracket : one<'['> {};
struct rbracket : one<']'> {};
struct lbrace : one<'{'> {};
struct rbrace : one<'}'> {};
struct colon : one<':'> {};
struct equals : one<'='> {};
struct arrow : string<'=','>'> {};
struct dquote : one<'"'> {};
struct close_quote : one<'"'> {};

// bool = "true" | "false"
struct bool_lit : sor< keyword<'t','r','u','e'>, keyword<'f','a','l','s','e'> > {};

// number = "-"? int ("." digit+ exp? | exp)?
struct digits : plus< digit > {};
struct exponent : seq< one<'e','E'>, opt< one<'+','-'> >, plus< digit > > {};
struct fraction : seq< one<'.'>, plus< digit >, opt< exponent > > {};
struct number : seq< opt< one<'-'> >, digits, opt< sor< fraction, exponent > >, not_at< identifier_other > > {};

// string = "\"" (escape | any-but-quote-or-backslash)* "\""
struct escaped : seq< one<'\\'>, any > {};
struct string_char : sor< escaped, not_one<'"','\\'> > {};
struct string_lit : seq< dquote, star< string_char >, must< close_quote > > {};

// variable = ident ("." ident)*
struct variable : seq< ident, star< one<'.'>, ident > > {};

// apply = ident ":" term (ident ":" term)*
struct keyword_ahead : at< ident, colon > {};
struct keyword_name : ident {};
struct argument : seq< keyword_name, colon, ws, must< term > > {};
struct apply_begin : success {};
struct apply_end : success {};
struct apply : seq< keyword_ahead, apply_begin, argument, star< ws, keyword_ahead, argument >, apply_end > {};

// record = "[" entry entry* "]" | "[" "=" "]"
struct entry_ahead : at< ident, ws, equals > {};
struct entry_name : ident {};
struct entry : seq< entry_ahead, entry_name, ws, equals, ws, must< term > > {};
struct empty_record : seq< equals, ws > {};
struct record_ahead : at< sor< entry_ahead, seq< equals, ws, rbracket > > > {};
struct record_begin : success {};
struct record : seq< lbracket, ws, record_ahead, record_begin, sor< empty_record, plus< entry, ws > >, must< rbracket > > {};

// list = "[" term* "]"
struct list_begin : success {};
struct list : seq< lbracket, list_begin, ws, star< term, ws >, must< rbracket > > {};

// block = "{" block_args? term "}"
struct block_param : ident {};
struct block_args : seq< at< plus< ident, ws >, arrow >, plus< block_param, ws >, arrow > {};
struct block_begin : success {};
struct block : seq< lbrace, block_begin, ws, opt< block_args, ws >, must< term >, ws, must< rbrace > > {};

struct term : sor< apply, block, record, list, string_lit, number, bool_lit, variable > {};

struct script_end : eof {};
struct script : seq< ws, must< term >, ws, star< term, ws >, must< script_end > > {};
struct single_term : seq< ws, must< term >, ws, must< eof > > {};

} // namespace rainbow::pegtl_front::grammar
