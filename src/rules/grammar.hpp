#pragma once
#include <tao/pegtl.hpp>

namespace dol::rules::grammar {
using namespace tao::pegtl;

// Character classes
struct word_char : sor< identifier_other, utf8::range< 0x80, 0x10FFFF > > {};
struct word_run : plus< word_char > {};
struct gap : plus< space > {};
struct dotted_name : plus< sor< word_char, one< '.' > > > {};
struct line_tail : star< any > {};
struct clause_rest : plus< any > {};

template< char... Cs >
struct kw : seq< string< Cs... >, not_at< word_char > > {};

// Rewrites applied anywhere in a line. Words are consumed whole, so a target
// can only start at a word boundary.
struct copy_word : plus< word_char > {};
struct copy_char : any {};
template< typename Target >
struct rewrite_all : seq< star< sor< Target, copy_word, copy_char > >, eof > {};

struct derive_from : seq< kw< 'd','e','r','i','v','e' >, gap, kw< 'f','r','o','m' > > {};
struct bare_require : seq< kw< 'r','e','q','u','i','r','e' >, gap, not_at< string< 'c','l','a','u','s','e' > > > {};

// <a.b.subject> <verb> ...
struct clause_verb : sor< kw< 'h','a','s' >,
                          kw< 'i','s' >,
                          kw< 'd','e','r','i','v','e','s' >,
                          kw< 'r','e','q','u','i','r','e','s' >,
                          kw< 'm','a','t','c','h','e','s' >,
                          kw< 'n','e','v','e','r' >,
                          kw< 'e','m','i','t','s' > > {};
struct clause_subject : dotted_name {};
struct subject_clause : seq< clause_subject, at< gap, clause_verb >, line_tail > {};

// trait
struct uses_clause : seq< dotted_name, gap, string< 'u','s','e','s' >, gap, line_tail > {};
struct emits_lead : string< 'e','m','i','t','s',' ' > {};
struct is_lead : seq< string< 'i','s' >, gap, word_char > {};

// constraint
struct matched_subject : word_run {};
struct matches_clause : seq< string< 'm','a','t','c','h','e','s' >, gap, matched_subject, gap, clause_rest, eof > {};
struct never_lead : string< 'n','e','v','e','r',' ' > {};

// system
struct system_requires : seq< string< 's','y','s','t','e','m' >, gap, string< 'r','e','q','u','i','r','e','s' >, gap, line_tail > {};
struct quantified_name : word_run {};
struct all_quantifier : seq< string< 'a','l','l' >, gap, quantified_name, gap, string< 'i','s' >, gap, line_tail > {};
struct required_module : dotted_name {};
struct unversioned_requires : seq< string< 'r','e','q','u','i','r','e','s' >, gap, required_module, star< space >, eof > {};

// exegesis text: {word} placeholders, stray braces, everything else copied
struct placeholder : seq< one< '{' >, word_run, one< '}' > > {};
struct stray_open : one< '{' > {};
struct stray_close : one< '}' > {};
struct exegesis_text : seq< star< sor< placeholder, stray_open, stray_close, copy_word, copy_char > >, eof > {};

} // namespace dol::rules::grammar
