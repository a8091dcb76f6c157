#pragma once
#include "grammar.hpp"
#include <string>
#include <string_view>

namespace dol::rules {

// Pieces captured while matching one rule against one line.
struct captures {
    std::string out;     // output of the rewriting grammars
    std::string subject; // qualified subject / moved subject / module name
    std::string tail;    // remainder of the line
};

namespace actions {
using namespace dol::rules::grammar;

template< typename Rule >
struct action : tao::pegtl::nothing< Rule > {};

template<> struct action< copy_word > {
    template< typename ActionInput >
    static void apply( const ActionInput& in, captures& c ) { c.out += in.string(); }
};
template<> struct action< copy_char > {
    template< typename ActionInput >
    static void apply( const ActionInput& in, captures& c ) { c.out += in.string(); }
};
template<> struct action< derive_from > {
    template< typename ActionInput >
    static void apply( const ActionInput&, captures& c ) { c.out += "derives from"; }
};
template<> struct action< bare_require > {
    template< typename ActionInput >
    static void apply( const ActionInput&, captures& c ) { c.out += "requires "; }
};

template<> struct action< clause_subject > {
    template< typename ActionInput >
    static void apply( const ActionInput& in, captures& c ) { c.subject = in.string(); }
};
template<> struct action< matched_subject > {
    template< typename ActionInput >
    static void apply( const ActionInput& in, captures& c ) { c.subject = in.string(); }
};
template<> struct action< quantified_name > {
    template< typename ActionInput >
    static void apply( const ActionInput& in, captures& c ) { c.subject = in.string(); }
};
template<> struct action< required_module > {
    template< typename ActionInput >
    static void apply( const ActionInput& in, captures& c ) { c.subject = in.string(); }
};
template<> struct action< line_tail > {
    template< typename ActionInput >
    static void apply( const ActionInput& in, captures& c ) { c.tail = in.string(); }
};
template<> struct action< clause_rest > {
    template< typename ActionInput >
    static void apply( const ActionInput& in, captures& c ) { c.tail = in.string(); }
};

template<> struct action< placeholder > {
    template< typename ActionInput >
    static void apply( const ActionInput& in, captures& c ) {
        const std::string s = in.string();
        c.out += '<';
        c.out.append( s, 1, s.size() - 2 );
        c.out += '>';
    }
};
template<> struct action< stray_open > {
    template< typename ActionInput >
    static void apply( const ActionInput&, captures& c ) { c.out += '('; }
};
template<> struct action< stray_close > {
    template< typename ActionInput >
    static void apply( const ActionInput&, captures& c ) { c.out += ')'; }
};

} // namespace actions

// Runs `Rule` anchored at the start of `text`; true when it matched.
template< typename Rule >
bool match( std::string_view text, captures& c, const char* source = "line" )
{
    tao::pegtl::memory_input in( text.data(), text.size(), source );
    return tao::pegtl::parse< Rule, actions::action >( in, c );
}

} // namespace dol::rules
