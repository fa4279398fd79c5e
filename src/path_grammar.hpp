#pragma once
#include "graft/path.hpp"
#include <tao/pegtl.hpp>
#include <string>

namespace graft::path_front {

namespace grammar {
using namespace tao::pegtl;

struct key_char : sor< alnum, one<'-','_','?','!','.','*','+','<','>','=','$','%','&',':'> > {};
struct key : plus< key_char > {};
struct index : plus< digit > {};
struct subscript : if_must< one<'['>, index, one<']'> > {};
struct step : if_must< one<'/'>, key, opt< subscript > > {};
struct root_only : seq< one<'/'>, eof > {};
struct path : must< sor< root_only, seq< plus< step >, eof >, eof > > {};

} // namespace grammar

namespace actions {
using namespace tao::pegtl;

template<typename Rule>
struct action : nothing<Rule> {};

template<> struct action< grammar::key > {
    template<typename Input>
    static void apply(const Input& in, NodePath& p){ p.steps.push_back(PathStep{in.string(), std::nullopt}); }
};

template<> struct action< grammar::index > {
    template<typename Input>
    static void apply(const Input& in, NodePath& p){
        try { p.steps.back().index = static_cast<size_t>(std::stoull(in.string())); }
        catch(const std::out_of_range&){ throw path_error("index '" + in.string() + "' is too large"); }
    }
};

} // namespace actions

} // namespace graft::path_front
