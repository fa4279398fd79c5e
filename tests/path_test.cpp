#include <cassert>
#include <iostream>
#include "graft/bridge.hpp"
#include "graft/path.hpp"

using namespace graft;

static bool throws_path_error(const char* text){
    try { (void)parse_path(text); } catch(const path_error&){ return true; }
    return false;
}

static void test_parse(){
    auto p = parse_path("/members[0]/body/statements[12]");
    assert(p.steps.size() == 3);
    assert(p.steps[0].key == "members" && p.steps[0].index && *p.steps[0].index == 0);
    assert(p.steps[1].key == "body" && !p.steps[1].index);
    assert(*p.steps[2].index == 12);
    assert(to_string(p) == "/members[0]/body/statements[12]");
    assert(parse_path("/").steps.empty());
    assert(parse_path("").steps.empty());
    assert(to_string(parse_path("/")) == "/");
    assert(parse_path("/else-branch/init?").steps[1].key == "init?");

    assert(throws_path_error("members[0]"));
    assert(throws_path_error("/members["));
    assert(throws_path_error("/members[x]"));
    assert(throws_path_error("/members[0"));
    assert(throws_path_error("/body/"));
    assert(throws_path_error("//body"));
    assert(throws_path_error("/body[1]x"));
    assert(throws_path_error("/a[99999999999999999999999]"));
}

static void test_resolve(){
    Forest F;
    NodeId cls = load_tree(F, R"((class :name "C" :members [
        (field :name "f")
        (method :name "m"
          :modifiers [(public) (final)]
          :thrown #{(type-ref :name "E")}
          :body (block :statements [(a) (b) (c)]))]))", "PREV");
    NodeId method = F.children(cls, RoleKind::TypeMember)[1];
    NodeId body = F.slot(method, "body");
    NodeId b = F.children(body, RoleKind::Statement)[1];
    assert(resolve_path(F, cls, "/") == cls);
    assert(resolve_path(F, cls, "/members[1]") == method);
    assert(resolve_path(F, cls, "/members[1]/body/statements[1]") == b);
    assert(resolve_path(F, cls, "/members[1]/thrown[0]") == F.children(method, RoleKind::Thrown)[0]);
    NodeId fin = F.slot_values(method, "modifiers")[1];
    assert(F.at(fin).tag == "final");
    assert(resolve_path(F, cls, "/members[1]/modifiers[1]") == fin);
    assert(to_string(path_of(F, fin)) == "/members[1]/modifiers[1]");

    auto unresolved = [&](const char* text){
        try { (void)resolve_path(F, cls, text); } catch(const path_error&){ return true; }
        return false;
    };
    assert(unresolved("/members"));                 // container step without index
    assert(unresolved("/members[2]"));              // out of range
    assert(unresolved("/members[1]/body[0]"));      // single-valued slot with an index
    assert(unresolved("/members[1]/modifiers[2]")); // past the last value
    assert(unresolved("/members[1]/modifiers"));    // no single-valued slot of that name
    assert(unresolved("/members[0]/body"));         // no such slot
    assert(unresolved("/members[1]/statements[0]"));

    // path_of is the inverse of resolve_path
    assert(path_of(F, cls).steps.empty());
    assert(to_string(path_of(F, b)) == "/members[1]/body/statements[1]");
    for(NodeId n : F.subtree(cls))
        assert(resolve_path(F, cls, path_of(F, n)) == n);
}

void run_path_tests(){
    test_parse();
    test_resolve();
    std::cout << "Path tests passed\n";
}
