#include <cassert>
#include <iostream>
#include <stdexcept>
#include "graft/forest.hpp"

using namespace graft;

template<typename Fn>
static bool throws_invalid(Fn fn){
    try { fn(); } catch(const std::invalid_argument&){ return true; }
    return false;
}

static NodeId named(Forest& F, const char* tag, const char* name){
    NodeId n = F.create(tag, Origin{"PREV", 1, 1});
    F.at(n).props["name"] = edn::n_str(name);
    return n;
}

static void test_containers(){
    Forest F;
    NodeId block = F.create("block");
    NodeId a = named(F, "stmt", "a"), b = named(F, "stmt", "b"), c = named(F, "stmt", "c");
    F.append(block, RoleKind::Statement, a);
    F.append(block, RoleKind::Statement, c);
    F.insert_at(block, RoleKind::Statement, 1, b);
    assert((F.children(block, RoleKind::Statement) == std::vector<NodeId>{a, b, c}));
    assert(F.at(b).parent == block && F.at(b).role == Role::of(RoleKind::Statement));
    assert(!F.attached(block));
    // attached nodes cannot be attached twice, positions past the end are rejected
    assert(throws_invalid([&]{ F.append(block, RoleKind::Statement, a); }));
    assert(throws_invalid([&]{ F.insert_at(block, RoleKind::Statement, 5, F.create("stmt")); }));
    assert(throws_invalid([&]{ (void)F.children(block, RoleKind::Other); }));

    assert(F.detach(b) == 1);
    assert((F.children(block, RoleKind::Statement) == std::vector<NodeId>{a, c}));
    assert(F.at(b).parent == kNoNode && F.at(b).role.kind == RoleKind::None);
    assert(throws_invalid([&]{ F.detach(b); }));

    bool out_of_range = false;
    try { (void)F.at(999); } catch(const std::out_of_range&){ out_of_range = true; }
    assert(out_of_range);
}

static void test_slots_and_replace(){
    Forest F;
    NodeId method = F.create("method");
    NodeId body = F.create("block");
    NodeId other = F.create("block");
    assert(F.set_slot(method, "body", body) == kNoNode);
    assert(F.slot(method, "body") == body);
    assert(F.at(body).role == Role::in_slot("body"));
    // overwriting a slot detaches the previous occupant
    assert(F.set_slot(method, "body", other) == body);
    assert(!F.attached(body) && F.slot(method, "body") == other);

    // replace keeps the slot key
    F.replace(other, body);
    assert(F.slot(method, "body") == body && !F.attached(other));

    // replace keeps the index; a replacement taken from the same container is moved, not duplicated
    NodeId a = named(F, "stmt", "a"), b = named(F, "stmt", "b"), c = named(F, "stmt", "c");
    for(NodeId s : {a, b, c}) F.append(body, RoleKind::Statement, s);
    F.replace(c, a);
    assert((F.children(body, RoleKind::Statement) == std::vector<NodeId>{b, a}));
    assert(!F.attached(c));

    // a replacement hanging in another tree leaves it
    NodeId other_block = F.create("block");
    NodeId d = named(F, "stmt", "d");
    F.append(other_block, RoleKind::Statement, d);
    F.replace(b, d);
    assert((F.children(body, RoleKind::Statement) == std::vector<NodeId>{d, a}));
    assert(F.children(other_block, RoleKind::Statement).empty());

    // a node cannot replace one of its own descendants
    assert(throws_invalid([&]{ F.replace(a, body); }));
    assert(throws_invalid([&]{ F.replace(d, method); }));

    // thrown sets
    NodeId t1 = named(F, "type-ref", "IOException"), t2 = named(F, "type-ref", "Error");
    F.append(method, RoleKind::Thrown, t1);
    F.assign_thrown(method, {t2});
    assert((F.children(method, RoleKind::Thrown) == std::vector<NodeId>{t2}));
    assert(!F.attached(t1));
}

static void test_clone_and_walks(){
    Forest F;
    NodeId cls = F.create("class", Origin{"NEW", 3, 1});
    NodeId m = named(F, "method", "run");
    F.append(cls, RoleKind::TypeMember, m);
    NodeId p = named(F, "param", "x");
    F.append(m, RoleKind::Parameter, p);
    NodeId body = F.create("block");
    F.set_slot(m, "body", body);
    NodeId t = named(F, "type-ref", "E");
    F.append(m, RoleKind::Thrown, t);

    size_t before = F.size();
    NodeId copy = F.clone(m);
    assert(F.size() == before + 4);
    assert(copy != m && !F.attached(copy));
    assert(F.at(copy).tag == "method" && F.at(copy).props.at("name") == F.at(m).props.at("name"));
    assert(F.at(copy).origin.source == F.at(m).origin.source);
    NodeId copied_param = F.children(copy, RoleKind::Parameter).at(0);
    assert(copied_param != p && F.at(copied_param).parent == copy);
    assert(F.slot(copy, "body") != body && F.at(F.slot(copy, "body")).role == Role::in_slot("body"));
    // the copy is independent of the original
    F.detach(copied_param);
    assert(F.children(m, RoleKind::Parameter).size() == 1);

    assert(F.is_ancestor(cls, body) && F.is_ancestor(m, m) && !F.is_ancestor(body, m));
    assert(F.root_of(body) == cls && F.root_of(cls) == cls);
    auto order = F.subtree(cls);
    assert((order == std::vector<NodeId>{cls, m, p, t, body}));
}

static void test_multi_valued_slots(){
    Forest F;
    NodeId m = named(F, "method", "run");
    NodeId pub = F.create("public"), fin = F.create("final"), st = F.create("static");
    F.insert_slot_value(m, "modifiers", 0, fin);
    F.insert_slot_value(m, "modifiers", 0, pub);
    assert((F.slot_values(m, "modifiers") == std::vector<NodeId>{pub, fin}));
    assert(F.in_multi_slot(fin) && !F.in_multi_slot(m));
    assert(F.slot_values(m, "annotations").empty());

    // replace keeps the index inside the value
    F.replace(pub, st);
    assert((F.slot_values(m, "modifiers") == std::vector<NodeId>{st, fin}));
    assert(!F.attached(pub));
    assert(F.detach(fin) == 1);
    assert((F.slot_values(m, "modifiers") == std::vector<NodeId>{st}));

    // clone copies every value; subtree visits them after single-valued slots
    NodeId body = F.create("block");
    F.set_slot(m, "body", body);
    NodeId copy = F.clone(m);
    assert(F.slot_values(copy, "modifiers").size() == 1 && F.slot_values(copy, "modifiers")[0] != st);
    assert((F.subtree(m) == std::vector<NodeId>{m, body, st}));

    // overwriting: a whole new value, previous values detached; a single-valued slot of the same
    // key is displaced too
    auto previous = F.assign_slot_values(m, "modifiers", {pub, fin});
    assert((previous == std::vector<NodeId>{st}) && !F.attached(st));
    assert((F.slot_values(m, "modifiers") == std::vector<NodeId>{pub, fin}));
    NodeId single = F.create("final");
    F.set_slot(m, "modifiers", single);
    assert(F.slot_values(m, "modifiers").empty() && !F.attached(pub) && !F.attached(fin));
    assert(throws_invalid([&]{ F.insert_slot_value(m, "modifiers", 0, pub); }));
    previous = F.assign_slot_values(m, "modifiers", {pub});
    assert((previous == std::vector<NodeId>{single}) && F.slot(m, "modifiers") == kNoNode);
    assert(throws_invalid([&]{ F.insert_slot_value(m, "modifiers", 5, fin); }));
}

static void test_schema(){
    auto s = Schema::java_like();
    assert(s.accepts("block", ContainerKind::Statements));
    assert(s.accepts("invocation", ContainerKind::Arguments));
    assert(s.accepts("class", ContainerKind::TypeMembers) && s.accepts("class", ContainerKind::TypeParameters));
    assert(s.accepts("method", ContainerKind::Parameters) && s.accepts("method", ContainerKind::ThrownSet));
    assert(!s.accepts("method", ContainerKind::Statements));
    assert(!s.accepts("literal", ContainerKind::Arguments));
    assert(s.knows("lambda") && !s.knows("literal"));
    Schema custom;
    custom.allow("seq", ContainerKind::Statements);
    assert(custom.accepts("seq", ContainerKind::Statements) && !custom.accepts("block", ContainerKind::Statements));
}

void run_forest_tests(){
    test_containers();
    test_slots_and_replace();
    test_clone_and_walks();
    test_multi_valued_slots();
    test_schema();
    std::cout << "Forest tests passed\n";
}
