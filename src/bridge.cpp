#include "graft/bridge.hpp"
#include <algorithm>

namespace graft {

namespace {

const RoleKind kPrintOrder[] = {RoleKind::TypeParameter, RoleKind::Parameter, RoleKind::Thrown,
                                RoleKind::Argument, RoleKind::TypeMember, RoleKind::Statement};

[[noreturn]] void fail(const std::string& msg, const edn::node_ptr& at){
    throw bridge_error(msg, at ? at->line : -1, at ? at->col : -1);
}

NodeId build(Forest& F, const edn::node_ptr& form, const std::string& source, const Schema& schema){
    auto* l = form ? edn::as_list(*form) : nullptr;
    if(!l || l->elems.empty()) fail("expected a (tag :key value ...) form, got " + edn::to_string(form), form);
    auto* head = edn::as_symbol(*l->elems[0]);
    if(!head) fail("node form must start with a tag symbol", l->elems[0]);
    if((l->elems.size() - 1) % 2) fail("'" + head->name + "' has a key without a value", form);

    NodeId id = F.create(head->name, Origin{source, form->line, form->col});
    for(size_t i = 1; i < l->elems.size(); i += 2){
        const auto& key = l->elems[i];
        const auto& value = l->elems[i + 1];
        auto* kw = edn::as_keyword(*key);
        if(!kw) fail("expected a keyword in '" + head->name + "', got " + edn::to_string(key), key);
        if(F.at(id).props.count(kw->name) || F.slot(id, kw->name) != kNoNode || F.at(id).multi_slots.count(kw->name))
            fail("duplicate key :" + kw->name + " in '" + head->name + "'", key);

        if(auto role = role_for_key(kw->name)){
            if(!schema.accepts(head->name, *container_of(*role)))
                fail("'" + head->name + "' cannot hold :" + kw->name, key);
            const std::vector<edn::node_ptr>* elems = nullptr;
            if(*role == RoleKind::Thrown){
                if(auto* s = edn::as_set(*value)) elems = &s->elems;
                else fail(":thrown expects a set #{...}", value);
            } else {
                if(auto* v = edn::as_vector(*value)) elems = &v->elems;
                else fail(":" + kw->name + " expects a vector [...]", value);
            }
            for(auto& e : *elems) F.append(id, *role, build(F, e, source, schema));
        } else if(edn::is_atom(*value)){
            F.at(id).props[kw->name] = value;
        } else if(edn::as_list(*value)){
            F.set_slot(id, kw->name, build(F, value, source, schema));
        } else if(auto* v = edn::as_vector(*value)){
            // multi-valued attribute: every element must itself be a node form
            std::vector<NodeId> values;
            for(auto& e : v->elems) values.push_back(build(F, e, source, schema));
            F.assign_slot_values(id, kw->name, values);
        } else {
            fail("unsupported value for :" + kw->name + " in '" + head->name + "'", value);
        }
    }
    return id;
}

} // namespace

NodeId load_tree(Forest& forest, const edn::node_ptr& form, const std::string& source, const Schema& schema){
    return build(forest, form, source, schema);
}

NodeId load_tree(Forest& forest, std::string_view text, const std::string& source, const Schema& schema){
    return build(forest, edn::parse(text), source, schema);
}

edn::node_ptr to_edn(const Forest& forest, NodeId root){
    const Node& n = forest.at(root);
    edn::list out;
    out.elems.push_back(edn::n_sym(n.tag));
    for(auto& [key, value] : n.props){
        out.elems.push_back(edn::n_kw(key));
        out.elems.push_back(value);
    }
    for(RoleKind k : kPrintOrder){
        const auto& kids = forest.children(root, k);
        if(kids.empty()) continue;
        std::vector<edn::node_ptr> elems;
        for(NodeId kid : kids) elems.push_back(to_edn(forest, kid));
        out.elems.push_back(edn::n_kw(container_key(k)));
        if(k == RoleKind::Thrown){
            std::sort(elems.begin(), elems.end(), [](const edn::node_ptr& a, const edn::node_ptr& b){
                return edn::to_string(a) < edn::to_string(b);
            });
            out.elems.push_back(edn::make(edn::set{std::move(elems)}));
        } else {
            out.elems.push_back(edn::make(edn::vector_t{std::move(elems)}));
        }
    }
    for(auto& [key, kid] : n.slots){
        out.elems.push_back(edn::n_kw(key));
        out.elems.push_back(to_edn(forest, kid));
    }
    for(auto& [key, values] : n.multi_slots){
        if(values.empty()) continue;
        std::vector<edn::node_ptr> elems;
        for(NodeId v : values) elems.push_back(to_edn(forest, v));
        out.elems.push_back(edn::n_kw(key));
        out.elems.push_back(edn::make(edn::vector_t{std::move(elems)}));
    }
    return edn::make(std::move(out));
}

std::string print_tree(const Forest& forest, NodeId root){
    return edn::to_pretty_string(to_edn(forest, root));
}

bool trees_equal(const Forest& forest, NodeId a, NodeId b){
    return edn::equal(to_edn(forest, a), to_edn(forest, b));
}

Schema load_schema(std::string_view text){
    auto root = edn::parse(text);
    auto* m = edn::as_map(*root);
    if(!m) fail("schema must be a map of tag -> [container keywords]", root);
    Schema s;
    for(auto& [key, value] : m->entries){
        std::string tag;
        if(auto* sym = edn::as_symbol(*key)) tag = sym->name;
        else if(auto* str = edn::as_string(*key)) tag = *str;
        else fail("schema tag must be a symbol or string, got " + edn::to_string(key), key);
        auto* v = edn::as_vector(*value);
        if(!v) fail("schema entry for '" + tag + "' must be a vector", value);
        for(auto& e : v->elems){
            auto* kw = edn::as_keyword(*e);
            auto role = kw ? role_for_key(kw->name) : std::nullopt;
            if(!role) fail("unknown container " + edn::to_string(e) + " for '" + tag + "'", e);
            s.allow(tag, *container_of(*role));
        }
    }
    return s;
}

} // namespace graft
