#include "graft/script.hpp"
#include "graft/path.hpp"

namespace graft {

namespace {

const std::vector<edn::node_ptr>& entries(const edn::map& m, const char* key){
    static const std::vector<edn::node_ptr> none;
    auto v = edn::find_key(m, key);
    if(!v) return none;
    auto* vec = edn::as_vector(*v);
    if(!vec) throw script_error(std::string(":") + key + " must be a vector");
    return vec->elems;
}

const std::vector<edn::node_ptr>& tuple(const edn::node_ptr& n, size_t arity, const std::string& where){
    auto* v = edn::as_vector(*n);
    if(!v || v->elems.size() != arity)
        throw script_error(where + " must be a vector of " + std::to_string(arity) + " elements, got " + edn::to_string(n));
    return v->elems;
}

NodeId resolve(const Forest& F, NodeId root, const edn::node_ptr& n, const std::string& where){
    auto* s = edn::as_string(*n);
    if(!s) throw script_error(where + " must be a path string, got " + edn::to_string(n));
    try {
        return resolve_path(F, root, *s);
    } catch(const path_error& e){
        throw script_error(where + ": " + e.what());
    }
}

std::string at(const char* phase, size_t i){ return std::string(":") + phase + "[" + std::to_string(i) + "]"; }

} // namespace

PatchSet load_script(const Forest& forest, NodeId prev_root, NodeId new_root, const edn::node_ptr& script){
    auto* m = script ? edn::as_map(*script) : nullptr;
    if(!m) throw script_error("patch script must be a map");
    for(auto& kv : m->entries){
        auto* kw = edn::as_keyword(*kv.first);
        if(!kw || (kw->name != "delete" && kw->name != "update" && kw->name != "insert"))
            throw script_error("unknown patch script key " + edn::to_string(kv.first));
    }
    PatchSet out;
    const auto& dels = entries(*m, "delete");
    for(size_t i = 0; i < dels.size(); ++i)
        out.deletes.push_back(DeletePatch{resolve(forest, prev_root, dels[i], at("delete", i))});
    const auto& ups = entries(*m, "update");
    for(size_t i = 0; i < ups.size(); ++i){
        auto where = at("update", i);
        const auto& t = tuple(ups[i], 2, where);
        out.updates.push_back(UpdatePatch{resolve(forest, prev_root, t[0], where + " old"),
                                          resolve(forest, new_root, t[1], where + " new")});
    }
    const auto& ins = entries(*m, "insert");
    for(size_t i = 0; i < ins.size(); ++i){
        auto where = at("insert", i);
        const auto& t = tuple(ins[i], 3, where);
        auto* pos = edn::as_int(*t[0]);
        if(!pos || *pos < 0) throw script_error(where + " position must be a non-negative integer, got " + edn::to_string(t[0]));
        out.inserts.push_back(InsertPatch{static_cast<size_t>(*pos),
                                          resolve(forest, new_root, t[1], where + " node"),
                                          resolve(forest, prev_root, t[2], where + " target")});
    }
    return out;
}

PatchSet load_script(const Forest& forest, NodeId prev_root, NodeId new_root, std::string_view text){
    return load_script(forest, prev_root, new_root, edn::parse(text));
}

edn::node_ptr to_script(const Forest& forest, const PatchSet& patches){
    auto path = [&](NodeId n){ return edn::n_str(to_string(path_of(forest, n))); };
    edn::vector_t dels, ups, ins;
    for(auto& d : patches.deletes) dels.elems.push_back(path(d.node));
    for(auto& u : patches.updates) ups.elems.push_back(edn::make(edn::vector_t{{path(u.old_node), path(u.new_node)}}));
    for(auto& i : patches.inserts)
        ins.elems.push_back(edn::make(edn::vector_t{{edn::n_i64(static_cast<int64_t>(i.position)), path(i.node), path(i.target)}}));
    edn::map m;
    m.entries.emplace_back(edn::n_kw("delete"), edn::make(std::move(dels)));
    m.entries.emplace_back(edn::n_kw("update"), edn::make(std::move(ups)));
    m.entries.emplace_back(edn::n_kw("insert"), edn::make(std::move(ins)));
    return edn::make(std::move(m));
}

} // namespace graft
