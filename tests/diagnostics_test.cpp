#include <cassert>
#include <iostream>
#include "graft/bridge.hpp"
#include "graft/diagnostics.hpp"

using namespace graft;

void run_diagnostics_tests(){
    assert(json_escape("a\"b\\c\n\x01") == "\"a\\\"b\\\\c\\n\\u0001\"");

    Forest F;
    NodeId m = load_tree(F, "(method :name \"m\" :params [(param :name \"a\")])", "PREV");
    NodeId p = F.children(m, RoleKind::Parameter)[0];
    F.detach(p);
    detached_node_error err(p, "delete");
    assert(err.code() == "E2001" && err.node() == p);

    auto f = describe_failure(F, err, "prev.edn", "new.edn");
    assert(f.code == "E2001" && f.node_tag == "param" && f.node_path == "/");
    assert(f.origin.source == "PREV" && f.origin.line == 1);
    auto text = format_failure(f);
    assert(text.find("patch application failed for revision pair prev.edn -> new.edn\n") == 0);
    assert(text.find("error[E2001]: delete: node #") != std::string::npos);
    assert(text.find("note: node #" + std::to_string(p) + " 'param' at / from PREV (line 1:") != std::string::npos);

    auto js = diagnostics_to_json(f);
    assert(js.find("\"code\":\"E2001\"") != std::string::npos);
    assert(js.find("\"prev\":\"prev.edn\"") != std::string::npos);
    assert(js.find("\"node\":" + std::to_string(p)) != std::string::npos);
    assert(js.front() == '{' && js.back() == '}');

    invalid_position_error pos(m, 4, 1);
    assert(pos.code() == "E2002" && pos.position == 4 && pos.length == 1);
    assert(std::string(pos.what()).find("[0, 1]") != std::string::npos);
    assert(structural_mismatch_error(m, "x").code() == "E2003");
    assert(unsupported_role_error(m, "x").code() == "E2004");
    std::cout << "Diagnostics tests passed\n";
}
