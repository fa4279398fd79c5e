#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "graft/graft.hpp"

using namespace graft;

static bool read_file(const std::string& path, std::string& out){
    std::ifstream ifs(path);
    if(!ifs) return false;
    std::stringstream ss; ss<<ifs.rdbuf(); out = ss.str();
    return true;
}

static int usage(){
    std::cerr << "usage: graft_apply [--check] [--schema <schema.edn>] <prev.edn> <new.edn> <patches.edn>\n";
    return 1;
}

int main(int argc, char** argv){
    bool check = false;
    std::string schema_file;
    std::vector<std::string> files;
    for(int i = 1; i < argc; ++i){
        std::string a = argv[i];
        if(a == "--check") check = true;
        else if(a == "--schema"){ if(++i >= argc) return usage(); schema_file = argv[i]; }
        else if(a.rfind("--", 0) == 0) return usage();
        else files.push_back(a);
    }
    if(files.size() != 3) return usage();

    std::string texts[3];
    for(int i = 0; i < 3; ++i){
        if(!read_file(files[i], texts[i])){ std::cerr << "failed to read " << files[i] << "\n"; return 1; }
    }

    Forest forest;
    Schema schema = Schema::java_like();
    NodeId prev_root = kNoNode, new_root = kNoNode, expected_root = kNoNode;
    PatchSet patches;
    try {
        if(!schema_file.empty()){
            std::string stext;
            if(!read_file(schema_file, stext)){ std::cerr << "failed to read " << schema_file << "\n"; return 1; }
            schema = load_schema(stext);
        }
        prev_root = load_tree(forest, texts[0], "PREV", schema);
        new_root = load_tree(forest, texts[1], "NEW", schema);
        // updates and slot inserts move nodes out of the new revision; compare against a pristine copy
        expected_root = load_tree(forest, texts[1], "EXPECTED", schema);
        patches = load_script(forest, prev_root, new_root, texts[2]);
    } catch(const edn::parse_error& e){
        std::cerr << "error: malformed EDN: " << e.what() << "\n"; return 2;
    } catch(const bridge_error& e){
        std::cerr << "error: " << e.what() << "\n"; return 2;
    } catch(const script_error& e){
        std::cerr << "error: patch script: " << e.what() << "\n"; return 2;
    }

    PatchApplier applier(forest, schema);
    try {
        (void)applier.apply(patches);
    } catch(const patch_error& e){
        auto failure = describe_failure(forest, e, files[0], files[1]);
        std::cerr << format_failure(failure);
        maybe_print_json(failure);
        return 3;
    }

    std::cout << print_tree(forest, prev_root) << "\n";
    if(check && !trees_equal(forest, prev_root, expected_root)){
        std::cerr << "check failed: patched " << files[0] << " does not match " << files[1] << "\n";
        std::cerr << "expected:\n" << print_tree(forest, expected_root) << "\n";
        return 4;
    }
    return 0;
}
