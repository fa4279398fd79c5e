#include "graft/diagnostics.hpp"
#include "graft/options.hpp"
#include "graft/path.hpp"
#include <cstdio>
#include <sstream>

namespace graft {

PatchFailure describe_failure(const Forest& forest, const patch_error& e,
                              std::string prev_source, std::string new_source){
    PatchFailure f;
    f.prev_source = std::move(prev_source);
    f.new_source = std::move(new_source);
    f.code = e.code();
    f.message = e.what();
    f.node = e.node();
    if(f.node != kNoNode && f.node < forest.size()){
        const Node& n = forest.at(f.node);
        f.node_tag = n.tag;
        f.node_path = to_string(path_of(forest, f.node));
        f.origin = n.origin;
    }
    return f;
}

std::string format_failure(const PatchFailure& f){
    std::ostringstream os;
    os << "patch application failed for revision pair " << f.prev_source << " -> " << f.new_source << "\n";
    os << "error[" << f.code << "]: " << f.message << "\n";
    if(f.node != kNoNode){
        os << "  note: node #" << f.node;
        if(!f.node_tag.empty()) os << " '" << f.node_tag << "'";
        if(!f.node_path.empty()) os << " at " << f.node_path;
        if(!f.origin.source.empty()){
            os << " from " << f.origin.source;
            if(f.origin.line >= 0) os << " (line " << f.origin.line << ":" << f.origin.col << ")";
        }
        os << "\n";
    }
    return os.str();
}

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

std::string diagnostics_to_json(const PatchFailure& f){
    std::ostringstream os;
    os<<"{\"success\":false"
      <<",\"prev\":"<<json_escape(f.prev_source)
      <<",\"new\":"<<json_escape(f.new_source)
      <<",\"code\":"<<json_escape(f.code)
      <<",\"message\":"<<json_escape(f.message);
    if(f.node != kNoNode) os<<",\"node\":"<<f.node; else os<<",\"node\":null";
    os<<",\"tag\":"<<json_escape(f.node_tag)
      <<",\"path\":"<<json_escape(f.node_path)
      <<",\"origin\":{\"source\":"<<json_escape(f.origin.source)
      <<",\"line\":"<<f.origin.line
      <<",\"col\":"<<f.origin.col
      <<"}}";
    return os.str();
}

void maybe_print_json(const PatchFailure& f){
    if(detail::env_flag_enabled("GRAFT_DIAG_JSON")){
        auto js = diagnostics_to_json(f);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

} // namespace graft
