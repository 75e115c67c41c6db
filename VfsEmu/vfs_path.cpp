#include "VfsEmu.h"

std::vector<std::string> VfsPath::splitPath(const std::string& p){
    std::vector<std::string> parts; std::string cur;
    for(char c: p){ if(c=='/'){ if(!cur.empty()){ parts.push_back(cur); cur.clear(); } } else cur.push_back(c); }
    if(!cur.empty()) parts.push_back(cur);
    return parts;
}

std::string VfsPath::str() const {
    if(parts.empty()) return "/";
    std::string out;
    for(const auto& part : parts){
        out.push_back('/');
        out += part;
    }
    return out;
}

std::string VfsPath::basename() const {
    if(parts.empty()) return "/";
    return parts.back();
}

VfsPath VfsPath::child(const std::string& name) const {
    VfsPath p(parts);
    p.parts.push_back(name);
    return p;
}

std::ostream& operator<<(std::ostream& os, const VfsPath& p){
    return os << p.str();
}

VfsPath resolve_path(const VfsPath& cwd, const std::string& input){
    TRACE_FN("cwd=", cwd.str(), ", input=", input);
    bool absolute = !input.empty() && input[0] == '/';
    std::vector<std::string> base = absolute ? std::vector<std::string>{} : cwd.parts;
    std::vector<std::string> added;
    for(const auto& part : VfsPath::splitPath(input)){
        if(part == ".") continue;
        if(part == ".."){
            if(!added.empty()) added.pop_back();
            else if(!base.empty()) base.pop_back();
            continue;
        }
        added.push_back(part);
    }
    base.insert(base.end(), added.begin(), added.end());
    return VfsPath(std::move(base));
}
