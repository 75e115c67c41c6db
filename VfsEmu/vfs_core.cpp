#include "VfsEmu.h"

// ====== Nodes ======

std::unique_ptr<VfsNode> VfsNode::makeDir(std::string name){
    return std::make_unique<VfsNode>(std::move(name), Dir{});
}

std::unique_ptr<VfsNode> VfsNode::makeFile(std::string name, std::string content){
    return std::make_unique<VfsNode>(std::move(name), File{std::move(content)});
}

const VfsNode* VfsNode::child(const std::string& childName) const {
    const Dir* d = dir();
    if(!d) return nullptr;
    for(const auto& c : d->children){
        if(c->name == childName) return c.get();
    }
    return nullptr;
}

VfsNode& VfsNode::addChild(std::unique_ptr<VfsNode> n){
    Dir* d = dir();
    if(!d) throw std::runtime_error("not a directory: " + name);
    if(!n) throw std::runtime_error("null node");
    for(auto& c : d->children){
        if(c->name == n->name){
            c = std::move(n);
            return *c;
        }
    }
    d->children.push_back(std::move(n));
    return *d->children.back();
}

// ====== VFS ======

Vfs::Vfs() : root(VfsNode::makeDir("/")) {}

Vfs::Vfs(std::unique_ptr<VfsNode> rootNode){
    setRoot(std::move(rootNode));
}

void Vfs::setRoot(std::unique_ptr<VfsNode> rootNode){
    TRACE_FN();
    if(!rootNode || !rootNode->isDir()) throw std::runtime_error("VFS root must be a directory");
    rootNode->name = "/";
    root = std::move(rootNode);
    cwd = VfsPath::root();
    source_file.clear();
    source_hash.clear();
}

const VfsNode* Vfs::getNode(const VfsPath& p) const {
    TRACE_FN("path=", p.str());
    const VfsNode* cur = root.get();
    for(const auto& part : p.parts){
        if(!cur->isDir()) return nullptr;
        cur = cur->child(part);
        if(!cur) return nullptr;
    }
    return cur;
}

bool Vfs::exists(const VfsPath& p) const {
    return getNode(p) != nullptr;
}

std::optional<std::vector<std::string>> Vfs::listDir(const VfsPath& p) const {
    TRACE_FN("path=", p.str());
    const VfsNode* node = getNode(p);
    if(!node || !node->isDir()) return std::nullopt;
    std::vector<std::string> names;
    names.reserve(node->dir()->children.size());
    for(const auto& c : node->dir()->children) names.push_back(c->name);
    return names;
}

std::optional<std::string> Vfs::readFile(const VfsPath& p) const {
    TRACE_FN("path=", p.str());
    const VfsNode* node = getNode(p);
    if(!node || !node->file()) return std::nullopt;
    return decode_content(node->file()->content);
}

std::optional<size_t> Vfs::fileSize(const VfsPath& p) const {
    auto content = readFile(p);
    if(!content) return std::nullopt;
    return content->size();
}

std::optional<Vfs::FileStats> Vfs::fileStats(const VfsPath& p) const {
    auto content = readFile(p);
    if(!content) return std::nullopt;
    FileStats st;
    st.lines = split_lines(*content).size();
    st.words = count_words(*content);
    st.bytes = content->size();
    return st;
}

size_t Vfs::subtreeSize(const VfsNode& n){
    if(const auto* f = n.file()) return decode_content(f->content).size();
    size_t total = 0;
    for(const auto& c : n.dir()->children) total += subtreeSize(*c);
    return total;
}

std::optional<size_t> Vfs::dirSize(const VfsPath& p) const {
    TRACE_FN("path=", p.str());
    const VfsNode* node = getNode(p);
    if(!node || !node->isDir()) return std::nullopt;
    return subtreeSize(*node);
}

// `prefix` is the indentation for the children of `dirNode`.
void Vfs::renderChildren(const VfsNode& dirNode, const std::string& prefix, std::ostringstream& out){
    const auto& ch = dirNode.dir()->children;
    for(size_t i = 0; i < ch.size(); ++i){
        const VfsNode& c = *ch[i];
        bool is_last = (i == ch.size() - 1);
        out << prefix << (is_last ? "└── " : "├── ") << c.name << "\n";
        if(c.isDir()){
            renderChildren(c, prefix + (is_last ? "    " : "│   "), out);
        }
    }
}

std::optional<std::string> Vfs::renderTree(const VfsPath& p) const {
    TRACE_FN("path=", p.str());
    const VfsNode* node = getNode(p);
    if(!node || !node->isDir()) return std::nullopt;
    std::ostringstream out;
    out << p.str() << "\n";
    // the start node counts as a last sibling
    renderChildren(*node, "    ", out);
    return out.str();
}
