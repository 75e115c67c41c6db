#pragma once

//
// VFS nodes
//
struct VfsNode {
    enum class Kind { Dir, File };

    struct Dir {
        std::vector<std::unique_ptr<VfsNode>> children;  // declared order
    };
    struct File {
        std::string content;  // raw stored payload, see decode_content()
    };

    std::string name;
    std::variant<Dir, File> data;

    VfsNode(std::string n, Dir d) : name(std::move(n)), data(std::move(d)) {}
    VfsNode(std::string n, File f) : name(std::move(n)), data(std::move(f)) {}

    static std::unique_ptr<VfsNode> makeDir(std::string name);
    static std::unique_ptr<VfsNode> makeFile(std::string name, std::string content = "");

    Kind kind() const { return std::holds_alternative<Dir>(data) ? Kind::Dir : Kind::File; }
    bool isDir() const { return kind() == Kind::Dir; }

    Dir* dir() { return std::get_if<Dir>(&data); }
    const Dir* dir() const { return std::get_if<Dir>(&data); }
    const File* file() const { return std::get_if<File>(&data); }

    const VfsNode* child(const std::string& childName) const;
    // Adds `n` as a child; a sibling with the same name is replaced in place.
    VfsNode& addChild(std::unique_ptr<VfsNode> n);
};


//
// VFS
//
struct Vfs {
    struct FileStats {
        size_t lines = 0;
        size_t words = 0;
        size_t bytes = 0;
    };

    std::unique_ptr<VfsNode> root;
    VfsPath cwd;
    std::string source_file;  // JSON document the tree was loaded from, empty for built-in trees
    std::string source_hash;  // BLAKE3 hash of source_file

    Vfs();
    explicit Vfs(std::unique_ptr<VfsNode> rootNode);

    // Replaces the whole tree and returns to "/".
    void setRoot(std::unique_ptr<VfsNode> rootNode);

    VfsPath resolve(const std::string& input) const { return resolve_path(cwd, input); }

    bool exists(const VfsPath& p) const;
    const VfsNode* getNode(const VfsPath& p) const;

    std::optional<std::vector<std::string>> listDir(const VfsPath& p) const;
    std::optional<std::string> readFile(const VfsPath& p) const;
    std::optional<size_t> fileSize(const VfsPath& p) const;
    std::optional<FileStats> fileStats(const VfsPath& p) const;
    std::optional<size_t> dirSize(const VfsPath& p) const;
    std::optional<std::string> renderTree(const VfsPath& p) const;

private:
    static size_t subtreeSize(const VfsNode& n);
    static void renderChildren(const VfsNode& dirNode, const std::string& prefix, std::ostringstream& out);
};

