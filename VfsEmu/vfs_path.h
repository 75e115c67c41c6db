#ifndef _VfsEmu_vfs_path_h_
#define _VfsEmu_vfs_path_h_

//
// Normalized absolute VFS path: segments below "/", never "." or "..".
//
struct VfsPath {
    std::vector<std::string> parts;

    VfsPath() = default;
    explicit VfsPath(std::vector<std::string> p) : parts(std::move(p)) {}

    static VfsPath root() { return VfsPath(); }
    static std::vector<std::string> splitPath(const std::string& p);

    bool isRoot() const { return parts.empty(); }
    std::string str() const;
    std::string basename() const;
    VfsPath child(const std::string& name) const;

    bool operator==(const VfsPath& o) const { return parts == o.parts; }
    bool operator!=(const VfsPath& o) const { return parts != o.parts; }
};

std::ostream& operator<<(std::ostream& os, const VfsPath& p);

// Resolves `input` against `cwd`. A ".." first drops segments appended by this
// call, then segments of `cwd`; at the root it does nothing. Never fails.
VfsPath resolve_path(const VfsPath& cwd, const std::string& input);

#endif
