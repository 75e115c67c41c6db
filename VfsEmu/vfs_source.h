#ifndef _VfsEmu_vfs_source_h_
#define _VfsEmu_vfs_source_h_

//
// Minimal JSON document model for VFS source files
//
struct JsonValue {
    enum class Type { Null, Bool, Number, String, Array, Object };
    Type type = Type::Null;
    bool boolean = false;
    double number = 0.0;
    std::string str;
    std::vector<JsonValue> items;
    std::vector<std::pair<std::string, JsonValue>> members;  // document order

    bool isObject() const { return type == Type::Object; }
    bool isString() const { return type == Type::String; }
    const JsonValue* find(const std::string& key) const;
};

JsonValue parse_json(const std::string& text);
const char* json_type_name(JsonValue::Type t);

// Accepts {"/": <node>} or a bare root node. Throws std::runtime_error.
std::unique_ptr<VfsNode> build_tree(const JsonValue& doc);
std::unique_ptr<VfsNode> build_tree_from_text(const std::string& text);

std::unique_ptr<VfsNode> make_default_tree();

// Loads `path` into `vfs` and records its BLAKE3 hash. Throws on any failure,
// leaving `vfs` untouched.
void mount_source_file(Vfs& vfs, const std::string& path);

#endif
