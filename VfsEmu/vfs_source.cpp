#include "VfsEmu.h"

// ============================================================================
// Simple JSON Parser
// ============================================================================

namespace {

struct JsonCursor {
    const char* begin;
    const char* p;

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error("JSON: " + what + " at offset " + std::to_string(p - begin));
    }
};

void skip_whitespace(JsonCursor& c) {
    while (*c.p && std::isspace(static_cast<unsigned char>(*c.p))) c.p++;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

uint32_t parse_hex4(JsonCursor& c) {
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
        char h = *c.p;
        v <<= 4;
        if (h >= '0' && h <= '9') v |= static_cast<uint32_t>(h - '0');
        else if (h >= 'a' && h <= 'f') v |= static_cast<uint32_t>(h - 'a' + 10);
        else if (h >= 'A' && h <= 'F') v |= static_cast<uint32_t>(h - 'A' + 10);
        else c.fail("bad \\u escape");
        c.p++;
    }
    return v;
}

std::string parse_string(JsonCursor& c) {
    if (*c.p != '"') c.fail("expected '\"'");
    c.p++; // Skip opening quote

    std::string result;
    while (*c.p && *c.p != '"') {
        if (*c.p == '\\') {
            c.p++;
            switch (*c.p) {
                case 'n': result += '\n'; break;
                case 't': result += '\t'; break;
                case 'r': result += '\r'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case '/': result += '/'; break;
                case '\\': result += '\\'; break;
                case '"': result += '"'; break;
                case 'u': {
                    c.p++;
                    uint32_t cp = parse_hex4(c);
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (c.p[0] != '\\' || c.p[1] != 'u') c.fail("unpaired surrogate");
                        c.p += 2;
                        uint32_t lo = parse_hex4(c);
                        if (lo < 0xDC00 || lo > 0xDFFF) c.fail("unpaired surrogate");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        c.fail("unpaired surrogate");
                    }
                    append_utf8(result, cp);
                    continue; // parse_hex4 already advanced
                }
                case '\0': c.fail("unterminated string");
                default: c.fail(std::string("bad escape '\\") + *c.p + "'");
            }
            c.p++;
        } else {
            result += *c.p++;
        }
    }

    if (*c.p != '"') c.fail("unterminated string");
    c.p++; // Skip closing quote

    return result;
}

double parse_number(JsonCursor& c) {
    const char* start = c.p;
    if (*c.p == '-') c.p++;
    if (!std::isdigit(static_cast<unsigned char>(*c.p))) c.fail("bad number");
    while (*c.p && (std::isdigit(static_cast<unsigned char>(*c.p)) || *c.p == '.' ||
                    *c.p == 'e' || *c.p == 'E' || *c.p == '+' || *c.p == '-')) c.p++;
    try {
        return std::stod(std::string(start, c.p));
    } catch (const std::exception&) {
        c.p = start;
        c.fail("bad number");
    }
}

JsonValue parse_value(JsonCursor& c, int depth);

JsonValue parse_object(JsonCursor& c, int depth) {
    JsonValue v;
    v.type = JsonValue::Type::Object;
    c.p++; // Skip '{'
    skip_whitespace(c);
    if (*c.p == '}') { c.p++; return v; }
    while (true) {
        skip_whitespace(c);
        std::string key = parse_string(c);
        skip_whitespace(c);
        if (*c.p != ':') c.fail("expected ':'");
        c.p++;
        JsonValue member = parse_value(c, depth + 1);
        // a repeated key keeps its first position and takes the last value
        auto it = std::find_if(v.members.begin(), v.members.end(),
                               [&](const auto& m){ return m.first == key; });
        if (it != v.members.end()) it->second = std::move(member);
        else v.members.emplace_back(std::move(key), std::move(member));
        skip_whitespace(c);
        if (*c.p == ',') { c.p++; continue; }
        if (*c.p == '}') { c.p++; return v; }
        c.fail("expected ',' or '}'");
    }
}

JsonValue parse_array(JsonCursor& c, int depth) {
    JsonValue v;
    v.type = JsonValue::Type::Array;
    c.p++; // Skip '['
    skip_whitespace(c);
    if (*c.p == ']') { c.p++; return v; }
    while (true) {
        v.items.push_back(parse_value(c, depth + 1));
        skip_whitespace(c);
        if (*c.p == ',') { c.p++; continue; }
        if (*c.p == ']') { c.p++; return v; }
        c.fail("expected ',' or ']'");
    }
}

JsonValue parse_value(JsonCursor& c, int depth) {
    if (depth > 512) c.fail("nesting too deep");
    skip_whitespace(c);
    JsonValue v;
    if (*c.p == '{') return parse_object(c, depth);
    if (*c.p == '[') return parse_array(c, depth);
    if (*c.p == '"') {
        v.type = JsonValue::Type::String;
        v.str = parse_string(c);
    } else if (*c.p == '-' || std::isdigit(static_cast<unsigned char>(*c.p))) {
        v.type = JsonValue::Type::Number;
        v.number = parse_number(c);
    } else if (strncmp(c.p, "true", 4) == 0) {
        v.type = JsonValue::Type::Bool;
        v.boolean = true;
        c.p += 4;
    } else if (strncmp(c.p, "false", 5) == 0) {
        v.type = JsonValue::Type::Bool;
        c.p += 5;
    } else if (strncmp(c.p, "null", 4) == 0) {
        c.p += 4;
    } else if (!*c.p) {
        c.fail("unexpected end of input");
    } else {
        c.fail(std::string("unexpected character '") + *c.p + "'");
    }
    return v;
}

} // namespace

const JsonValue* JsonValue::find(const std::string& key) const {
    for (const auto& m : members) {
        if (m.first == key) return &m.second;
    }
    return nullptr;
}

const char* json_type_name(JsonValue::Type t) {
    switch (t) {
        case JsonValue::Type::Null: return "null";
        case JsonValue::Type::Bool: return "boolean";
        case JsonValue::Type::Number: return "number";
        case JsonValue::Type::String: return "string";
        case JsonValue::Type::Array: return "array";
        case JsonValue::Type::Object: return "object";
    }
    return "unknown";
}

JsonValue parse_json(const std::string& text) {
    TRACE_FN("size=", text.size());
    if (text.find('\0') != std::string::npos) throw std::runtime_error("JSON: embedded NUL byte");
    JsonCursor c{text.c_str(), text.c_str()};
    JsonValue v = parse_value(c, 0);
    skip_whitespace(c);
    if (*c.p) c.fail("trailing characters");
    return v;
}

// ============================================================================
// Tree construction
// ============================================================================

namespace {

std::unique_ptr<VfsNode> build_node(const std::string& name, const JsonValue& v, const std::string& where) {
    if (!v.isObject()) throw std::runtime_error(where + ": node must be an object, got " + json_type_name(v.type));
    const JsonValue* type = v.find("type");
    if (!type || !type->isString()) throw std::runtime_error(where + ": missing string field 'type'");
    const JsonValue* content = v.find("content");

    if (type->str == "file") {
        if (content && content->type != JsonValue::Type::String)
            throw std::runtime_error(where + ": file content must be a string, got " + json_type_name(content->type));
        return VfsNode::makeFile(name, content ? content->str : std::string());
    }
    if (type->str == "directory") {
        auto dir = VfsNode::makeDir(name);
        if (!content) return dir;
        if (!content->isObject())
            throw std::runtime_error(where + ": directory content must be an object, got " + json_type_name(content->type));
        for (const auto& [childName, child] : content->members) {
            if (childName.empty() || childName == "." || childName == ".." ||
                childName.find('/') != std::string::npos)
                throw std::runtime_error(where + ": invalid entry name '" + childName + "'");
            std::string childWhere = (where == "/" ? "" : where) + "/" + childName;
            dir->addChild(build_node(childName, child, childWhere));
        }
        return dir;
    }
    throw std::runtime_error(where + ": unknown node type '" + type->str + "'");
}

} // namespace

std::unique_ptr<VfsNode> build_tree(const JsonValue& doc) {
    TRACE_FN();
    if (!doc.isObject()) throw std::runtime_error("VFS document must be a JSON object");
    const JsonValue* rootValue = doc.find("type") ? &doc : doc.find("/");
    if (!rootValue) throw std::runtime_error("VFS document has no \"/\" root entry");
    auto root = build_node("/", *rootValue, "/");
    if (!root->isDir()) throw std::runtime_error("VFS root must be a directory");
    return root;
}

std::unique_ptr<VfsNode> build_tree_from_text(const std::string& text) {
    return build_tree(parse_json(text));
}

std::unique_ptr<VfsNode> make_default_tree() {
    auto root = VfsNode::makeDir("/");
    auto& home = root->addChild(VfsNode::makeDir("home"));
    auto& user = home.addChild(VfsNode::makeDir("user"));
    auto& documents = user.addChild(VfsNode::makeDir("documents"));
    documents.addChild(VfsNode::makeFile("readme.txt", "Добро пожаловать в VFS!"));
    user.addChild(VfsNode::makeFile("file1.txt", "Содержимое file1.txt"));
    return root;
}

void mount_source_file(Vfs& vfs, const std::string& path) {
    TRACE_FN("path=", path);
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("cannot open '" + path + "'");
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) throw std::runtime_error("read error on '" + path + "'");

    const std::string text = buf.str();
    auto root = build_tree_from_text(text);
    std::string hash = blake3_hex(text);

    vfs.setRoot(std::move(root));
    vfs.source_file = path;
    vfs.source_hash = std::move(hash);
}
