#include "test_util.h"

static VfsPath P(const std::string& s) { return VfsPath(VfsPath::splitPath(s)); }

static std::string write_temp(const std::string& name, const std::string& text) {
    auto path = std::filesystem::temp_directory_path() /
                ("vfsemu_" + std::to_string(::getpid()) + "_" + name);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
    return path.string();
}

static bool throws_runtime(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

TEST(parse_scalars) {
    auto v = parse_json(R"({"s":"a\"b\\c\/d\n","n":-12.5e1,"t":true,"f":false,"z":null,"arr":[1,"two",[]]})");
    CHECK(v.isObject());
    CHECK_EQ(v.find("s")->str, std::string("a\"b\\c/d\n"));
    CHECK(v.find("n")->number == -125.0);
    CHECK(v.find("t")->boolean);
    CHECK(!v.find("f")->boolean);
    CHECK(v.find("z")->type == JsonValue::Type::Null);
    CHECK_EQ(v.find("arr")->items.size(), size_t(3));
    CHECK(v.find("missing") == nullptr);
}

TEST(parse_unicode_escapes) {
    auto v = parse_json(R"(["\u0041\u00e9\u043f\ud83d\ude00"])");
    CHECK_EQ(v.items[0].str, std::string("A\xc3\xa9\xd0\xbf\xf0\x9f\x98\x80"));
}

TEST(parse_keeps_member_order) {
    auto v = parse_json(R"({"zeta":1,"alpha":2,"mid":3})");
    CHECK_EQ(v.members.size(), size_t(3));
    CHECK_EQ(v.members[0].first, std::string("zeta"));
    CHECK_EQ(v.members[1].first, std::string("alpha"));
    CHECK_EQ(v.members[2].first, std::string("mid"));
}

TEST(parse_errors_throw) {
    CHECK(throws_runtime([]{ parse_json("{"); }));
    CHECK(throws_runtime([]{ parse_json(R"({"a" 1})"); }));
    CHECK(throws_runtime([]{ parse_json(R"("unterminated)"); }));
    CHECK(throws_runtime([]{ parse_json("[1,]"); }));
    CHECK(throws_runtime([]{ parse_json("{} trailing"); }));
    CHECK(throws_runtime([]{ parse_json(R"(["\ud800"])"); }));
    CHECK(throws_runtime([]{ parse_json(""); }));
}

TEST(build_tree_from_rooted_document) {
    const std::string doc = R"({
        "/": {"type": "directory", "content": {
            "b.txt": {"type": "file", "content": "bee"},
            "a": {"type": "directory", "content": {
                "inner.txt": {"type": "file", "content": "base64:aGkgdGhlcmU="}
            }},
            "empty": {"type": "directory"}
        }}
    })";
    Vfs vfs(build_tree_from_text(doc));
    CHECK(*vfs.listDir(VfsPath::root()) == std::vector<std::string>({"b.txt", "a", "empty"}));
    CHECK_EQ(*vfs.readFile(P("/a/inner.txt")), std::string("hi there"));
    CHECK(vfs.listDir(P("/empty"))->empty());
}

TEST(build_tree_from_bare_node) {
    Vfs vfs(build_tree_from_text(R"({"type":"directory","content":{"f":{"type":"file"}}})"));
    CHECK_EQ(*vfs.readFile(P("/f")), std::string(""));
}

TEST(build_tree_rejects_bad_documents) {
    CHECK(throws_runtime([]{ build_tree_from_text("[]"); }));
    CHECK(throws_runtime([]{ build_tree_from_text(R"({"home":{}})"); }));
    CHECK(throws_runtime([]{ build_tree_from_text(R"({"/":{"type":"file","content":"x"}})"); }));
    CHECK(throws_runtime([]{ build_tree_from_text(R"({"/":{"type":"socket"}})"); }));
    CHECK(throws_runtime([]{ build_tree_from_text(R"({"/":{"content":{}}})"); }));
    CHECK(throws_runtime([]{ build_tree_from_text(R"({"/":{"type":"directory","content":{"x":{"type":"file","content":5}}}})"); }));
    CHECK(throws_runtime([]{ build_tree_from_text(R"({"/":{"type":"directory","content":{"a/b":{"type":"file"}}}})"); }));
    CHECK(throws_runtime([]{ build_tree_from_text(R"({"/":{"type":"directory","content":{"..":{"type":"directory"}}}})"); }));
}

TEST(default_tree_layout) {
    Vfs vfs(make_default_tree());
    CHECK(*vfs.listDir(VfsPath::root()) == std::vector<std::string>({"home"}));
    CHECK(*vfs.listDir(P("/home/user")) == std::vector<std::string>({"documents", "file1.txt"}));
    CHECK_EQ(*vfs.readFile(P("/home/user/documents/readme.txt")), std::string("Добро пожаловать в VFS!"));
    CHECK_EQ(*vfs.readFile(P("/home/user/file1.txt")), std::string("Содержимое file1.txt"));
}

TEST(blake3_known_vector) {
    CHECK_EQ(blake3_hex(""),
             std::string("af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262"));
}

TEST(mount_records_source_and_hash) {
    const std::string doc = R"({"/":{"type":"directory","content":{"a.txt":{"type":"file","content":"hi there"}}}})";
    auto path = write_temp("mount.json", doc);
    Vfs vfs(make_default_tree());
    vfs.cwd = P("/home/user");
    mount_source_file(vfs, path);
    CHECK_EQ(vfs.source_file, path);
    CHECK_EQ(vfs.source_hash, blake3_hex(doc));
    CHECK(vfs.cwd.isRoot());
    CHECK(*vfs.listDir(VfsPath::root()) == std::vector<std::string>({"a.txt"}));
    std::filesystem::remove(path);
}

TEST(mount_failure_leaves_vfs_untouched) {
    auto path = write_temp("broken.json", R"({"/": {"type": "directory", "content": )");
    Vfs vfs(make_default_tree());
    CHECK(throws_runtime([&]{ mount_source_file(vfs, path); }));
    CHECK(vfs.exists(P("/home/user/file1.txt")));
    CHECK(vfs.source_file.empty());
    std::filesystem::remove(path);
    CHECK(throws_runtime([&]{ mount_source_file(vfs, path); }));
}

int main() {
    std::cout << "=== VFS Source Tests ===\n\n";
    RUN_TEST(parse_scalars);
    RUN_TEST(parse_unicode_escapes);
    RUN_TEST(parse_keeps_member_order);
    RUN_TEST(parse_errors_throw);
    RUN_TEST(build_tree_from_rooted_document);
    RUN_TEST(build_tree_from_bare_node);
    RUN_TEST(build_tree_rejects_bad_documents);
    RUN_TEST(default_tree_layout);
    RUN_TEST(blake3_known_vector);
    RUN_TEST(mount_records_source_and_hash);
    RUN_TEST(mount_failure_leaves_vfs_untouched);
    return report_summary("VFS Source");
}
