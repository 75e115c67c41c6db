#include "test_util.h"

static Vfs sample_vfs() {
    auto root = VfsNode::makeDir("/");
    auto& docs = root->addChild(VfsNode::makeDir("docs"));
    docs.addChild(VfsNode::makeFile("guide.md", "# Guide\n\nRead   me  please\n"));
    root->addChild(VfsNode::makeFile("a.txt", "hi there"));
    root->addChild(VfsNode::makeFile("blob.bin", "base64:bGluZSBvbmUKbGluZSB0d28K"));
    return Vfs(std::move(root));
}

static ShellConfig quiet_config() {
    ShellConfig cfg;
    cfg.user = "alice";
    cfg.host = "box";
    cfg.quiet = true;
    return cfg;
}

static std::string run(Shell& shell, std::ostringstream& out, const std::string& line) {
    out.str("");
    shell.runLine(line);
    return out.str();
}

static std::string write_script(const std::string& name, const std::string& text) {
    auto path = std::filesystem::temp_directory_path() /
                ("vfsemu_" + std::to_string(::getpid()) + "_" + name);
    std::ofstream f(path, std::ios::trunc);
    f << text;
    return path.string();
}

TEST(prompt_shows_cwd_basename) {
    Vfs vfs = sample_vfs();
    std::ostringstream out;
    Shell shell(vfs, quiet_config(), out);
    CHECK_EQ(shell.prompt(), std::string("alice@box:/$ "));
    run(shell, out, "cd docs");
    CHECK_EQ(shell.prompt(), std::string("alice@box:docs$ "));
}

TEST(ls_and_pwd) {
    Vfs vfs = sample_vfs();
    std::ostringstream out;
    Shell shell(vfs, quiet_config(), out);
    CHECK_EQ(run(shell, out, "ls"), std::string("docs\na.txt\nblob.bin\n"));
    CHECK_EQ(run(shell, out, "ls docs"), std::string("guide.md\n"));
    CHECK_EQ(run(shell, out, "ls nope"),
             std::string("ls: cannot access 'nope': No such file or directory\n"));
    CHECK_EQ(run(shell, out, "ls a.txt"),
             std::string("ls: cannot access 'a.txt': No such file or directory\n"));
    CHECK_EQ(run(shell, out, "pwd"), std::string("/\n"));
}

TEST(cd_moves_and_reports_errors) {
    Vfs vfs = sample_vfs();
    std::ostringstream out;
    Shell shell(vfs, quiet_config(), out);
    CHECK_EQ(run(shell, out, "cd docs"), std::string(""));
    CHECK_EQ(run(shell, out, "pwd"), std::string("/docs\n"));
    CHECK_EQ(run(shell, out, "cd nope"), std::string("cd: nope: No such file or directory\n"));
    CHECK_EQ(vfs.cwd.str(), std::string("/docs"));
    CHECK_EQ(run(shell, out, "cd ../a.txt"), std::string("cd: ../a.txt: Not a directory\n"));
    CHECK_EQ(vfs.cwd.str(), std::string("/docs"));
    run(shell, out, "cd ..");
    CHECK(vfs.cwd.isRoot());
    run(shell, out, "cd docs");
    run(shell, out, "cd");
    CHECK(vfs.cwd.isRoot());
    run(shell, out, "cd ../../..");
    CHECK(vfs.cwd.isRoot());
}

TEST(cat_outputs) {
    Vfs vfs = sample_vfs();
    std::ostringstream out;
    Shell shell(vfs, quiet_config(), out);
    CHECK_EQ(run(shell, out, "cat a.txt"), std::string("hi there\n"));
    CHECK_EQ(run(shell, out, "cat blob.bin"), std::string("line one\nline two\n"));
    CHECK_EQ(run(shell, out, "cat docs"), std::string("cat: docs: Is a directory\n"));
    CHECK_EQ(run(shell, out, "cat x"), std::string("cat: x: No such file or directory\n"));
    CHECK_EQ(run(shell, out, "cat"), std::string("cat: missing operand\n"));
    CHECK_EQ(run(shell, out, "cat x a.txt"),
             std::string("cat: x: No such file or directory\nhi there\n"));
}

TEST(echo_joins_arguments) {
    Vfs vfs = sample_vfs();
    std::ostringstream out;
    Shell shell(vfs, quiet_config(), out);
    CHECK_EQ(run(shell, out, "echo hello   world"), std::string("hello world\n"));
    CHECK_EQ(run(shell, out, "echo 'a  b' c"), std::string("a  b c\n"));
    CHECK_EQ(run(shell, out, "echo"), std::string("\n"));
}

TEST(wc_counts) {
    Vfs vfs = sample_vfs();
    std::ostringstream out;
    Shell shell(vfs, quiet_config(), out);
    CHECK_EQ(run(shell, out, "wc a.txt"), std::string("1 2 8 a.txt\n"));
    CHECK_EQ(run(shell, out, "wc /docs/guide.md blob.bin"),
             std::string("3 5 27 /docs/guide.md\n2 4 18 blob.bin\n"));
    CHECK_EQ(run(shell, out, "wc docs"), std::string("wc: docs: Is a directory\n"));
    CHECK_EQ(run(shell, out, "wc"), std::string("wc: missing operand\n"));
}

TEST(du_sizes) {
    Vfs vfs = sample_vfs();
    std::ostringstream out;
    Shell shell(vfs, quiet_config(), out);
    CHECK_EQ(run(shell, out, "du"), std::string("53\t/\n"));
    CHECK_EQ(run(shell, out, "du docs"), std::string("27\t/docs\n"));
    CHECK_EQ(run(shell, out, "du a.txt"), std::string("du: /a.txt: Not a directory\n"));
    CHECK_EQ(run(shell, out, "du nope"),
             std::string("du: cannot access '/nope': No such file or directory\n"));
}

TEST(tree_renders) {
    Vfs vfs = sample_vfs();
    std::ostringstream out;
    Shell shell(vfs, quiet_config(), out);
    CHECK_EQ(run(shell, out, "tree docs"), std::string("/docs\n    └── guide.md\n"));
    CHECK_EQ(run(shell, out, "tree nope"), std::string("tree: /nope [error opening dir]\n"));
}

TEST(unknown_command_and_parse_error) {
    Vfs vfs = sample_vfs();
    std::ostringstream out;
    Shell shell(vfs, quiet_config(), out);
    CHECK_EQ(run(shell, out, "frobnicate x"), std::string("frobnicate: command not found\n"));
    CHECK_EQ(run(shell, out, "echo \"oops"), std::string("parse error: unterminated quote\n"));
    CHECK_EQ(run(shell, out, "   "), std::string(""));
    CHECK_EQ(run(shell, out, "# comment"), std::string(""));
    CHECK(shell.running);
}

TEST(execute_reports_status) {
    Vfs vfs = sample_vfs();
    std::ostringstream out;
    Shell shell(vfs, quiet_config(), out);
    CHECK(shell.execute({"pwd", {}}).success);
    CHECK(!shell.execute({"cat", {"missing"}}).success);
    CHECK(!shell.execute({"nope", {}}).success);
    auto res = shell.execute({"exit", {}});
    CHECK(res.exit_requested);
    CHECK(shell.running);  // execute alone does not stop the session
}

TEST(exit_stops_session) {
    Vfs vfs = sample_vfs();
    std::ostringstream out;
    Shell shell(vfs, quiet_config(), out);
    CHECK(run(shell, out, "exit extra args") == "exit\n");
    CHECK(!shell.running);
}

TEST(script_playback) {
    auto path = write_script("play.sh",
        "# setup\n"
        "\n"
        "cd docs\n"
        "  pwd  \n"
        "echo 'broken\n"
        "cat missing\n"
        "exit\n"
        "echo never\n");
    Vfs vfs = sample_vfs();
    std::ostringstream out;
    Shell shell(vfs, quiet_config(), out);
    CHECK(shell.runScript(path));
    const std::string expected =
        "alice@box:/$ cd docs\n"
        "alice@box:docs$ pwd\n"
        "/docs\n"
        "alice@box:docs$ echo 'broken\n"
        "line 5: parse error: unterminated quote\n"
        "alice@box:docs$ cat missing\n"
        "cat: missing: No such file or directory\n"
        "alice@box:docs$ exit\n"
        "exit\n";
    CHECK_EQ(out.str(), expected);
    CHECK(!shell.running);
    std::filesystem::remove(path);
}

TEST(script_banners_when_not_quiet) {
    auto path = write_script("banner.sh", "pwd\n");
    Vfs vfs = sample_vfs();
    std::ostringstream out;
    ShellConfig cfg = quiet_config();
    cfg.quiet = false;
    Shell shell(vfs, cfg, out);
    CHECK(shell.runScript(path));
    CHECK_EQ(out.str(), "running script: " + path + "\nalice@box:/$ pwd\n/\nscript finished\n");
    std::filesystem::remove(path);
}

// Feeds `input` to std::cin for the lifetime of the object.
struct CinFeed {
    std::istringstream in;
    std::streambuf* saved;
    explicit CinFeed(const std::string& input) : in(input), saved(std::cin.rdbuf(in.rdbuf())) {}
    ~CinFeed() {
        std::cin.rdbuf(saved);
        std::cin.clear();
    }
};

static std::string run_interactive(Vfs& vfs, ShellConfig cfg, const std::string& input) {
    auto history = std::filesystem::temp_directory_path() /
                   ("vfsemu_" + std::to_string(::getpid()) + "_history");
    ::setenv("VFSEMU_HISTORY_FILE", history.c_str(), 1);
    std::ostringstream out;
    {
        CinFeed feed(input);
        Shell shell(vfs, cfg, out);
        shell.runInteractive();
    }
    std::filesystem::remove(history);
    return out.str();
}

TEST(help_lists_verbs) {
    Vfs vfs = sample_vfs();
    std::ostringstream out;
    Shell shell(vfs, quiet_config(), out);
    auto text = run(shell, out, "help");
    for (const auto& verb : get_all_commands()) {
        CHECK(text.find("  " + verb + " ") != std::string::npos);
    }
    CHECK(shell.execute({"help", {}}).success);
}

TEST(interactive_end_of_input_exits) {
    if (terminal_available()) return;  // raw mode would read the real terminal
    Vfs vfs = sample_vfs();
    auto text = run_interactive(vfs, quiet_config(), "cd docs\npwd\n\nnope\n");
    CHECK_EQ(text, std::string("/docs\nnope: command not found\nexit\n"));
    CHECK_EQ(vfs.cwd.str(), std::string("/docs"));
}

TEST(interactive_exit_stops_reading) {
    if (terminal_available()) return;
    Vfs vfs = sample_vfs();
    auto text = run_interactive(vfs, quiet_config(), "echo one\nexit\necho two\n");
    CHECK_EQ(text, std::string("one\nexit\n"));
}

// First read delivers SIGINT and fails, later reads serve `rest`.
struct InterruptingBuf : std::streambuf {
    std::string rest;
    bool interrupted = false;
    bool served = false;
    explicit InterruptingBuf(std::string r) : rest(std::move(r)) {}
    int_type underflow() override {
        if (!interrupted) {
            interrupted = true;
            ::raise(SIGINT);
            return traits_type::eof();
        }
        if (!served && !rest.empty()) {
            served = true;
            setg(rest.data(), rest.data(), rest.data() + rest.size());
            return traits_type::to_int_type(*gptr());
        }
        return traits_type::eof();
    }
};

TEST(interactive_interrupt_prints_hint) {
    if (terminal_available()) return;
    auto history = std::filesystem::temp_directory_path() /
                   ("vfsemu_" + std::to_string(::getpid()) + "_history");
    ::setenv("VFSEMU_HISTORY_FILE", history.c_str(), 1);
    Vfs vfs = sample_vfs();
    std::ostringstream out;
    InterruptingBuf buf("echo after\n");
    std::streambuf* saved = std::cin.rdbuf(&buf);
    Shell shell(vfs, quiet_config(), out);
    shell.runInteractive();
    std::cin.rdbuf(saved);
    std::cin.clear();
    std::filesystem::remove(history);
    CHECK_EQ(out.str(), std::string("use 'exit' to leave the emulator\nafter\nexit\n"));
}

TEST(interactive_banner) {
    if (terminal_available()) return;
    Vfs vfs = sample_vfs();
    ShellConfig cfg = quiet_config();
    cfg.quiet = false;
    auto text = run_interactive(vfs, cfg, "");
    CHECK(starts_with(text, "interactive mode\navailable commands: cat cd du echo exit help ls pwd tree wc\n"
                            "type 'exit' to quit\n"));
    CHECK(text.size() >= 5 && text.compare(text.size() - 5, 5, "exit\n") == 0);
}

TEST(missing_script_fails) {
    Vfs vfs = sample_vfs();
    std::ostringstream out;
    Shell shell(vfs, quiet_config(), out);
    CHECK(!shell.runScript("/nonexistent/vfsemu/script.sh"));
    CHECK_EQ(out.str(), std::string("error: cannot open script '/nonexistent/vfsemu/script.sh'\n"));
    CHECK(shell.running);
}

int main() {
    i18n::set_english_only();
    std::cout << "=== Shell Tests ===\n\n";
    RUN_TEST(prompt_shows_cwd_basename);
    RUN_TEST(ls_and_pwd);
    RUN_TEST(cd_moves_and_reports_errors);
    RUN_TEST(cat_outputs);
    RUN_TEST(echo_joins_arguments);
    RUN_TEST(wc_counts);
    RUN_TEST(du_sizes);
    RUN_TEST(tree_renders);
    RUN_TEST(unknown_command_and_parse_error);
    RUN_TEST(execute_reports_status);
    RUN_TEST(exit_stops_session);
    RUN_TEST(script_playback);
    RUN_TEST(script_banners_when_not_quiet);
    RUN_TEST(missing_script_fails);
    RUN_TEST(help_lists_verbs);
    RUN_TEST(interactive_end_of_input_exits);
    RUN_TEST(interactive_exit_stops_reading);
    RUN_TEST(interactive_interrupt_prints_hint);
    RUN_TEST(interactive_banner);
    return report_summary("Shell");
}
