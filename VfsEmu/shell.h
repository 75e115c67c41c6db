#ifndef _VfsEmu_shell_h_
#define _VfsEmu_shell_h_

struct ShellConfig {
    std::string user = "user";
    std::string host = "localhost";
    bool quiet = false;  // no banners around script playback and the REPL
};

//
// Command dispatcher and session loop over one Vfs
//
struct Shell {
    Vfs& vfs;
    ShellConfig config;
    std::ostream& out;
    bool running = true;

    Shell(Vfs& v, ShellConfig cfg, std::ostream& os = std::cout)
        : vfs(v), config(std::move(cfg)), out(os) {}

    std::string prompt() const;

    CommandResult execute(const CommandInvocation& inv);

    // Tokenizes and executes one line, printing its output. Returns false
    // once the session should stop.
    bool runLine(const std::string& line);
    bool runScript(const std::string& path);
    void runInteractive();

private:
    CommandResult cmdLs(const CommandInvocation& inv);
    CommandResult cmdCd(const CommandInvocation& inv);
    CommandResult cmdCat(const CommandInvocation& inv);
    CommandResult cmdWc(const CommandInvocation& inv);
    CommandResult cmdDu(const CommandInvocation& inv);
    CommandResult cmdTree(const CommandInvocation& inv);
    void emit(const CommandResult& res);
};

#endif
