#ifndef _VfsEmu_command_h_
#define _VfsEmu_command_h_


struct CommandResult {
    bool success = true;
    bool exit_requested = false;
    std::string output;
};

struct CommandInvocation {
    std::string name;
    std::vector<std::string> args;
};

struct RawTerminalMode {
    termios original{};
    bool active = false;

    RawTerminalMode(){
        if(::isatty(STDIN_FILENO) != 1) return;
        if(tcgetattr(STDIN_FILENO, &original) != 0) return;
        termios raw = original;
        raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO | ISIG));
        raw.c_iflag &= static_cast<tcflag_t>(~(IXON | ICRNL));
        raw.c_oflag &= static_cast<tcflag_t>(~OPOST);
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;
        if(tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) == 0){
            active = true;
        }
    }

    ~RawTerminalMode(){
        if(active){
            tcsetattr(STDIN_FILENO, TCSAFLUSH, &original);
        }
    }

    bool ok() const { return active; }
};

enum class ReadStatus { Line, Interrupted, Eof };

// Throws std::runtime_error on unterminated quotes or a dangling escape.
std::vector<std::string> tokenize_command_line(const std::string& line);
CommandInvocation parse_invocation(const std::vector<std::string>& tokens);

const std::vector<std::string>& get_all_commands();
std::vector<std::string> get_path_completions(const Vfs& vfs, const std::string& partial);
std::string complete_input(const Vfs& vfs, const std::string& buffer, size_t cursor, bool& show_list);

bool terminal_available();
void install_interrupt_handler();
// Line editing on whole UTF-8 sequences. erase_before_cursor returns the new cursor.
size_t erase_before_cursor(std::string& buffer, size_t cursor);
void erase_at_cursor(std::string& buffer, size_t cursor);
void redraw_prompt_line(const std::string& prompt, const std::string& buffer, size_t cursor);
ReadStatus read_line_with_history(const Vfs& vfs, const std::string& prompt, std::string& out, const std::vector<std::string>& history);

constexpr size_t kHistoryLimit = 500;

// $VFSEMU_HISTORY_FILE, else ~/.vfsemu_history; nullopt without HOME.
std::optional<std::filesystem::path> history_file_path();
std::vector<std::string> load_history(const std::filesystem::path& file);
bool save_history(const std::filesystem::path& file, const std::vector<std::string>& history);

#endif
