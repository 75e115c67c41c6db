#include "VfsEmu.h"

#include <cerrno>

namespace {
volatile sig_atomic_t g_interrupted = 0;

void on_interrupt(int){
    g_interrupted = 1;
}
}

std::vector<std::string> tokenize_command_line(const std::string& line){
    std::vector<std::string> tokens;
    std::string cur;
    bool in_single = false;
    bool in_double = false;
    bool escape = false;
    bool quoted = false;  // "" and '' still produce a (possibly empty) word
    auto flush = [&]{
        if(!cur.empty() || quoted){
            tokens.push_back(cur);
            cur.clear();
            quoted = false;
        }
    };
    for(size_t i = 0; i < line.size(); ++i){
        char c = line[i];
        if(escape){
            // inside double quotes only \" \\ and \$ \` lose the backslash
            if(in_double && c != '"' && c != '\\' && c != '$' && c != '`') cur.push_back('\\');
            cur.push_back(c);
            escape = false;
            continue;
        }
        if(!in_single && c == '\\'){
            escape = true;
            continue;
        }
        if(c == '"' && !in_single){
            in_double = !in_double;
            quoted = true;
            continue;
        }
        if(c == '\'' && !in_double){
            in_single = !in_single;
            quoted = true;
            continue;
        }
        if(!in_single && !in_double && std::isspace(static_cast<unsigned char>(c))){
            flush();
            continue;
        }
        cur.push_back(c);
    }
    if(escape) throw std::runtime_error("line ended with unfinished escape");
    if(in_single || in_double) throw std::runtime_error("unterminated quote");
    flush();
    return tokens;
}

CommandInvocation parse_invocation(const std::vector<std::string>& tokens){
    CommandInvocation inv;
    if(tokens.empty()) return inv;
    inv.name = tokens[0];
    inv.args.assign(tokens.begin() + 1, tokens.end());
    return inv;
}

const std::vector<std::string>& get_all_commands(){
    static const std::vector<std::string> cmds = {
        "cat", "cd", "du", "echo", "exit", "help", "ls", "pwd", "tree", "wc"
    };
    return cmds;
}

std::vector<std::string> get_path_completions(const Vfs& vfs, const std::string& partial){
    std::vector<std::string> results;

    // Determine the directory to search and the prefix to match
    std::string dir_part;
    std::string prefix = partial;
    size_t last_slash = partial.rfind('/');
    if(last_slash != std::string::npos){
        dir_part = partial.substr(0, last_slash + 1);
        prefix = partial.substr(last_slash + 1);
    }

    VfsPath search_dir = dir_part.empty() ? vfs.cwd : vfs.resolve(dir_part);
    const VfsNode* dir = vfs.getNode(search_dir);
    if(!dir || !dir->isDir()) return results;

    for(const auto& child : dir->dir()->children){
        const std::string& name = child->name;
        if(prefix.empty() && !name.empty() && name[0] == '.') continue; // skip hidden
        if(starts_with(name, prefix)){
            results.push_back(dir_part + name + (child->isDir() ? "/" : ""));
        }
    }

    std::sort(results.begin(), results.end());
    return results;
}

// Perform tab completion on the current buffer
std::string complete_input(const Vfs& vfs, const std::string& buffer, size_t cursor, bool& show_list){
    show_list = false;

    // Only complete at cursor position (end of word)
    if(cursor != buffer.size()) return buffer;
    if(trim_copy(buffer).empty()) return buffer;

    bool at_word_start = std::isspace(static_cast<unsigned char>(buffer.back())) != 0;
    size_t word_start = buffer.find_last_of(" \t");
    word_start = (word_start == std::string::npos) ? 0 : word_start + 1;
    std::string prefix_to_complete = at_word_start ? std::string() : buffer.substr(word_start);
    bool completing_command = trim_copy(buffer.substr(0, word_start)).empty() && !at_word_start;

    std::vector<std::string> candidates;
    if(completing_command){
        for(const auto& cmd : get_all_commands()){
            if(starts_with(cmd, prefix_to_complete)) candidates.push_back(cmd);
        }
    } else {
        candidates = get_path_completions(vfs, prefix_to_complete);
    }

    if(candidates.empty()){
        return buffer; // No completions
    }

    std::string head = buffer.substr(0, buffer.size() - prefix_to_complete.size());
    if(candidates.size() == 1){
        std::string result = head + candidates[0];
        if(completing_command) result += ' ';
        return result;
    }

    // Multiple matches - find common prefix
    std::string common = candidates[0];
    for(size_t i = 1; i < candidates.size(); ++i){
        size_t j = 0;
        while(j < common.size() && j < candidates[i].size() && common[j] == candidates[i][j]){
            ++j;
        }
        common = common.substr(0, j);
    }

    if(common.size() > prefix_to_complete.size()){
        return head + common;
    }

    // Show list of candidates
    show_list = true;
    std::cout << "\r\n";
    size_t col = 0;
    const size_t max_width = 80;
    for(const auto& candidate : candidates){
        if(col + candidate.size() + 2 > max_width && col > 0){
            std::cout << "\r\n";
            col = 0;
        }
        std::cout << candidate << "  ";
        col += candidate.size() + 2;
    }
    std::cout << "\r\n";

    return buffer;
}

bool terminal_available(){
    return ::isatty(STDIN_FILENO) == 1 && ::isatty(STDOUT_FILENO) == 1;
}

void install_interrupt_handler(){
    struct sigaction sa{};
    sa.sa_handler = on_interrupt;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;  // no SA_RESTART: a blocked read returns EINTR
    if(sigaction(SIGINT, &sa, nullptr) != 0){
        std::cout << "note: cannot install SIGINT handler: " << std::strerror(errno) << "\n";
    }
}

void redraw_prompt_line(const std::string& prompt, const std::string& buffer, size_t cursor){
    std::cout << '\r' << prompt << buffer << "\x1b[K";
    if(cursor < buffer.size()){
        size_t tail = utf8_length(buffer, cursor, buffer.size());
        std::cout << "\x1b[" << tail << 'D';
    }
    std::cout.flush();
}

size_t erase_before_cursor(std::string& buffer, size_t cursor){
    if(cursor == 0) return 0;
    size_t start = utf8_prev(buffer, cursor);
    buffer.erase(start, cursor - start);
    return start;
}

void erase_at_cursor(std::string& buffer, size_t cursor){
    if(cursor >= buffer.size()) return;
    buffer.erase(cursor, utf8_advance(buffer, cursor) - cursor);
}

ReadStatus read_line_with_history(const Vfs& vfs, const std::string& prompt, std::string& out, const std::vector<std::string>& history){
    std::cout << prompt;
    std::cout.flush();

    auto cooked_read = [&]() -> ReadStatus {
        g_interrupted = 0;
        if(std::getline(std::cin, out)) return ReadStatus::Line;
        if(g_interrupted){
            g_interrupted = 0;
            std::cin.clear();
            clearerr(stdin);
            return ReadStatus::Interrupted;
        }
        return ReadStatus::Eof;
    };

    if(!terminal_available()) return cooked_read();

    RawTerminalMode guard;
    if(!guard.ok()) return cooked_read();

    std::string buffer;
    size_t cursor = 0;
    size_t history_pos = history.size();
    std::string saved_new_entry;
    bool saved_valid = false;

    auto redraw_current = [&](){
        redraw_prompt_line(prompt, buffer, cursor);
    };
    auto leave_history = [&](){
        if(history_pos != history.size()){
            history_pos = history.size();
            saved_valid = false;
        }
    };

    while(true){
        unsigned char ch = 0;
        ssize_t n = ::read(STDIN_FILENO, &ch, 1);
        if(n < 0 && errno == EINTR) continue;
        if(n <= 0){
            std::cout << "\r\n";
            return ReadStatus::Eof;
        }

        if(ch == '\r' || ch == '\n'){
            std::cout << "\r\n";
            out = buffer;
            return ReadStatus::Line;
        }

        if(ch == 3){ // Ctrl-C
            std::cout << "^C\r\n";
            return ReadStatus::Interrupted;
        }

        if(ch == 4){ // Ctrl-D
            if(buffer.empty()){
                std::cout << "\r\n";
                return ReadStatus::Eof;
            }
            if(cursor < buffer.size()){
                erase_at_cursor(buffer, cursor);
                redraw_current();
                leave_history();
            }
            continue;
        }

        if(ch == 9){ // Tab - auto-complete
            bool show_list = false;
            std::string completed = complete_input(vfs, buffer, cursor, show_list);
            if(completed != buffer){
                buffer = completed;
                cursor = buffer.size();
                leave_history();
            }
            redraw_current();
            continue;
        }

        if(ch == 127 || ch == 8){ // backspace
            if(cursor > 0){
                cursor = erase_before_cursor(buffer, cursor);
                redraw_current();
                leave_history();
            }
            continue;
        }

        if(ch == 1){ // Ctrl-A
            if(cursor != 0){
                cursor = 0;
                redraw_current();
            }
            continue;
        }

        if(ch == 5){ // Ctrl-E
            if(cursor != buffer.size()){
                cursor = buffer.size();
                redraw_current();
            }
            continue;
        }

        if(ch == 21){ // Ctrl-U
            if(cursor > 0){
                buffer.erase(0, cursor);
                cursor = 0;
                redraw_current();
                leave_history();
            }
            continue;
        }

        if(ch == 11){ // Ctrl-K
            if(cursor < buffer.size()){
                buffer.erase(cursor);
                redraw_current();
                leave_history();
            }
            continue;
        }

        if(ch == 27){ // escape sequences
            unsigned char seq1 = 0;
            if(::read(STDIN_FILENO, &seq1, 1) <= 0) continue;
            if(seq1 != '[') continue;
            unsigned char seq2 = 0;
            if(::read(STDIN_FILENO, &seq2, 1) <= 0) continue;

            if(seq2 >= '0' && seq2 <= '9'){
                unsigned char seq3 = 0;
                if(::read(STDIN_FILENO, &seq3, 1) <= 0) continue;
                if(seq2 == '3' && seq3 == '~'){ // delete key
                    if(cursor < buffer.size()){
                        erase_at_cursor(buffer, cursor);
                        redraw_current();
                        leave_history();
                    }
                }
                continue;
            }

            if(seq2 == 'A'){ // up
                if(history.empty()){
                    std::cout << '\a' << std::flush;
                    continue;
                }
                if(history_pos == history.size()){
                    if(!saved_valid){
                        saved_new_entry = buffer;
                        saved_valid = true;
                    }
                    history_pos = history.size() - 1;
                } else if(history_pos > 0){
                    --history_pos;
                } else {
                    std::cout << '\a' << std::flush;
                    continue;
                }
                buffer = history[history_pos];
                cursor = buffer.size();
                redraw_current();
                continue;
            }

            if(seq2 == 'B'){ // down
                if(history_pos == history.size()){
                    std::cout << '\a' << std::flush;
                    continue;
                }
                ++history_pos;
                if(history_pos == history.size()){
                    buffer = saved_valid ? saved_new_entry : std::string{};
                    saved_valid = false;
                } else {
                    buffer = history[history_pos];
                }
                cursor = buffer.size();
                redraw_current();
                continue;
            }

            if(seq2 == 'C'){ // right
                if(cursor < buffer.size()){
                    cursor = utf8_advance(buffer, cursor);
                    redraw_current();
                }
                continue;
            }

            if(seq2 == 'D'){ // left
                if(cursor > 0){
                    cursor = utf8_prev(buffer, cursor);
                    redraw_current();
                }
                continue;
            }

            continue;
        }

        // printable ASCII and UTF-8 bytes
        if(ch >= 32 && ch != 127){
            buffer.insert(buffer.begin() + static_cast<std::string::difference_type>(cursor), static_cast<char>(ch));
            ++cursor;
            redraw_current();
            leave_history();
            continue;
        }
    }
}

std::optional<std::filesystem::path> history_file_path(){
    if(const char* env = std::getenv("VFSEMU_HISTORY_FILE"); env && *env){
        return std::filesystem::path(env);
    }
    if(const char* home = std::getenv("HOME"); home && *home){
        return std::filesystem::path(home) / ".vfsemu_history";
    }
    return std::nullopt;
}

std::vector<std::string> load_history(const std::filesystem::path& file){
    std::vector<std::string> history;
    std::ifstream in(file);
    std::string line;
    while(std::getline(in, line)){
        if(!trim_copy(line).empty()) history.push_back(line);
    }
    if(history.size() > kHistoryLimit)
        history.erase(history.begin(), history.end() - static_cast<std::ptrdiff_t>(kHistoryLimit));
    return history;
}

// Keeps the newest kHistoryLimit entries; repeats of the previous entry are dropped.
bool save_history(const std::filesystem::path& file, const std::vector<std::string>& history){
    std::vector<const std::string*> kept;
    for(const auto& entry : history){
        if(!kept.empty() && *kept.back() == entry) continue;
        kept.push_back(&entry);
    }
    size_t first = kept.size() > kHistoryLimit ? kept.size() - kHistoryLimit : 0;

    if(file.has_parent_path()){
        std::error_code ec;
        std::filesystem::create_directories(file.parent_path(), ec);
    }
    std::ofstream out(file, std::ios::trunc);
    for(size_t i = first; out && i < kept.size(); ++i) out << *kept[i] << '\n';
    out.flush();
    if(!out){
        TRACE_MSG("history write failed: ", file.string());
        return false;
    }
    return true;
}
