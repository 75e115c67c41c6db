#include "VfsEmu.h"

using i18n::MsgId;

namespace {
std::string msg(MsgId id){ return i18n::get(id); }

CommandResult failure(const std::string& text){
    CommandResult r;
    r.success = false;
    r.output = text + "\n";
    return r;
}

// "<verb>: cannot access '<what>': No such file or directory"
std::string cannot_access(const std::string& verb, const std::string& what){
    return verb + ": " + msg(MsgId::CANNOT_ACCESS) + " '" + what + "': " + msg(MsgId::NO_SUCH_FILE);
}
}

std::string Shell::prompt() const {
    return config.user + "@" + config.host + ":" + vfs.cwd.basename() + "$ ";
}

CommandResult Shell::cmdLs(const CommandInvocation& inv){
    VfsPath target = inv.args.empty() ? vfs.cwd : vfs.resolve(inv.args[0]);
    auto listing = vfs.listDir(target);
    if(!listing) return failure(cannot_access("ls", inv.args.empty() ? target.str() : inv.args[0]));
    CommandResult r;
    for(const auto& name : *listing) r.output += name + "\n";
    return r;
}

CommandResult Shell::cmdCd(const CommandInvocation& inv){
    if(inv.args.empty()){
        vfs.cwd = VfsPath::root();
        return {};
    }
    const std::string& arg = inv.args[0];
    VfsPath target = vfs.resolve(arg);
    const VfsNode* node = vfs.getNode(target);
    if(!node) return failure("cd: " + arg + ": " + msg(MsgId::NO_SUCH_FILE));
    if(!node->isDir()) return failure("cd: " + arg + ": " + msg(MsgId::NOT_A_DIR));
    vfs.cwd = target;
    return {};
}

CommandResult Shell::cmdCat(const CommandInvocation& inv){
    if(inv.args.empty()) return failure("cat: " + msg(MsgId::MISSING_OPERAND));
    CommandResult r;
    for(const auto& arg : inv.args){
        VfsPath target = vfs.resolve(arg);
        if(auto content = vfs.readFile(target)){
            r.output += *content;
            if(!content->empty() && content->back() != '\n') r.output += "\n";
            continue;
        }
        r.success = false;
        bool is_dir = vfs.exists(target);
        r.output += "cat: " + arg + ": " + msg(is_dir ? MsgId::IS_A_DIR : MsgId::NO_SUCH_FILE) + "\n";
    }
    return r;
}

CommandResult Shell::cmdWc(const CommandInvocation& inv){
    if(inv.args.empty()) return failure("wc: " + msg(MsgId::MISSING_OPERAND));
    CommandResult r;
    for(const auto& arg : inv.args){
        VfsPath target = vfs.resolve(arg);
        if(auto st = vfs.fileStats(target)){
            std::ostringstream oss;
            oss << st->lines << " " << st->words << " " << st->bytes << " " << arg << "\n";
            r.output += oss.str();
            continue;
        }
        r.success = false;
        bool is_dir = vfs.exists(target);
        r.output += "wc: " + arg + ": " + msg(is_dir ? MsgId::IS_A_DIR : MsgId::NO_SUCH_FILE) + "\n";
    }
    return r;
}

CommandResult Shell::cmdDu(const CommandInvocation& inv){
    VfsPath target = inv.args.empty() ? vfs.cwd : vfs.resolve(inv.args[0]);
    if(auto size = vfs.dirSize(target)){
        CommandResult r;
        r.output = std::to_string(*size) + "\t" + target.str() + "\n";
        return r;
    }
    if(vfs.exists(target)) return failure("du: " + target.str() + ": " + msg(MsgId::NOT_A_DIR));
    return failure(cannot_access("du", target.str()));
}

CommandResult Shell::cmdTree(const CommandInvocation& inv){
    VfsPath target = inv.args.empty() ? vfs.cwd : vfs.resolve(inv.args[0]);
    auto rendered = vfs.renderTree(target);
    if(!rendered) return failure("tree: " + target.str() + " [" + msg(MsgId::ERROR_OPENING_DIR) + "]");
    CommandResult r;
    r.output = *rendered;
    return r;
}

CommandResult Shell::execute(const CommandInvocation& inv){
    TRACE_FN("cmd=", inv.name, ", argc=", inv.args.size());
    const std::string& cmd = inv.name;
    CommandResult result;

    if(cmd == "exit"){
        result.exit_requested = true;
        result.output = msg(MsgId::EXIT) + std::string("\n");
    } else if(cmd == "ls"){
        result = cmdLs(inv);
    } else if(cmd == "cd"){
        result = cmdCd(inv);
    } else if(cmd == "cat"){
        result = cmdCat(inv);
    } else if(cmd == "pwd"){
        result.output = vfs.cwd.str() + "\n";
    } else if(cmd == "echo"){
        result.output = join_args(inv.args) + "\n";
    } else if(cmd == "wc"){
        result = cmdWc(inv);
    } else if(cmd == "du"){
        result = cmdDu(inv);
    } else if(cmd == "tree"){
        result = cmdTree(inv);
    } else if(cmd == "help"){
        result.output = msg(MsgId::HELP_TEXT);
    } else {
        result = failure(cmd + ": " + msg(MsgId::COMMAND_NOT_FOUND));
    }
    return result;
}

void Shell::emit(const CommandResult& res){
    if(!res.output.empty()){
        out << res.output;
        out.flush();
    }
    if(res.exit_requested) running = false;
}

bool Shell::runLine(const std::string& line){
    auto trimmed = trim_copy(line);
    if(trimmed.empty() || trimmed[0] == '#') return running;
    std::vector<std::string> tokens;
    try{
        tokens = tokenize_command_line(trimmed);
    } catch(const std::exception& e){
        out << msg(MsgId::PARSE_ERROR) << ": " << e.what() << "\n";
        return running;
    }
    if(tokens.empty()) return running;
    emit(execute(parse_invocation(tokens)));
    return running;
}

bool Shell::runScript(const std::string& path){
    TRACE_FN("path=", path);
    std::ifstream in(path);
    if(!in){
        out << "error: " << msg(MsgId::SCRIPT_OPEN_FAILED) << " '" << path << "'\n";
        return false;
    }
    if(!config.quiet) out << msg(MsgId::SCRIPT_RUNNING) << ": " << path << "\n";

    std::string line;
    size_t line_no = 0;
    while(running && std::getline(in, line)){
        ++line_no;
        TRACE_LOOP("script.line", "n=", line_no);
        auto trimmed = trim_copy(line);
        if(trimmed.empty() || trimmed[0] == '#') continue;
        out << prompt() << trimmed << "\n";
        std::vector<std::string> tokens;
        try{
            tokens = tokenize_command_line(trimmed);
        } catch(const std::exception& e){
            out << msg(MsgId::SCRIPT_LINE) << " " << line_no << ": "
                << msg(MsgId::PARSE_ERROR) << ": " << e.what() << "\n";
            continue;
        }
        if(tokens.empty()) continue;
        emit(execute(parse_invocation(tokens)));
    }

    if(!config.quiet) out << msg(MsgId::SCRIPT_FINISHED) << "\n";
    return true;
}

void Shell::runInteractive(){
    TRACE_FN();
    if(!running) return;
    if(!config.quiet){
        out << msg(MsgId::INTERACTIVE_MODE) << "\n";
        out << msg(MsgId::AVAILABLE_COMMANDS) << ": " << join_args(get_all_commands()) << "\n";
        out << msg(MsgId::EXIT_HINT) << "\n";
        out << std::string(50, '-') << "\n";
        out.flush();
    }

    auto history_file = history_file_path();
    std::vector<std::string> history;
    if(history_file) history = load_history(*history_file);
    bool history_dirty = false;
    install_interrupt_handler();

    std::string line;
    while(running){
        ReadStatus st = read_line_with_history(vfs, prompt(), line, history);
        if(st == ReadStatus::Interrupted){
            out << msg(MsgId::INTERRUPT_HINT) << "\n";
            continue;
        }
        if(st == ReadStatus::Eof){
            out << msg(MsgId::EXIT) << "\n";
            break;
        }
        if(!trim_copy(line).empty()){
            history.push_back(line);
            history_dirty = true;
        }
        runLine(line);
    }
    if(history_dirty && history_file && !save_history(*history_file, history)){
        out << "note: cannot write history to '" << history_file->string() << "'\n";
    }
}
