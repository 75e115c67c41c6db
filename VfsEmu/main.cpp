#include "VfsEmu.h"

namespace {

std::string env_or_empty(const char* name){
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

std::string detect_user(){
    for(const char* name : {"VFSEMU_USER", "USER", "LOGNAME"}){
        auto v = env_or_empty(name);
        if(!v.empty()) return v;
    }
    if(const char* login = ::getlogin(); login && *login) return login;
    return "user";
}

std::string detect_host(){
    auto v = env_or_empty("VFSEMU_HOST");
    if(!v.empty()) return v;
    char buf[256] = {};
    if(::gethostname(buf, sizeof(buf) - 1) == 0 && buf[0]) return buf;
    return "localhost";
}

}

int main(int argc, char** argv){
    using i18n::MsgId;

    TRACE_FN();
    i18n::init();

    auto usage = [&](const std::string& msg){
        std::cerr << msg << "\n";
        return 1;
    };

    const std::string usage_text = std::string("usage: ") + argv[0] +
        " [--vfs-path <file.json>] [--startup-script <file> [-]] [--user <name>] [--host <name>] [--quiet]";

    std::string vfs_path;
    std::string script_path;
    bool fallback_after_script = false;
    ShellConfig config;
    config.user = detect_user();
    config.host = detect_host();

    for(int i = 1; i < argc; ++i){
        std::string arg = argv[i];
        if(arg == "--help" || arg == "-h"){
            std::cout << usage_text << "\n";
            return 0;
        }
        if(arg == "--vfs-path" || arg == "-v"){
            if(i + 1 >= argc) return usage("--vfs-path requires a file path");
            vfs_path = argv[++i];
            continue;
        }
        if(arg == "--startup-script" || arg == "--script" || arg == "-s"){
            if(i + 1 >= argc) return usage(arg + " requires a file path");
            script_path = argv[++i];
            if(i + 1 < argc && std::string(argv[i + 1]) == "-"){
                fallback_after_script = true;
                ++i;
            }
            continue;
        }
        if(arg == "-"){
            if(script_path.empty()) return usage("'-' requires a preceding script path");
            fallback_after_script = true;
            continue;
        }
        if(arg == "--user" || arg == "-u"){
            if(i + 1 >= argc) return usage("--user requires a name");
            config.user = argv[++i];
            continue;
        }
        if(arg == "--host"){
            if(i + 1 >= argc) return usage("--host requires a name");
            config.host = argv[++i];
            continue;
        }
        if(arg == "--quiet" || arg == "-q"){
            config.quiet = true;
            continue;
        }
        return usage(usage_text);
    }

    if(config.quiet) i18n::set_english_only();

    if(!config.quiet){
        std::cout << i18n::get(MsgId::CONFIG_HEADER) << "\n";
        std::cout << i18n::get(MsgId::CONFIG_VFS_PATH) << ": "
                  << (vfs_path.empty() ? i18n::get(MsgId::NOT_SET_DEFAULT_VFS) : vfs_path.c_str()) << "\n";
        std::cout << i18n::get(MsgId::CONFIG_SCRIPT) << ": "
                  << (script_path.empty() ? i18n::get(MsgId::NOT_SET) : script_path.c_str()) << "\n";
        std::cout << std::string(40, '=') << "\n";
    }

    Vfs vfs(make_default_tree());
    if(!vfs_path.empty()){
        try{
            mount_source_file(vfs, vfs_path);
            if(!config.quiet){
                std::cout << i18n::get(MsgId::VFS_LOADED) << " " << vfs.source_file
                          << " (blake3 " << vfs.source_hash.substr(0, 16) << ")\n";
            }
        } catch(const std::exception& e){
            std::cout << "error: " << i18n::get(MsgId::VFS_LOAD_FAILED) << ": " << e.what() << "\n";
            std::cout << "note: " << i18n::get(MsgId::VFS_DEFAULT) << "\n";
        }
    } else if(!config.quiet){
        std::cout << "note: " << i18n::get(MsgId::VFS_DEFAULT) << "\n";
    }

    Shell shell(vfs, config);

    if(!script_path.empty()){
        if(!shell.runScript(script_path)) return 1;
        if(!fallback_after_script) return 0;
    }

    shell.runInteractive();
    return 0;
}
