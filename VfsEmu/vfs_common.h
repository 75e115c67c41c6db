#pragma once


// Tracing (optional debug feature)
#ifdef VFSEMU_TRACE
namespace vfsemu_trace {
    void log_line(const std::string& line);

    inline std::string concat(){ return {}; }

    template<typename... Args>
    std::string concat(Args&&... args){
        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));
        return oss.str();
    }

    struct Scope {
        std::string name;
        Scope(const char* fn, const std::string& details);
        ~Scope();
    };

    void log_loop(const char* tag, const std::string& details);
}
#define VFSEMU_TRACE_CAT(a,b) VFSEMU_TRACE_CAT_1(a,b)
#define VFSEMU_TRACE_CAT_1(a,b) a##b
#define TRACE_FN(...) auto VFSEMU_TRACE_CAT(_vfsemu_trace_scope_, __LINE__) = ::vfsemu_trace::Scope(__func__, ::vfsemu_trace::concat(__VA_ARGS__))
#define TRACE_MSG(...) ::vfsemu_trace::log_line(::vfsemu_trace::concat(__VA_ARGS__))
#define TRACE_LOOP(tag, ...) ::vfsemu_trace::log_loop(tag, ::vfsemu_trace::concat(__VA_ARGS__))
#else
#define TRACE_FN(...) (void)0
#define TRACE_MSG(...) (void)0
#define TRACE_LOOP(...) (void)0
#endif

// i18n (internationalization)
namespace i18n {
    enum class MsgId {
        NO_SUCH_FILE, NOT_A_DIR, IS_A_DIR, MISSING_OPERAND,
        CANNOT_ACCESS, COMMAND_NOT_FOUND, ERROR_OPENING_DIR,
        PARSE_ERROR, INTERRUPT_HINT, EXIT,
        CONFIG_HEADER, CONFIG_VFS_PATH, CONFIG_SCRIPT, NOT_SET, NOT_SET_DEFAULT_VFS,
        VFS_LOADED, VFS_LOAD_FAILED, VFS_DEFAULT,
        SCRIPT_RUNNING, SCRIPT_FINISHED, SCRIPT_OPEN_FAILED, SCRIPT_LINE,
        INTERACTIVE_MODE, AVAILABLE_COMMANDS, EXIT_HINT, HELP_TEXT
    };

    const char* get(MsgId id);
    void init();
    void set_english_only();
}

// Lowercase hex BLAKE3 digest (64 characters).
std::string blake3_hex(const std::string& data);
