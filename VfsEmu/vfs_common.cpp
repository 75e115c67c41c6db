#include "VfsEmu.h"

#ifdef VFSEMU_TRACE
#include <mutex>

namespace vfsemu_trace {
    namespace {
        std::mutex& trace_mutex(){ static std::mutex m; return m; }
        std::ofstream& trace_stream(){
            static std::ofstream s("vfsemu_trace.log", std::ios::app);
            return s;
        }
        void write_line(const std::string& line){
            auto& os = trace_stream();
            os << line << '\n';
            os.flush();
        }
    }

    void log_line(const std::string& line){
        std::lock_guard<std::mutex> lock(trace_mutex());
        write_line(line);
    }

    Scope::Scope(const char* fn, const std::string& details) : name(fn ? fn : "?"){
        if(!name.empty()){
            std::string msg = std::string("enter ") + name;
            if(!details.empty()) msg += " | " + details;
            log_line(msg);
        }
    }

    Scope::~Scope(){
        if(!name.empty()){
            log_line(std::string("exit ") + name);
        }
    }

    void log_loop(const char* tag, const std::string& details){
        std::lock_guard<std::mutex> lock(trace_mutex());
        std::string msg = std::string("loop ") + (tag ? tag : "?");
        if(!details.empty()) msg += " | " + details;
        write_line(msg);
    }
}
#endif

//
// Internationalization implementation
//
namespace i18n {
    namespace {
        enum class Lang { EN, RU };
        Lang current_lang = Lang::EN;

        struct MsgTable {
            const char* en;
#ifdef VFSEMU_I18N_ENABLED
            const char* ru;
#endif
        };

#ifdef VFSEMU_I18N_ENABLED
#define VFSEMU_MSG(en, ru) { en, ru }
#else
#define VFSEMU_MSG(en, ru) { en }
#endif

        // Order must follow MsgId.
        const MsgTable messages[] = {
            VFSEMU_MSG("No such file or directory", "Нет такого файла или каталога"),
            VFSEMU_MSG("Not a directory", "Не каталог"),
            VFSEMU_MSG("Is a directory", "Это каталог"),
            VFSEMU_MSG("missing operand", "отсутствует операнд"),
            VFSEMU_MSG("cannot access", "невозможно получить доступ к"),
            VFSEMU_MSG("command not found", "команда не найдена"),
            VFSEMU_MSG("error opening dir", "ошибка открытия каталога"),
            VFSEMU_MSG("parse error", "ошибка разбора"),
            VFSEMU_MSG("use 'exit' to leave the emulator", "для выхода используйте команду 'exit'"),
            VFSEMU_MSG("exit", "выход"),
            VFSEMU_MSG("EMULATOR CONFIGURATION", "КОНФИГУРАЦИЯ ЭМУЛЯТОРА"),
            VFSEMU_MSG("VFS path", "Путь VFS"),
            VFSEMU_MSG("Startup script", "Стартовый скрипт"),
            VFSEMU_MSG("not set", "не указан"),
            VFSEMU_MSG("not set (default VFS)", "не указан (используется VFS по умолчанию)"),
            VFSEMU_MSG("VFS loaded from", "VFS загружена из"),
            VFSEMU_MSG("failed to load VFS", "ошибка загрузки VFS"),
            VFSEMU_MSG("using default VFS", "используется VFS по умолчанию"),
            VFSEMU_MSG("running script", "выполнение скрипта"),
            VFSEMU_MSG("script finished", "выполнение скрипта завершено"),
            VFSEMU_MSG("cannot open script", "невозможно открыть скрипт"),
            VFSEMU_MSG("line", "строка"),
            VFSEMU_MSG("interactive mode", "интерактивный режим"),
            VFSEMU_MSG("available commands", "доступные команды"),
            VFSEMU_MSG("type 'exit' to quit", "для выхода введите 'exit'"),
            VFSEMU_MSG(
                "  ls [path]          list directory entries\n"
                "  cd [path]          change directory (default: /)\n"
                "  cat <path>...      print file contents\n"
                "  pwd                print current directory\n"
                "  echo [args]...     print arguments\n"
                "  wc <path>...       print line, word and byte counts\n"
                "  du [path]          print total size of a directory\n"
                "  tree [path]        print directory tree\n"
                "  help               show this text\n"
                "  exit               leave the emulator\n",
                "  ls [путь]          содержимое каталога\n"
                "  cd [путь]          смена каталога (по умолчанию: /)\n"
                "  cat <путь>...      вывод содержимого файлов\n"
                "  pwd                текущий каталог\n"
                "  echo [арг]...      вывод аргументов\n"
                "  wc <путь>...       число строк, слов и байтов\n"
                "  du [путь]          общий размер каталога\n"
                "  tree [путь]        дерево каталога\n"
                "  help               эта справка\n"
                "  exit               выход из эмулятора\n"),
        };

#undef VFSEMU_MSG

        Lang detect_language() {
            const char* lang_env = std::getenv("LANG");
            if(!lang_env) lang_env = std::getenv("LC_MESSAGES");
            if(!lang_env) lang_env = std::getenv("LC_ALL");

            if(lang_env) {
                std::string lang_str(lang_env);
                if(lang_str.find("ru_") == 0 || lang_str.find("ru.") == 0 ||
                   lang_str.find("russian") != std::string::npos ||
                   lang_str.find("Russian") != std::string::npos) {
                    return Lang::RU;
                }
            }
            return Lang::EN;
        }
    }

    void init() {
#ifdef VFSEMU_I18N_ENABLED
        current_lang = detect_language();
#else
        (void)detect_language;
        current_lang = Lang::EN;
#endif
    }

    void set_english_only() {
        current_lang = Lang::EN;
    }

    const char* get(MsgId id) {
        size_t idx = static_cast<size_t>(id);
        if(idx >= sizeof(messages) / sizeof(messages[0])) {
            return "??? missing translation ???";
        }
#ifdef VFSEMU_I18N_ENABLED
        if(current_lang == Lang::RU) {
            return messages[idx].ru;
        }
#endif
        return messages[idx].en;
    }
}

//
// BLAKE3 digest of a VFS source document
//
std::string blake3_hex(const std::string& data){
    static const char digits[] = "0123456789abcdef";
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data.data(), data.size());
    uint8_t digest[BLAKE3_OUT_LEN];
    blake3_hasher_finalize(&hasher, digest, BLAKE3_OUT_LEN);

    std::string hex(2 * BLAKE3_OUT_LEN, '0');
    for(size_t i = 0; i < BLAKE3_OUT_LEN; ++i){
        hex[2 * i] = digits[digest[i] >> 4];
        hex[2 * i + 1] = digits[digest[i] & 0x0F];
    }
    return hex;
}
