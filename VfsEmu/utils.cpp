#include "VfsEmu.h"

// String utilities
std::string trim_copy(const std::string& s){
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) --b;
    return s.substr(a, b - a);
}

std::string join_args(const std::vector<std::string>& args, size_t start){
    std::string out;
    for(size_t i = start; i < args.size(); ++i){
        if(i > start) out.push_back(' ');
        out += args[i];
    }
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix){
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Decodes the code point at `i` and advances past it. A malformed or
// truncated sequence yields U+FFFD and consumes one byte.
uint32_t utf8_next(const std::string& s, size_t& i){
    unsigned char c = static_cast<unsigned char>(s[i]);
    size_t len = 0;
    uint32_t cp = 0;
    if(c < 0x80){ ++i; return c; }
    if(c >= 0xC2 && c <= 0xDF){ len = 2; cp = c & 0x1F; }
    else if(c >= 0xE0 && c <= 0xEF){ len = 3; cp = c & 0x0F; }
    else if(c >= 0xF0 && c <= 0xF4){ len = 4; cp = c & 0x07; }
    else { ++i; return 0xFFFD; }
    if(i + len > s.size()){ ++i; return 0xFFFD; }
    for(size_t k = 1; k < len; ++k){
        unsigned char cc = static_cast<unsigned char>(s[i + k]);
        if((cc & 0xC0) != 0x80){ ++i; return 0xFFFD; }
        cp = (cp << 6) | (cc & 0x3F);
    }
    if((len == 3 && cp < 0x800) || (len == 4 && (cp < 0x10000 || cp > 0x10FFFF)) ||
       (cp >= 0xD800 && cp <= 0xDFFF)){
        ++i;
        return 0xFFFD;
    }
    i += len;
    return cp;
}

size_t utf8_prev(const std::string& s, size_t pos){
    if(pos == 0) return 0;
    size_t p = pos - 1;
    size_t steps = 0;
    while(p > 0 && steps < 3 && (static_cast<unsigned char>(s[p]) & 0xC0) == 0x80){
        --p;
        ++steps;
    }
    size_t check = p;
    utf8_next(s, check);
    return check == pos ? p : pos - 1;
}

size_t utf8_advance(const std::string& s, size_t pos){
    if(pos >= s.size()) return s.size();
    utf8_next(s, pos);
    return pos;
}

size_t utf8_length(const std::string& s, size_t from, size_t to){
    size_t n = 0;
    while(from < to){
        utf8_next(s, from);
        ++n;
    }
    return n;
}

bool is_line_break(uint32_t cp){
    switch(cp){
        case '\n': case '\r': case 0x0B: case 0x0C:
        case 0x1C: case 0x1D: case 0x1E:
        case 0x85: case 0x2028: case 0x2029:
            return true;
    }
    return false;
}

bool is_unicode_space(uint32_t cp){
    if(cp >= 0x09 && cp <= 0x0D) return true;
    if(cp >= 0x1C && cp <= 0x20) return true;
    if(cp >= 0x2000 && cp <= 0x200A) return true;
    switch(cp){
        case 0x85: case 0xA0: case 0x1680: case 0x2028: case 0x2029:
        case 0x202F: case 0x205F: case 0x3000:
            return true;
    }
    return false;
}

// "\r\n" is one break. A final break does not start an empty line.
std::vector<std::string> split_lines(const std::string& s){
    std::vector<std::string> lines;
    size_t start = 0;
    size_t i = 0;
    while(i < s.size()){
        size_t at = i;
        uint32_t cp = utf8_next(s, i);
        if(!is_line_break(cp)) continue;
        lines.push_back(s.substr(start, at - start));
        if(cp == '\r' && i < s.size() && s[i] == '\n') ++i;
        start = i;
    }
    if(start < s.size()) lines.push_back(s.substr(start));
    return lines;
}

size_t count_words(const std::string& s){
    size_t n = 0;
    bool in_word = false;
    size_t i = 0;
    while(i < s.size()){
        if(is_unicode_space(utf8_next(s, i))){
            in_word = false;
        } else if(!in_word){
            in_word = true;
            ++n;
        }
    }
    return n;
}
