#include "VfsEmu.h"

namespace {
constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr uint8_t kInvalid = 0xFF;

const std::array<uint8_t, 256>& reverse_table(){
    static const std::array<uint8_t, 256> map = []{
        std::array<uint8_t, 256> m{};
        m.fill(kInvalid);
        for(size_t i = 0; i < 64; ++i){
            m[static_cast<uint8_t>(kAlphabet[i])] = static_cast<uint8_t>(i);
        }
        return m;
    }();
    return map;
}
}

std::string base64_encode(const std::string& data){
    std::string encoded;
    encoded.reserve(((data.size() + 2) / 3) * 4);
    size_t index = 0;
    auto byte = [&](size_t i){ return static_cast<uint32_t>(static_cast<uint8_t>(data[i])); };
    while(index + 3 <= data.size()){
        uint32_t triple = (byte(index) << 16) | (byte(index + 1) << 8) | byte(index + 2);
        encoded.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        encoded.push_back(kAlphabet[(triple >> 6) & 0x3F]);
        encoded.push_back(kAlphabet[triple & 0x3F]);
        index += 3;
    }
    size_t remaining = data.size() - index;
    if(remaining == 1){
        uint32_t triple = byte(index) << 16;
        encoded.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        encoded += "==";
    } else if(remaining == 2){
        uint32_t triple = (byte(index) << 16) | (byte(index + 1) << 8);
        encoded.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        encoded.push_back(kAlphabet[(triple >> 6) & 0x3F]);
        encoded.push_back('=');
    }
    return encoded;
}

std::optional<std::string> base64_decode(const std::string& input){
    std::string filtered;
    filtered.reserve(input.size());
    for(char ch : input){
        if(!std::isspace(static_cast<unsigned char>(ch))) filtered.push_back(ch);
    }
    if(filtered.size() % 4 != 0) return std::nullopt;

    const auto& rev = reverse_table();
    std::string decoded;
    decoded.reserve((filtered.size() / 4) * 3);
    for(size_t i = 0; i < filtered.size(); i += 4){
        bool last = (i + 4 == filtered.size());
        char c2 = filtered[i + 2], c3 = filtered[i + 3];
        // '=' only in the last quad: "xx==" or "xxx="
        if(c2 == '=' && c3 != '=') return std::nullopt;
        if((c2 == '=' || c3 == '=') && !last) return std::nullopt;
        uint8_t a = rev[static_cast<uint8_t>(filtered[i])];
        uint8_t b = rev[static_cast<uint8_t>(filtered[i + 1])];
        uint8_t c = c2 == '=' ? 0 : rev[static_cast<uint8_t>(c2)];
        uint8_t d = c3 == '=' ? 0 : rev[static_cast<uint8_t>(c3)];
        if(a == kInvalid || b == kInvalid || c == kInvalid || d == kInvalid) return std::nullopt;
        uint32_t triple = (static_cast<uint32_t>(a) << 18) |
                          (static_cast<uint32_t>(b) << 12) |
                          (static_cast<uint32_t>(c) << 6) |
                          static_cast<uint32_t>(d);
        decoded.push_back(static_cast<char>((triple >> 16) & 0xFF));
        if(c2 != '=') decoded.push_back(static_cast<char>((triple >> 8) & 0xFF));
        if(c3 != '=') decoded.push_back(static_cast<char>(triple & 0xFF));
    }
    return decoded;
}

bool is_valid_utf8(const std::string& s){
    size_t i = 0;
    while(i < s.size()){
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        uint32_t cp = 0;
        if(c < 0x80){ ++i; continue; }
        else if((c & 0xE0) == 0xC0){ len = 2; cp = c & 0x1F; }
        else if((c & 0xF0) == 0xE0){ len = 3; cp = c & 0x0F; }
        else if((c & 0xF8) == 0xF0){ len = 4; cp = c & 0x07; }
        else return false;
        if(i + len > s.size()) return false;
        for(size_t k = 1; k < len; ++k){
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates, out of range
        if((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if(cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

std::string decode_content(const std::string& raw){
    if(!starts_with(raw, kBase64Marker)) return raw;
    TRACE_FN("size=", raw.size());
    auto decoded = base64_decode(raw.substr(std::strlen(kBase64Marker)));
    if(!decoded) return "decode error: invalid base64 payload";
    if(!is_valid_utf8(*decoded)) return "decode error: payload is not valid UTF-8";
    return *decoded;
}
