#ifndef _VfsEmu_content_codec_h_
#define _VfsEmu_content_codec_h_

// Prefix marking a file payload as base64 encoded UTF-8 text.
constexpr const char* kBase64Marker = "base64:";

std::optional<std::string> base64_decode(const std::string& input);
std::string base64_encode(const std::string& data);
bool is_valid_utf8(const std::string& s);

// Display text of a stored file payload. Never throws: a broken base64
// payload yields a "decode error: ..." line instead of the content.
std::string decode_content(const std::string& raw);

#endif
