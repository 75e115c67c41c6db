#ifndef _VfsEmu_utils_h_
#define _VfsEmu_utils_h_

// String utilities
std::string trim_copy(const std::string& s);
std::string join_args(const std::vector<std::string>& args, size_t start = 0);
bool starts_with(const std::string& s, const std::string& prefix);

// UTF-8 stepping. Malformed bytes count as one U+FFFD each.
uint32_t utf8_next(const std::string& s, size_t& i);
size_t utf8_prev(const std::string& s, size_t pos);
size_t utf8_advance(const std::string& s, size_t pos);
size_t utf8_length(const std::string& s, size_t from, size_t to);

bool is_line_break(uint32_t cp);
bool is_unicode_space(uint32_t cp);

std::vector<std::string> split_lines(const std::string& s);
size_t count_words(const std::string& s);

#endif
