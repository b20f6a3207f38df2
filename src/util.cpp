#include "util.hpp"

#include <cstdio>
#include <cstdlib>
#include <random>

namespace npcmem {

static char ascii_lower(char c) {
    if (c >= 'A' && c <= 'Z') return static_cast<char>(c - 'A' + 'a');
    return c;
}

// Second byte of a UTF-8 encoded U+00C0..U+00DE capital, excluding U+00D7
static bool is_latin1_upper_tail(unsigned char c) {
    return c >= 0x80 && c <= 0x9E && c != 0x97;
}

std::string to_lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        auto c = static_cast<unsigned char>(s[i]);
        if (c == 0xC3 && i + 1 < s.size() &&
            is_latin1_upper_tail(static_cast<unsigned char>(s[i + 1]))) {
            out += s[i];
            out += static_cast<char>(static_cast<unsigned char>(s[i + 1]) + 0x20);
            ++i;
            continue;
        }
        out += ascii_lower(s[i]);
    }
    return out;
}

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (char c : s) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) n++;
    }
    return n;
}

bool contains_ignore_case(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

bool equals_ignore_case(const std::string& a, const std::string& b) {
    // Folding never changes the byte length
    if (a.size() != b.size()) return false;
    return to_lower(a) == to_lower(b);
}

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && (*start == ' ' || *start == '\t' ||
                                *start == '\n' || *start == '\r')) {
        ++start;
    }
    auto end = s.end();
    while (end != start && (*(end - 1) == ' ' || *(end - 1) == '\t' ||
                            *(end - 1) == '\n' || *(end - 1) == '\r')) {
        --end;
    }
    return std::string(start, end);
}

std::vector<std::string> split_any(const std::string& s, const std::string& delims) {
    std::vector<std::string> result;
    std::string token;
    for (char c : s) {
        if (delims.find(c) != std::string::npos) {
            if (!token.empty()) {
                result.push_back(std::move(token));
                token.clear();
            }
        } else {
            token += c;
        }
    }
    if (!token.empty()) result.push_back(std::move(token));
    return result;
}

std::string replace_all(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) return str;
    std::string result = str;
    size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.size(), to);
        pos += to.size();
    }
    return result;
}

std::string generate_id() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<uint64_t> dist;
    uint64_t val = dist(gen);
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(val));
    return buf;
}

std::string to_hex(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

} // namespace npcmem
