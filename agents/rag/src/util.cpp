#include "../include/util.hpp"
#include <openssl/sha.h>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <unordered_set>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

int getenv_int_or(const char* key, int def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    return parse_int_setting(key, v);
}

float getenv_float_or(const char* key, float def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    return parse_float_setting(key, v);
}

bool getenv_bool_or(const char* key, bool def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    return parse_bool_setting(key, v);
}

int parse_int_setting(const std::string& key, const std::string& value) {
    try {
        size_t idx = 0;
        int v = std::stoi(value, &idx, 10);
        if (idx == value.size()) return v;
    } catch (const std::exception&) {
        // reported below
    }
    throw std::invalid_argument("invalid integer for " + key + ": '" + value + "'");
}

float parse_float_setting(const std::string& key, const std::string& value) {
    try {
        size_t idx = 0;
        float v = std::stof(value, &idx);
        if (idx == value.size()) return v;
    } catch (const std::exception&) {
        // reported below
    }
    throw std::invalid_argument("invalid number for " + key + ": '" + value + "'");
}

bool parse_bool_setting(const std::string& key, const std::string& value) {
    auto v = to_lower(trim(value));
    if (v == "1" || v == "true" || v == "on" || v == "yes") return true;
    if (v == "0" || v == "false" || v == "off" || v == "no") return false;
    throw std::invalid_argument("invalid boolean for " + key + ": '" + value + "'");
}

static std::string to_hex(const unsigned char* md, size_t n) {
    std::ostringstream oss;
    for (size_t i = 0; i < n; ++i) {
        oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
    }
    return oss.str();
}

std::string sha1_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open " + p.string());
    SHA_CTX ctx;
    SHA1_Init(&ctx);
    char buf[1 << 16];
    while (f) {
        f.read(buf, sizeof(buf));
        std::streamsize n = f.gcount();
        if (n > 0) SHA1_Update(&ctx, buf, (size_t)n);
    }
    unsigned char md[SHA_DIGEST_LENGTH];
    SHA1_Final(md, &ctx);
    return to_hex(md, SHA_DIGEST_LENGTH);
}

std::string read_text_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open " + p.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::vector<std::filesystem::path> list_files(const std::filesystem::path& root,
                                              const std::vector<std::string>& exts,
                                              const std::vector<std::string>& ignore_dirs) {
    std::vector<std::filesystem::path> out;
    auto extset = std::unordered_set<std::string>(exts.begin(), exts.end());
    auto igset = std::unordered_set<std::string>(ignore_dirs.begin(), ignore_dirs.end());
    for (auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        auto rel = std::filesystem::relative(entry.path(), root);
        bool ignored = false;
        for (auto& part : rel) {
            if (igset.count(part.string())) { ignored = true; break; }
        }
        if (ignored) continue;
        auto ext = to_lower(entry.path().extension().string());
        if (extset.empty() || extset.count(ext)) out.push_back(entry.path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream ss(text);
    std::string w;
    while (ss >> w) words.push_back(w);
    return words;
}

int word_count(const std::string& text) {
    int n = 0;
    bool in_word = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++n;
        }
    }
    return n;
}

std::vector<std::string> split_paragraphs(const std::string& text) {
    std::vector<std::string> out;
    std::string current;
    auto flush = [&]{
        auto p = trim(current);
        if (!p.empty()) out.push_back(std::move(p));
        current.clear();
    };
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        if (trim(line).empty()) {
            flush();
            continue;
        }
        if (!current.empty()) current += '\n';
        current += line;
    }
    flush();
    return out;
}
