#pragma once
#include <string>
#include <vector>
#include <filesystem>

std::string getenv_or(const char* key, const std::string& def);
int getenv_int_or(const char* key, int def);
float getenv_float_or(const char* key, float def);
bool getenv_bool_or(const char* key, bool def);

int parse_int_setting(const std::string& key, const std::string& value);
float parse_float_setting(const std::string& key, const std::string& value);
bool parse_bool_setting(const std::string& key, const std::string& value);

std::string sha1_file(const std::filesystem::path& p);
std::vector<std::filesystem::path> list_files(const std::filesystem::path& root,
                                              const std::vector<std::string>& exts,
                                              const std::vector<std::string>& ignore_dirs);
std::string read_text_file(const std::filesystem::path& p);

std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::vector<std::string> split_words(const std::string& text);
int word_count(const std::string& text);
// Blank-line delimited paragraphs, trimmed, empty ones dropped.
std::vector<std::string> split_paragraphs(const std::string& text);
