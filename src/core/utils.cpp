#include "utils.hpp"
#include <openssl/sha.h>
#include <cctype>
#include <iomanip>
#include <sstream>

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        return used == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string sha256_hex(const std::string& input) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(input.data()),
           input.size(), hash);

    std::ostringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string shell_quote(const std::string& s) {
    if (s.empty()) return "''";
    bool plain = true;
    for (char c : s) {
        if (!(isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' ||
              c == '.' || c == '/' || c == ':' || c == '=' || c == ',' || c == '@')) {
            plain = false;
            break;
        }
    }
    if (plain) return s;

    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string shell_join(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& w : words) {
        if (!out.empty()) out += ' ';
        out += shell_quote(w);
    }
    return out;
}

std::string join_words(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& w : words) {
        if (!out.empty()) out += ' ';
        out += w;
    }
    return out;
}
