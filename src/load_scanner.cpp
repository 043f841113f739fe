#include "skytest/watcher.h"

#include <cctype>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace skytest {

namespace {

bool is_ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; }

class Scanner {
public:
    explicit Scanner(std::string_view src) : src_(src) {}

    std::vector<std::string> run() {
        std::vector<std::string> out;
        bool                     line_start = true;
        while (pos_ < src_.size()) {
            const char c = src_[pos_];
            if (c == '#') {
                skip_comment();
                continue;
            }
            if (string_start()) {
                skip_string(nullptr);
                line_start = false;
                continue;
            }
            if (line_start && src_.compare(pos_, 4, "load") == 0 && (pos_ + 4 >= src_.size() || !is_ident_char(src_[pos_ + 4]))) {
                pos_ += 4;
                line_start = false;
                std::string module;
                if (parse_load_module(module))
                    out.push_back(std::move(module));
                continue;
            }
            if (is_ident_char(c)) {
                while (pos_ < src_.size() && is_ident_char(src_[pos_]))
                    ++pos_;
                line_start = false;
                continue;
            }
            line_start = c == '\n';
            ++pos_;
        }
        return out;
    }

private:
    void skip_comment() {
        while (pos_ < src_.size() && src_[pos_] != '\n')
            ++pos_;
    }

    // A quote, optionally preceded by r/b prefixes.
    bool string_start() const {
        std::size_t p = pos_;
        while (p < src_.size() && p - pos_ < 2 && (src_[p] == 'r' || src_[p] == 'b' || src_[p] == 'R' || src_[p] == 'B'))
            ++p;
        if (p < src_.size() && (src_[p] == '"' || src_[p] == '\'')) {
            return p == pos_ || pos_ == 0 || !is_ident_char(src_[pos_ - 1]);
        }
        return false;
    }

    // Consumes a string literal at pos_. Stores the decoded text in `out` when given.
    bool skip_string(std::string *out) {
        bool raw = false;
        while (src_[pos_] != '"' && src_[pos_] != '\'') {
            if (src_[pos_] == 'r' || src_[pos_] == 'R')
                raw = true;
            ++pos_;
        }
        const char  quote  = src_[pos_];
        const bool  triple = src_.compare(pos_, 3, std::string(3, quote)) == 0;
        pos_ += triple ? 3 : 1;
        while (pos_ < src_.size()) {
            const char c = src_[pos_];
            if (c == '\\' && pos_ + 1 < src_.size()) {
                const char next = src_[pos_ + 1];
                if (out) {
                    if (raw) {
                        out->push_back(c);
                        out->push_back(next);
                    } else {
                        switch (next) {
                        case 'n': out->push_back('\n'); break;
                        case 't': out->push_back('\t'); break;
                        case 'r': out->push_back('\r'); break;
                        case '\n': break;
                        default: out->push_back(next); break;
                        }
                    }
                }
                pos_ += 2;
                continue;
            }
            if (triple ? src_.compare(pos_, 3, std::string(3, quote)) == 0 : c == quote) {
                pos_ += triple ? 3 : 1;
                return true;
            }
            if (c == '\n' && !triple)
                return false;
            if (out)
                out->push_back(c);
            ++pos_;
        }
        return false;
    }

    void skip_space_and_comments() {
        while (pos_ < src_.size()) {
            const char c = src_[pos_];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\\')
                ++pos_;
            else if (c == '#')
                skip_comment();
            else
                break;
        }
    }

    bool parse_load_module(std::string &module) {
        while (pos_ < src_.size() && (src_[pos_] == ' ' || src_[pos_] == '\t'))
            ++pos_;
        if (pos_ >= src_.size() || src_[pos_] != '(')
            return false;
        ++pos_;
        skip_space_and_comments();
        if (pos_ >= src_.size() || !string_start())
            return false;
        return skip_string(&module);
    }

    std::string_view src_;
    std::size_t      pos_ = 0;
};

} // namespace

std::vector<std::string> scan_load_statements(std::string_view source) { return Scanner(source).run(); }

std::vector<std::string> load_targets_from_file(const std::filesystem::path &file) {
    std::ifstream in(file, std::ios::binary);
    if (!in)
        throw WatchError(fmt::format("extracting loads from {}: cannot open file", file.string()));
    std::ostringstream ss;
    ss << in.rdbuf();
    return scan_load_statements(ss.str());
}

} // namespace skytest
