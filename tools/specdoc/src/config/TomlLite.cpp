#include <specdoc_tool/config/TomlLite.hpp>

#include <specdoc/os/File.hpp>

#include <cctype>
#include <filesystem>
#include <sstream>

namespace specdoc_tool::config::toml_lite {

namespace {

std::string trim(std::string s) {
    const auto is_space = [](unsigned char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    };
    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();
    return s;
}

// 문자열 밖의 '#' 부터 주석
std::string strip_comment(std::string_view line) {
    std::string out{};
    bool in_string = false;
    bool escaped = false;
    for (char c : line) {
        if (!in_string && c == '#') break;
        out.push_back(c);
        if (!in_string) {
            if (c == '"') in_string = true;
            continue;
        }
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') in_string = false;
    }
    return out;
}

bool parse_string_literal(std::string_view text, std::string& out, std::string& err) {
    if (text.size() < 2 || text.front() != '"' || text.back() != '"') {
        err = "invalid string literal";
        return false;
    }
    out.clear();
    out.reserve(text.size() - 2);
    bool escaped = false;
    for (size_t i = 1; i + 1 < text.size(); ++i) {
        const char c = text[i];
        if (escaped) {
            switch (c) {
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                default: out.push_back(c); break;
            }
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        out.push_back(c);
    }
    if (escaped) {
        err = "unterminated escape in string literal";
        return false;
    }
    return true;
}

bool parse_int_literal(std::string_view text, int64_t& out) {
    if (text.empty()) return false;
    size_t i = 0;
    const bool neg = text[0] == '-';
    if (text[0] == '+' || text[0] == '-') i = 1;
    if (i >= text.size() || text.size() - i > 18) return false;

    int64_t v = 0;
    for (; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
        v = v * 10 + (text[i] - '0');
    }
    out = neg ? -v : v;
    return true;
}

bool parse_value(std::string_view text, Value& out, std::string& err) {
    const std::string v = trim(std::string(text));
    if (v.empty()) {
        err = "empty value";
        return false;
    }

    if (v == "true") {
        out = true;
        return true;
    }
    if (v == "false") {
        out = false;
        return true;
    }

    int64_t iv = 0;
    if (parse_int_literal(v, iv)) {
        out = iv;
        return true;
    }

    if (v.front() == '"' && v.back() == '"') {
        std::string sv{};
        if (!parse_string_literal(v, sv, err)) return false;
        out = std::move(sv);
        return true;
    }

    err = "unsupported TOML value (expected string, integer or boolean)";
    return false;
}

bool valid_key(std::string_view key) {
    if (key.empty()) return false;
    for (char c : key) {
        const bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
        if (!ok) return false;
    }
    return true;
}

} // namespace

bool parse_text(std::string_view text,
                std::string_view source_name,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err) {
    out.clear();
    err.clear();

    const std::string src(source_name);
    std::istringstream iss{std::string(text)};
    std::string section{};
    std::string line{};
    size_t line_no = 0;
    while (std::getline(iss, line)) {
        ++line_no;
        const std::string where = src + ":" + std::to_string(line_no) + ": ";
        std::string content = trim(strip_comment(line));
        if (content.empty()) continue;

        if (content.front() == '[') {
            if (content.back() != ']') {
                err = where + "invalid section header";
                return false;
            }
            const std::string sec = trim(content.substr(1, content.size() - 2));
            if (sec.empty() || !valid_key(sec)) {
                err = where + "invalid section name";
                return false;
            }
            section = sec;
            continue;
        }

        const auto eq = content.find('=');
        if (eq == std::string::npos) {
            err = where + "expected '='";
            return false;
        }
        std::string key = trim(content.substr(0, eq));
        std::string rhs = trim(content.substr(eq + 1));
        if (key.empty() || !valid_key(key)) {
            err = where + "invalid key";
            return false;
        }

        Value parsed{};
        std::string parse_err{};
        if (!parse_value(rhs, parsed, parse_err)) {
            err = where + parse_err;
            return false;
        }

        const std::string fq = section.empty() ? key : section + "." + key;
        if (out.contains(fq)) {
            warnings.push_back(where + "duplicate key '" + fq + "', overriding");
        }
        out[fq] = std::move(parsed);
    }

    return true;
}

bool parse_file(const std::filesystem::path& path,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err) {
    out.clear();
    err.clear();

    if (path.empty()) return true;
    std::error_code ec{};
    if (!std::filesystem::exists(path, ec)) return true;
    if (!std::filesystem::is_regular_file(path, ec)) {
        err = "not a regular file: " + path.string();
        return false;
    }

    std::string content{};
    std::string read_err{};
    if (!specdoc::open_file(path.string(), content, read_err)) {
        err = "failed to open file: " + path.string() + " (" + read_err + ")";
        return false;
    }

    return parse_text(content, path.string(), out, warnings, err);
}

} // namespace specdoc_tool::config::toml_lite
