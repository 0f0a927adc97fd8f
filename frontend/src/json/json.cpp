// frontend/src/json/json.cpp
#include <specdoc/json/Json.hpp>

#include <cctype>
#include <cstdio>
#include <cstdlib>


namespace specdoc::json {

    namespace {

        void append_utf8_(std::string& out, uint32_t cp) {
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
                return;
            }
            if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                return;
            }
            if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                return;
            }
            out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }

        int hex_value_(char ch) {
            if (ch >= '0' && ch <= '9') return ch - '0';
            if (ch >= 'a' && ch <= 'f') return 10 + (ch - 'a');
            if (ch >= 'A' && ch <= 'F') return 10 + (ch - 'A');
            return -1;
        }

    } // namespace

    bool Parser::parse(Value& out) {
        skip_ws_();
        if (!parse_value_(out)) return false;
        skip_ws_();
        if (pos_ != src_.size()) return fail_();
        return ok_;
    }

    bool Parser::parse_value_(Value& out) {
        skip_ws_();
        if (pos_ >= src_.size()) return fail_();

        const char ch = src_[pos_];
        if (ch == 'n' || ch == 't' || ch == 'f') return parse_literal_(out);
        if (ch == '"') {
            std::string s;
            if (!parse_string_(s)) return false;
            out = Value{};
            out.kind = Value::Kind::kString;
            out.string_v = std::move(s);
            return true;
        }
        if (ch == '[') return parse_array_(out);
        if (ch == '{') return parse_object_(out);
        if (ch == '-' || (ch >= '0' && ch <= '9')) return parse_number_(out);
        return fail_();
    }

    bool Parser::parse_literal_(Value& out) {
        out = Value{};
        if (src_.substr(pos_, 4) == "null") {
            pos_ += 4;
            out.kind = Value::Kind::kNull;
            return true;
        }
        if (src_.substr(pos_, 4) == "true") {
            pos_ += 4;
            out.kind = Value::Kind::kBool;
            out.bool_v = true;
            return true;
        }
        if (!consume_literal_("false")) return false;
        out.kind = Value::Kind::kBool;
        out.bool_v = false;
        return true;
    }

    bool Parser::parse_number_(Value& out) {
        const size_t begin = pos_;
        if (src_[pos_] == '-') ++pos_;

        if (pos_ >= src_.size()) return fail_();
        if (src_[pos_] == '0') {
            ++pos_;
        } else {
            if (!std::isdigit(static_cast<unsigned char>(src_[pos_]))) return fail_();
            while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) ++pos_;
        }

        if (pos_ < src_.size() && src_[pos_] == '.') {
            ++pos_;
            if (pos_ >= src_.size() || !std::isdigit(static_cast<unsigned char>(src_[pos_]))) return fail_();
            while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) ++pos_;
        }

        if (pos_ < src_.size() && (src_[pos_] == 'e' || src_[pos_] == 'E')) {
            ++pos_;
            if (pos_ < src_.size() && (src_[pos_] == '+' || src_[pos_] == '-')) ++pos_;
            if (pos_ >= src_.size() || !std::isdigit(static_cast<unsigned char>(src_[pos_]))) return fail_();
            while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) ++pos_;
        }

        const std::string text(src_.substr(begin, pos_ - begin));
        char* endp = nullptr;
        const double v = std::strtod(text.c_str(), &endp);
        if (endp == text.c_str() || (endp != nullptr && *endp != '\0')) return fail_();

        out = Value{};
        out.kind = Value::Kind::kNumber;
        out.number_v = v;
        return true;
    }

    bool Parser::parse_string_(std::string& out) {
        if (pos_ >= src_.size() || src_[pos_] != '"') return fail_();
        ++pos_;

        while (pos_ < src_.size()) {
            const char ch = src_[pos_++];
            if (ch == '"') return true;
            if (ch == '\n') {
                --pos_;
                return fail_();
            }
            if (ch != '\\') {
                out.push_back(ch);
                continue;
            }

            if (pos_ >= src_.size()) return fail_();
            const char esc = src_[pos_++];
            switch (esc) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    if (pos_ + 4 > src_.size()) return fail_();
                    uint32_t cp = 0;
                    for (int i = 0; i < 4; ++i) {
                        const int hv = hex_value_(src_[pos_ + i]);
                        if (hv < 0) return fail_();
                        cp = (cp << 4) | static_cast<uint32_t>(hv);
                    }
                    pos_ += 4;
                    append_utf8_(out, cp);
                    break;
                }
                default:
                    return fail_();
            }
        }
        return fail_();
    }

    bool Parser::parse_array_(Value& out) {
        if (pos_ >= src_.size() || src_[pos_] != '[') return fail_();
        ++pos_;

        out = Value{};
        out.kind = Value::Kind::kArray;

        while (true) {
            skip_ws_();
            if (pos_ >= src_.size()) return fail_();
            // 빈 배열 또는 trailing comma 뒤의 닫힘
            if (src_[pos_] == ']') {
                ++pos_;
                return true;
            }

            Value elem{};
            if (!parse_value_(elem)) return false;
            out.array_v.push_back(std::move(elem));

            skip_ws_();
            if (pos_ >= src_.size()) return fail_();
            if (src_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (src_[pos_] == ']') {
                ++pos_;
                return true;
            }
            return fail_();
        }
    }

    bool Parser::parse_object_(Value& out) {
        if (pos_ >= src_.size() || src_[pos_] != '{') return fail_();
        ++pos_;

        out = Value{};
        out.kind = Value::Kind::kObject;

        while (true) {
            skip_ws_();
            if (pos_ >= src_.size()) return fail_();
            if (src_[pos_] == '}') {
                ++pos_;
                return true;
            }

            std::string key;
            if (!parse_string_(key)) return false;

            skip_ws_();
            if (pos_ >= src_.size() || src_[pos_] != ':') return fail_();
            ++pos_;

            Value val{};
            if (!parse_value_(val)) return false;
            out.object_v.insert_or_assign(std::move(key), std::move(val));

            skip_ws_();
            if (pos_ >= src_.size()) return fail_();
            if (src_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (src_[pos_] == '}') {
                ++pos_;
                return true;
            }
            return fail_();
        }
    }

    bool Parser::consume_literal_(std::string_view lit) {
        if (src_.substr(pos_, lit.size()) != lit) return fail_();
        pos_ += lit.size();
        return true;
    }

    void Parser::skip_ws_() {
        while (pos_ < src_.size()) {
            const unsigned char ch = static_cast<unsigned char>(src_[pos_]);
            if (std::isspace(ch)) {
                ++pos_;
                continue;
            }
            if (ch == '/' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '/') {
                while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
                continue;
            }
            if (ch == '/' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '*') {
                const size_t end = src_.find("*/", pos_ + 2);
                if (end == std::string_view::npos) {
                    ok_ = false;
                    return;
                }
                pos_ = end + 2;
                continue;
            }
            break;
        }
    }

    bool Parser::fail_() {
        ok_ = false;
        return false;
    }

    const Value* get(const Value& obj, std::string_view key) {
        if (obj.kind != Value::Kind::kObject) return nullptr;
        const auto it = obj.object_v.find(std::string(key));
        if (it == obj.object_v.end()) return nullptr;
        return &it->second;
    }

    std::optional<std::string_view> as_string(const Value* v) {
        if (v == nullptr || v->kind != Value::Kind::kString) return std::nullopt;
        return v->string_v;
    }

    std::optional<int64_t> as_i64(const Value* v) {
        if (v == nullptr || v->kind != Value::Kind::kNumber) return std::nullopt;
        return static_cast<int64_t>(v->number_v);
    }

    std::optional<bool> as_bool(const Value* v) {
        if (v == nullptr || v->kind != Value::Kind::kBool) return std::nullopt;
        return v->bool_v;
    }

    std::string escape(std::string_view s) {
        std::string out;
        out.reserve(s.size() + 8);
        for (const char ch : s) {
            switch (ch) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\b': out += "\\b"; break;
                case '\f': out += "\\f"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(ch) < 0x20) {
                        char buf[7]{};
                        std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned char>(ch));
                        out += buf;
                    } else {
                        out.push_back(ch);
                    }
                    break;
            }
        }
        return out;
    }

    std::string to_text(const Value& v) {
        switch (v.kind) {
            case Value::Kind::kNull:
                return "null";
            case Value::Kind::kBool:
                return v.bool_v ? "true" : "false";
            case Value::Kind::kNumber: {
                std::string s = std::to_string(v.number_v);
                while (s.size() > 1 && s.back() == '0') s.pop_back();
                if (!s.empty() && s.back() == '.') s.pop_back();
                return s;
            }
            case Value::Kind::kString:
                return "\"" + escape(v.string_v) + "\"";
            case Value::Kind::kArray: {
                std::string out = "[";
                for (size_t i = 0; i < v.array_v.size(); ++i) {
                    if (i != 0) out += ",";
                    out += to_text(v.array_v[i]);
                }
                out += "]";
                return out;
            }
            case Value::Kind::kObject: {
                std::string out = "{";
                bool first = true;
                for (const auto& [k, val] : v.object_v) {
                    if (!first) out += ",";
                    first = false;
                    out += "\"" + escape(k) + "\":" + to_text(val);
                }
                out += "}";
                return out;
            }
        }
        return "null";
    }

} // namespace specdoc::json
