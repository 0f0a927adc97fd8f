#include <specdoc_tool/config/Config.hpp>

#include <specdoc_tool/config/TomlLite.hpp>
#include <specdoc/json/Json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <unordered_set>

namespace specdoc_tool::config {

namespace {

std::string getenv_string(const char* key) {
    if (key == nullptr) return {};
    const char* p = std::getenv(key);
    if (p == nullptr) return {};
    return std::string(p);
}

std::filesystem::path home_dir() {
    std::string home = getenv_string("HOME");
#if defined(_WIN32)
    if (home.empty()) {
        home = getenv_string("USERPROFILE");
    }
#endif
    return home.empty() ? std::filesystem::current_path() : std::filesystem::path(home);
}

std::filesystem::path compute_global_config_path() {
    const std::string xdg = getenv_string("XDG_CONFIG_HOME");
    if (!xdg.empty()) {
        return std::filesystem::path(xdg) / "specdoc" / "config.toml";
    }
    return home_dir() / ".config" / "specdoc" / "config.toml";
}

const std::unordered_set<std::string>& known_keys_() {
    static const std::unordered_set<std::string> k{
        "core.config_version",

        "diag.lang",
        "diag.format",
        "diag.context",

        "validate.strict",

        "tasks.status_file",

        "merge.collapse_blank_lines",
    };
    return k;
}

template <typename T>
const T* as_ptr(const Value* v) {
    if (v == nullptr) return nullptr;
    return std::get_if<T>(v);
}

std::string toml_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

void merge_into(FlatMap& base, const FlatMap& override_map) {
    for (const auto& [k, v] : override_map) {
        base[k] = v;
    }
}

std::string section_of(const std::string& key) {
    const auto pos = key.rfind('.');
    if (pos == std::string::npos) return {};
    return key.substr(0, pos);
}

std::string leaf_of(const std::string& key) {
    const auto pos = key.rfind('.');
    if (pos == std::string::npos) return key;
    return key.substr(pos + 1);
}

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string normalize_lang(std::string value) {
    value = lower(std::move(value));
    if (value == "en" || value == "ko" || value == "auto") return value;
    return "auto";
}

std::string normalize_diag_format(std::string value) {
    value = lower(std::move(value));
    if (value == "text" || value == "json") return value;
    return "text";
}

void apply_env_string(std::string& dst, const char* key) {
    const auto v = getenv_string(key);
    if (!v.empty()) dst = v;
}

void apply_env_int(int64_t& dst, const char* key, std::vector<std::string>* warnings) {
    const auto v = getenv_string(key);
    if (v.empty()) return;

    int64_t n = 0;
    size_t i = (v[0] == '-' || v[0] == '+') ? 1 : 0;
    bool ok = i < v.size() && v.size() - i <= 18;
    for (; ok && i < v.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(v[i]))) ok = false;
        else n = n * 10 + (v[i] - '0');
    }
    if (!ok) {
        if (warnings != nullptr) warnings->push_back(std::string(key) + ": not an integer, ignored");
        return;
    }
    dst = (v[0] == '-') ? -n : n;
}

} // namespace

bool is_known_key(std::string_view key) {
    return known_keys_().contains(std::string(key));
}

void filter_unknown_keys(FlatMap& values, std::vector<std::string>& warnings, std::string_view source_name) {
    std::vector<std::string> to_erase{};
    for (const auto& [k, _] : values) {
        if (!is_known_key(k)) {
            warnings.push_back(std::string(source_name) + ": unknown key '" + k + "' ignored");
            to_erase.push_back(k);
        }
    }
    for (const auto& k : to_erase) {
        values.erase(k);
    }
}

std::optional<std::filesystem::path> find_project_root(std::filesystem::path start) {
    std::error_code ec{};
    if (start.empty()) start = std::filesystem::current_path(ec);
    if (ec) return std::nullopt;
    if (!std::filesystem::exists(start, ec)) return std::nullopt;
    if (!std::filesystem::is_directory(start, ec)) {
        start = start.parent_path();
    }
    start = std::filesystem::absolute(start, ec);

    for (std::filesystem::path cur = start; !cur.empty(); cur = cur.parent_path()) {
        if (std::filesystem::is_directory(cur / ".specdoc", ec) ||
            std::filesystem::exists(cur / ".git", ec)) {
            return cur;
        }
        const auto parent = cur.parent_path();
        if (parent == cur) break;
    }
    return std::nullopt;
}

Paths resolve_paths(const std::optional<std::filesystem::path>& anchor) {
    std::filesystem::path start{};
    if (anchor.has_value()) {
        start = *anchor;
    } else {
        std::error_code ec{};
        start = std::filesystem::current_path(ec);
        if (ec) start = ".";
    }

    Paths out{};
    out.global_config = compute_global_config_path();
    out.project_root = find_project_root(start);
    if (out.project_root.has_value()) {
        out.project_config = *out.project_root / ".specdoc" / "config.toml";
    }
    return out;
}

LoadedConfig load(const std::optional<std::filesystem::path>& anchor) {
    LoadedConfig out{};
    out.paths = resolve_paths(anchor);

    {
        std::string err{};
        if (!toml_lite::parse_file(out.paths.global_config, out.global_values, out.warnings, err)) {
            out.warnings.push_back("failed to load global config: " + err);
        }
    }
    filter_unknown_keys(out.global_values, out.warnings, out.paths.global_config.string());

    if (!out.paths.project_config.empty()) {
        std::string err{};
        if (!toml_lite::parse_file(out.paths.project_config, out.project_values, out.warnings, err)) {
            out.warnings.push_back("failed to load project config: " + err);
        }
        filter_unknown_keys(out.project_values, out.warnings, out.paths.project_config.string());
    }

    out.effective_values = out.global_values;
    merge_into(out.effective_values, out.project_values);
    return out;
}

EffectiveSettings materialize(const LoadedConfig& cfg, std::vector<std::string>* warnings) {
    EffectiveSettings s{};
    const FlatMap& v = cfg.effective_values;

    auto get_string = [&](std::string_view key, std::string& dst) {
        const auto it = v.find(std::string(key));
        if (it == v.end()) return;
        if (const auto* p = as_ptr<std::string>(&it->second); p != nullptr) {
            dst = *p;
            return;
        }
        if (warnings != nullptr) warnings->push_back("config key '" + std::string(key) + "' has wrong type (expected string)");
    };
    auto get_int = [&](std::string_view key, int64_t& dst) {
        const auto it = v.find(std::string(key));
        if (it == v.end()) return;
        if (const auto* p = as_ptr<int64_t>(&it->second); p != nullptr) {
            dst = *p;
            return;
        }
        if (warnings != nullptr) warnings->push_back("config key '" + std::string(key) + "' has wrong type (expected int)");
    };
    auto get_bool = [&](std::string_view key, bool& dst) {
        const auto it = v.find(std::string(key));
        if (it == v.end()) return;
        if (const auto* p = as_ptr<bool>(&it->second); p != nullptr) {
            dst = *p;
            return;
        }
        if (warnings != nullptr) warnings->push_back("config key '" + std::string(key) + "' has wrong type (expected bool)");
    };

    get_int("core.config_version", s.core_config_version);

    get_string("diag.lang", s.diag_lang);
    get_string("diag.format", s.diag_format);
    get_int("diag.context", s.diag_context);

    get_bool("validate.strict", s.validate_strict);

    get_string("tasks.status_file", s.tasks_status_file);

    get_bool("merge.collapse_blank_lines", s.merge_collapse_blank_lines);

    // 환경 변수가 파일 설정보다 우선
    apply_env_string(s.diag_lang, "SPECDOC_DIAG_LANG");
    apply_env_int(s.diag_context, "SPECDOC_DIAG_CONTEXT", warnings);

    s.diag_lang = normalize_lang(s.diag_lang);
    s.diag_format = normalize_diag_format(s.diag_format);
    if (s.diag_context < 0) s.diag_context = 2;
    if (s.tasks_status_file.empty()) s.tasks_status_file = "tasks.jsonc";

    return s;
}

FlatMap settings_to_map(const EffectiveSettings& s) {
    FlatMap m{};
    m["core.config_version"] = s.core_config_version;
    m["diag.lang"] = s.diag_lang;
    m["diag.format"] = s.diag_format;
    m["diag.context"] = s.diag_context;
    m["validate.strict"] = s.validate_strict;
    m["tasks.status_file"] = s.tasks_status_file;
    m["merge.collapse_blank_lines"] = s.merge_collapse_blank_lines;
    return m;
}

std::string render_value_toml(const Value& v) {
    if (const auto* p = as_ptr<std::string>(&v); p != nullptr) {
        return "\"" + toml_escape(*p) + "\"";
    }
    if (const auto* p = as_ptr<int64_t>(&v); p != nullptr) {
        return std::to_string(*p);
    }
    const auto* p = as_ptr<bool>(&v);
    return (p != nullptr && *p) ? "true" : "false";
}

std::string render_value_json(const Value& v) {
    if (const auto* p = as_ptr<std::string>(&v); p != nullptr) {
        return "\"" + specdoc::json::escape(*p) + "\"";
    }
    if (const auto* p = as_ptr<int64_t>(&v); p != nullptr) {
        return std::to_string(*p);
    }
    const auto* p = as_ptr<bool>(&v);
    return (p != nullptr && *p) ? "true" : "false";
}

std::string render_toml(const FlatMap& values) {
    std::map<std::string, std::map<std::string, Value>> groups{};
    for (const auto& [key, val] : values) {
        groups[section_of(key)][leaf_of(key)] = val;
    }

    std::ostringstream oss;
    bool first_group = true;
    for (const auto& [section, kv] : groups) {
        if (!first_group) oss << "\n";
        first_group = false;
        if (!section.empty()) {
            oss << "[" << section << "]\n";
        }
        for (const auto& [leaf, val] : kv) {
            oss << leaf << " = " << render_value_toml(val) << "\n";
        }
    }
    return oss.str();
}

std::string render_json(const FlatMap& values) {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [key, val] : values) {
        if (!first) oss << ",";
        first = false;
        oss << "\"" << specdoc::json::escape(key) << "\":" << render_value_json(val);
    }
    oss << "}";
    return oss.str();
}

} // namespace specdoc_tool::config
