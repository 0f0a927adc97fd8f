#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace specdoc_tool::config {

using Value = std::variant<std::string, int64_t, bool>;
using FlatMap = std::map<std::string, Value>;

enum class OutputFormat : uint8_t {
    kToml,
    kJson,
};

struct Paths {
    std::filesystem::path global_config{};
    std::filesystem::path project_config{};
    std::optional<std::filesystem::path> project_root{};
};

struct LoadedConfig {
    Paths paths{};
    FlatMap global_values{};
    FlatMap project_values{};
    FlatMap effective_values{};
    std::vector<std::string> warnings{};
};

struct EffectiveSettings {
    int64_t core_config_version = 1;

    std::string diag_lang = "auto";
    std::string diag_format = "text";
    int64_t diag_context = 2;

    bool validate_strict = true;

    std::string tasks_status_file = "tasks.jsonc";

    bool merge_collapse_blank_lines = true;
};

/// `.specdoc/` 또는 `.git` 을 가진 가장 가까운 상위 디렉터리
std::optional<std::filesystem::path> find_project_root(std::filesystem::path start);
Paths resolve_paths(const std::optional<std::filesystem::path>& anchor);

LoadedConfig load(const std::optional<std::filesystem::path>& anchor);
EffectiveSettings materialize(const LoadedConfig& cfg, std::vector<std::string>* warnings = nullptr);

bool is_known_key(std::string_view key);

/// 알 수 없는 key 를 경고와 함께 지운다
void filter_unknown_keys(FlatMap& values, std::vector<std::string>& warnings, std::string_view source_name);

/// 설정 값을 모두 평탄한 map 으로 (config-show 용)
FlatMap settings_to_map(const EffectiveSettings& s);

std::string render_toml(const FlatMap& values);
std::string render_json(const FlatMap& values);
std::string render_value_toml(const Value& v);
std::string render_value_json(const Value& v);

} // namespace specdoc_tool::config
