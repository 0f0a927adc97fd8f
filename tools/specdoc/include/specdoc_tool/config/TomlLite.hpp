#pragma once

#include <specdoc_tool/config/Config.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace specdoc_tool::config::toml_lite {

/// `[section]` 과 `key = value` (string/int/bool) 만 지원한다.
bool parse_text(std::string_view text,
                std::string_view source_name,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err);

/// 파일이 없으면 빈 map 으로 성공
bool parse_file(const std::filesystem::path& path,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err);

} // namespace specdoc_tool::config::toml_lite
