// tools/specdoc/src/main.cpp
#include <specdoc_tool/cli/Options.hpp>
#include <specdoc_tool/config/Config.hpp>
#include <specdoc_tool/driver/Runner.hpp>
#include <specdoc/Version.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>


namespace {

    /// @brief 입력 파일이 있으면 그 디렉터리에서, 없으면 현재 디렉터리에서 프로젝트 설정을 찾는다.
    std::optional<std::filesystem::path> config_anchor(const specdoc_tool::cli::Options& opt) {
        std::error_code ec;
        if (!opt.input.empty()) {
            auto p = std::filesystem::absolute(std::filesystem::path(opt.input), ec);
            if (!ec) return p.parent_path();
        }
        auto cwd = std::filesystem::current_path(ec);
        if (ec) return std::nullopt;
        return cwd;
    }

} // namespace

int main(int argc, char** argv) {
    namespace cli = specdoc_tool::cli;
    namespace config = specdoc_tool::config;

    if (argc <= 1) {
        std::cout << specdoc::k_version_string << "\n";
        cli::print_usage(std::cout);
        return 0;
    }

    const auto opt = cli::parse_options(argc, argv);

    if (!opt.ok) {
        std::cerr << "error: " << opt.error << "\n";
        cli::print_usage(std::cerr);
        return specdoc_tool::driver::k_exit_usage;
    }

    if (opt.mode == cli::Mode::kVersion) {
        std::cout << specdoc::k_version_string << "\n";
        return 0;
    }

    if (opt.mode == cli::Mode::kUsage) {
        cli::print_usage(std::cout);
        return 0;
    }

    const auto loaded = config::load(config_anchor(opt));
    std::vector<std::string> warnings = loaded.warnings;
    const auto settings = config::materialize(loaded, &warnings);
    for (const auto& w : warnings) {
        std::cerr << "warning: " << w << "\n";
    }

    return specdoc_tool::driver::run(opt, settings);
}
