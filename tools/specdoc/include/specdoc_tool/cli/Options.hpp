// tools/specdoc/include/specdoc_tool/cli/Options.hpp
#pragma once

#include <specdoc_tool/config/Config.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>


namespace specdoc_tool::cli {

    enum class Mode : uint8_t {
        kUsage,
        kVersion,
        kTokens,
        kAst,
        kPrint,
        kQuery,
        kRequirements,
        kDelta,
        kValidate,
        kTasks,
        kSync,
        kMerge,
        kConfigShow,
    };

    struct Options {
        Mode mode = Mode::kUsage;

        // 주 입력 파일 (merge 에서는 base spec)
        std::string input{};
        // --query 선택자
        std::string selector{};
        // --merge 의 delta 파일
        std::string delta{};

        bool check = false;
        bool json = false;
        std::optional<bool> strict{};

        std::string change_id{};
        std::string status_path{};
        std::string capability{};
        std::optional<std::string> out_path{};

        config::OutputFormat format = config::OutputFormat::kToml;

        // 지정되지 않으면 설정 파일 값을 쓴다
        std::optional<std::string> lang{};
        std::optional<uint32_t> context_lines{};
        bool verbose = false;

        bool ok = true;
        std::string error{};
    };

    /// @brief `specdoc` CLI 사용법을 출력한다.
    void print_usage(std::ostream& os);

    /// @brief CLI 인자를 파싱해 실행 옵션 구조체로 변환한다.
    Options parse_options(int argc, char** argv);

    /// @brief 모드 플래그 이름 (`--tokens` 등). kUsage/kVersion 은 빈 문자열.
    std::string_view mode_flag(Mode m);

} // namespace specdoc_tool::cli
