// tools/specdoc/include/specdoc_tool/driver/Runner.hpp
#pragma once

#include <specdoc_tool/cli/Options.hpp>
#include <specdoc_tool/config/Config.hpp>


namespace specdoc_tool::driver {

    inline constexpr int k_exit_ok = 0;
    inline constexpr int k_exit_diag = 1;    // 오류 진단이 있다
    inline constexpr int k_exit_usage = 2;   // 잘못된 인자 또는 입출력 실패

    /// @brief 선택된 모드를 실행하고 종료 코드를 반환한다.
    ///        진단은 stderr, 결과는 stdout (또는 `-o` 파일) 로 나간다.
    int run(const cli::Options& opt, const config::EffectiveSettings& settings);

} // namespace specdoc_tool::driver
