// frontend/include/specdoc/os/File.hpp
#pragma once
#include <string>
#include <string_view>


namespace specdoc {

    /// @brief 파일 내용을 그대로 읽는다 (바이너리 모드, 개행 변환 없음)
    bool open_file(const std::string& path, std::string& out_content, std::string& out_error);

    /// @brief 임시 파일에 쓴 뒤 rename 으로 교체한다
    bool write_file(const std::string& path, std::string_view content, std::string& out_error);

    /// @brief 입력 경로를 “표시용”으로 정규화
    /// @details 존재하는 경로면 절대경로, 아니면 입력 그대로
    std::string normalize_path(const std::string& path);

} // namespace specdoc
