// frontend/include/specdoc/tasks/TaskLine.hpp
#pragma once
#include <optional>
#include <string>
#include <string_view>


namespace specdoc::tasks {

    struct TaskLine {
        std::optional<std::string> id;   // 끝의 '.' 는 뺀다
        bool checked = false;
        std::string description;
    };

    /// @brief `- [ ] 1.2 desc` 한 줄. 구분자 사이 공백은 0개 이상이다.
    ///        task 가 아니거나 UTF-8 이 잘못되면 nullopt.
    std::optional<TaskLine> match_task_line(std::string_view line);

} // namespace specdoc::tasks
