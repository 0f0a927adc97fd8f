// frontend/include/specdoc/tasks/TaskStore.hpp
#pragma once
#include <specdoc/tasks/Tasks.hpp>
#include <specdoc/diag/Diagnostic.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace specdoc::tasks {

    inline constexpr int64_t k_task_store_version = 1;

    enum class TaskStatus : uint8_t {
        kPending,
        kInProgress,
        kCompleted,
    };

    std::string_view task_status_name(TaskStatus s);
    std::optional<TaskStatus> parse_task_status(std::string_view s);

    struct StoredTask {
        std::string id;
        std::string section;
        std::string description;
        TaskStatus status = TaskStatus::kPending;
    };

    /// @brief tasks.jsonc
    struct TaskStore {
        int64_t version = k_task_store_version;
        std::string change_id;
        std::vector<StoredTask> tasks;

        const StoredTask* find(std::string_view id) const {
            for (const auto& t : tasks) {
                if (t.id == id) return &t;
            }
            return nullptr;
        }
    };

    /// @brief JSONC 로 읽는다. 주석과 trailing comma 허용.
    ///        문법 오류는 kTaskStoreSyntax, 형식 오류는 kTaskStoreSchema / kTaskUnknownStatus.
    std::optional<TaskStore> read_task_store(std::string_view text, diag::Bag& bag, uint32_t file_id = 0);

    /// @brief 머리 주석 + summary 가 붙은 tasks.jsonc 본문
    std::string render_task_store(const TaskList& list, std::string_view change_id);

} // namespace specdoc::tasks
