// frontend/include/specdoc/tasks/Tasks.hpp
#pragma once
#include <specdoc/doc/Document.hpp>

#include <cstdint>
#include <string>
#include <vector>


namespace specdoc::tasks {

    struct TaskSection {
        uint32_t number = 0;   // 0 = section 없음
        std::string name;
    };

    struct TaskEntry {
        std::string id;
        bool explicit_id = false;

        uint32_t section = 0;        // TaskList::sections index + 1, 0 = 없음
        std::string description;
        bool checked = false;

        ast::NodeId node = ast::k_invalid_node;
        NodeHandle handle{};
        uint32_t line = 0;           // 1-based

        int32_t parent = -1;         // 감싸는 task (TaskList::tasks index)
        uint32_t depth = 0;
    };

    struct TaskList {
        std::vector<TaskSection> sections;
        std::vector<TaskEntry> tasks;

        uint32_t completed() const {
            uint32_t n = 0;
            for (const auto& t : tasks) n += t.checked ? 1 : 0;
            return n;
        }

        /// @brief id 로 찾는다. 없으면 nullptr (중복이면 첫 번째)
        const TaskEntry* find(std::string_view id) const {
            for (const auto& t : tasks) {
                if (t.id == id) return &t;
            }
            return nullptr;
        }

        std::string_view section_name(const TaskEntry& t) const {
            if (t.section == 0 || t.section > sections.size()) return {};
            return sections[t.section - 1].name;
        }
    };

    /// @brief 문서 순서로 TaskItem 을 모은다.
    ///        `## N. Name` 은 section 번호 N, `## Name` 은 자동 증가 번호.
    ///        id 가 없으면 `<section>.<counter>` (section 이 없으면 `<counter>`).
    TaskList collect_tasks(const Document& doc);

} // namespace specdoc::tasks
