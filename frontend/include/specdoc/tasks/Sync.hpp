// frontend/include/specdoc/tasks/Sync.hpp
#pragma once
#include <specdoc/tasks/TaskStore.hpp>
#include <specdoc/doc/Document.hpp>

#include <string>
#include <vector>


namespace specdoc::tasks {

    struct SyncResult {
        Document document;
        uint32_t updated = 0;

        // store 에는 있지만 문서에 없는 id
        std::vector<std::string> missing;
    };

    /// @brief store 의 상태를 checkbox 에 반영한다 (completed = checked).
    ///        바뀐 task 마다 출력에서 mark 1바이트만 달라진다.
    SyncResult sync_tasks(const Document& doc, const TaskStore& store);

} // namespace specdoc::tasks
