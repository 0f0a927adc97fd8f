// frontend/src/tasks/sync.cpp
#include <specdoc/tasks/Sync.hpp>

#include <unordered_set>


namespace specdoc::tasks {

    SyncResult sync_tasks(const Document& doc, const TaskStore& store) {
        const TaskList list = collect_tasks(doc);

        std::vector<TaskCheckEdit> edits;
        std::unordered_set<std::string> seen;
        for (const auto& t : list.tasks) {
            seen.insert(t.id);

            const StoredTask* st = store.find(t.id);
            if (st == nullptr) continue;

            const bool want = (st->status == TaskStatus::kCompleted);
            if (want != t.checked) edits.push_back(TaskCheckEdit{t.node, want});
        }

        SyncResult res{doc.with_task_checked(edits), static_cast<uint32_t>(edits.size()), {}};
        for (const auto& st : store.tasks) {
            if (seen.count(st.id) == 0) res.missing.push_back(st.id);
        }
        return res;
    }

} // namespace specdoc::tasks
