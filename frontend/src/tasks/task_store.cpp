// frontend/src/tasks/task_store.cpp
#include <specdoc/tasks/TaskStore.hpp>
#include <specdoc/json/Json.hpp>

#include <sstream>


namespace specdoc::tasks {

    namespace {

        void schema_error_(diag::Bag& bag, uint32_t file_id, std::string_view detail) {
            diag::Diagnostic d(diag::Severity::kError, diag::Code::kTaskStoreSchema, Span{file_id, 0, 0});
            d.add_arg(detail);
            bag.add(std::move(d));
        }

        std::string opt_string_(const json::Value& obj, std::string_view key) {
            const auto s = json::as_string(json::get(obj, key));
            return s ? std::string(*s) : std::string{};
        }

    } // namespace

    std::string_view task_status_name(TaskStatus s) {
        switch (s) {
            case TaskStatus::kPending: return "pending";
            case TaskStatus::kInProgress: return "in_progress";
            case TaskStatus::kCompleted: return "completed";
        }
        return "pending";
    }

    std::optional<TaskStatus> parse_task_status(std::string_view s) {
        if (s == "pending") return TaskStatus::kPending;
        if (s == "in_progress") return TaskStatus::kInProgress;
        if (s == "completed") return TaskStatus::kCompleted;
        return std::nullopt;
    }

    std::optional<TaskStore> read_task_store(std::string_view text, diag::Bag& bag, uint32_t file_id) {
        json::Value root;
        json::Parser p(text);
        if (!p.parse(root)) {
            const uint32_t at = p.error_offset();
            bag.add(diag::Diagnostic(diag::Severity::kError, diag::Code::kTaskStoreSyntax, Span{file_id, at, at + 1}));
            return std::nullopt;
        }

        if (root.kind != json::Value::Kind::kObject) {
            schema_error_(bag, file_id, "top-level value must be an object");
            return std::nullopt;
        }

        TaskStore store;
        const auto ver = json::as_i64(json::get(root, "version"));
        if (!ver || *ver != k_task_store_version) {
            schema_error_(bag, file_id, "\"version\" must be 1");
            return std::nullopt;
        }
        store.version = *ver;
        store.change_id = opt_string_(root, "changeId");

        const json::Value* arr = json::get(root, "tasks");
        if (arr == nullptr || arr->kind != json::Value::Kind::kArray) {
            schema_error_(bag, file_id, "\"tasks\" must be an array");
            return std::nullopt;
        }

        const uint32_t before = bag.issue_count();
        for (const auto& e : arr->array_v) {
            const auto id = json::as_string(json::get(e, "id"));
            const auto status = json::as_string(json::get(e, "status"));
            if (!id || !status) {
                schema_error_(bag, file_id, "each task needs string \"id\" and \"status\"");
                continue;
            }

            const auto st = parse_task_status(*status);
            if (!st) {
                diag::Diagnostic d(diag::Severity::kError, diag::Code::kTaskUnknownStatus, Span{file_id, 0, 0});
                d.add_arg(*status);
                d.add_arg(*id);
                bag.add(std::move(d));
                continue;
            }

            StoredTask t;
            t.id = std::string(*id);
            t.section = opt_string_(e, "section");
            t.description = opt_string_(e, "description");
            t.status = *st;
            store.tasks.push_back(std::move(t));
        }

        if (bag.issue_count() != before) return std::nullopt;
        return store;
    }

    std::string render_task_store(const TaskList& list, std::string_view change_id) {
        std::ostringstream oss;
        oss << "// Task status for change '" << change_id << "'.\n";
        oss << "// Generated from tasks.md. Edit \"status\" (pending | in_progress | completed),\n";
        oss << "// then run `specdoc --sync` to update the checkboxes.\n";
        oss << "{\n";
        oss << "  \"version\": " << k_task_store_version << ",\n";
        oss << "  \"changeId\": \"" << json::escape(change_id) << "\",\n";
        oss << "  \"summary\": {\"total\": " << list.tasks.size() << ", \"completed\": " << list.completed() << "},\n";
        oss << "  \"tasks\": [";

        for (size_t i = 0; i < list.tasks.size(); ++i) {
            const TaskEntry& t = list.tasks[i];
            oss << (i == 0 ? "\n" : ",\n");
            oss << "    {\"id\": \"" << json::escape(t.id) << "\""
                << ", \"section\": \"" << json::escape(list.section_name(t)) << "\""
                << ", \"description\": \"" << json::escape(t.description) << "\""
                << ", \"status\": \"" << task_status_name(t.checked ? TaskStatus::kCompleted : TaskStatus::kPending)
                << "\"}";
        }

        if (!list.tasks.empty()) oss << "\n  ";
        oss << "]\n";
        oss << "}\n";
        return oss.str();
    }

} // namespace specdoc::tasks
