// frontend/src/tasks/tasks.cpp
#include <specdoc/tasks/Tasks.hpp>


namespace specdoc::tasks {

    using ast::NodeId;
    using ast::NodeKind;

    namespace {

        bool is_digit_(char c) { return c >= '0' && c <= '9'; }

        /// @brief "N. Name" 이면 N
        bool split_numbered_(std::string_view text, uint32_t& num, std::string_view& name) {
            size_t i = 0;
            uint32_t n = 0;
            while (i < text.size() && is_digit_(text[i]) && i < 9) n = n * 10 + static_cast<uint32_t>(text[i++] - '0');
            if (i == 0 || i >= text.size() || text[i] != '.') return false;
            ++i;

            const size_t ws = i;
            while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) ++i;
            if (i == ws || i >= text.size()) return false;

            num = n;
            name = text.substr(i);
            return true;
        }

        class Collector {
        public:
            explicit Collector(const Document& doc) : doc_(doc) {}

            TaskList run() {
                const NodeId root = doc_.root();
                if (root == ast::k_invalid_node) return std::move(out_);

                for (const NodeId c : doc_.children(root)) {
                    const ast::Node& n = doc_.node(c);
                    if (n.kind == NodeKind::kHeader && n.level == 2) {
                        open_section_(doc_.slice(n.text));
                        continue;
                    }
                    if (n.kind == NodeKind::kList) walk_list_(c, -1, 0);
                }
                return std::move(out_);
            }

        private:
            void open_section_(std::string_view text) {
                TaskSection s;
                std::string_view name;
                if (split_numbered_(text, s.number, name)) {
                    s.name = std::string(name);
                } else {
                    s.number = ++auto_section_;
                    s.name = std::string(text);
                }
                out_.sections.push_back(std::move(s));
                counter_ = 0;
            }

            std::string auto_id_() {
                ++counter_;
                const uint32_t sec = out_.sections.empty() ? 0 : out_.sections.back().number;
                if (sec == 0) return std::to_string(counter_);
                return std::to_string(sec) + "." + std::to_string(counter_);
            }

            // 중첩 목록은 항목 바로 뒤에, 문서 순서대로
            void walk_list_(NodeId list, int32_t parent, uint32_t depth) {
                struct Frame {
                    NodeId list;
                    size_t next;
                    int32_t parent;
                    uint32_t depth;
                };
                std::vector<Frame> stack{{list, 0, parent, depth}};

                while (!stack.empty()) {
                    Frame& f = stack.back();
                    const auto items = doc_.children(f.list);
                    if (f.next == items.size()) {
                        stack.pop_back();
                        continue;
                    }

                    const NodeId item = items[f.next++];
                    const ast::Node& n = doc_.node(item);
                    int32_t next_parent = f.parent;
                    uint32_t next_depth = f.depth;

                    if (n.kind == NodeKind::kTaskItem) {
                        next_parent = add_task_(item, n, f.parent, f.depth);
                        next_depth = f.depth + 1;
                    }

                    const auto kids = doc_.children(item);
                    for (size_t i = kids.size(); i-- > 0;) {
                        if (doc_.node(kids[i]).kind == NodeKind::kList) {
                            stack.push_back({kids[i], 0, next_parent, next_depth});
                        }
                    }
                }
            }

            int32_t add_task_(NodeId id, const ast::Node& n, int32_t parent, uint32_t depth) {
                TaskEntry t;
                t.explicit_id = n.has_id;
                t.id = n.has_id ? std::string(doc_.slice(n.aux)) : auto_id_();
                t.section = static_cast<uint32_t>(out_.sections.size());
                t.description = std::string(doc_.slice(n.text));
                t.checked = n.checked;
                t.node = id;
                t.handle = doc_.handle(id);
                t.line = doc_.line_col(n.span.lo).line;
                t.parent = parent;
                t.depth = depth;

                out_.tasks.push_back(std::move(t));
                return static_cast<int32_t>(out_.tasks.size() - 1);
            }

            const Document& doc_;
            TaskList out_;
            uint32_t auto_section_ = 0;
            uint32_t counter_ = 0;
        };

    } // namespace

    TaskList collect_tasks(const Document& doc) {
        return Collector(doc).run();
    }

} // namespace specdoc::tasks
