#include <specdoc/doc/Document.hpp>
#include <specdoc/print/Printer.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

    using specdoc::ast::NodeId;
    using specdoc::ast::NodeKind;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static std::optional<specdoc::Document> parse_(std::string src) {
        specdoc::diag::Bag bag;
        auto doc = specdoc::parse(std::move(src), bag);
        if (!doc || bag.has_error()) return std::nullopt;
        return doc;
    }

    class TaskCollector final : public specdoc::ast::Visitor {
    public:
        specdoc::ast::VisitAction visit_task_item(NodeId id, const specdoc::ast::Node&) override {
            ids.push_back(id);
            return specdoc::ast::VisitAction::kContinue;
        }

        std::vector<NodeId> ids;
    };

    static std::vector<NodeId> tasks_(const specdoc::Document& doc) {
        TaskCollector c;
        doc.visit(c);
        return c.ids;
    }

    static size_t diff_bytes_(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) return static_cast<size_t>(-1);
        size_t n = 0;
        for (size_t i = 0; i < a.size(); ++i) {
            if (a[i] != b[i]) ++n;
        }
        return n;
    }

    static const std::string kTasksDoc =
        "# Tasks   \n"
        "\n"
        "- [ ]  1.1  Spaced   *task*  \n"
        "- [x] 1.2 Done\r\n"
        "  - [ ] 1.2.1 Nested\n"
        "\n"
        "trailing paragraph without newline";

    static bool test_checkbox_flip_is_one_byte_() {
        const auto doc = parse_(kTasksDoc);
        if (!require_(doc.has_value(), "parse must succeed")) return false;

        const auto ids = tasks_(*doc);
        if (!require_(ids.size() == 3, "three tasks")) return false;

        bool ok = true;
        const auto next = doc->with_task_checked({{ids[0], true}});
        const std::string printed = next.print();

        ok &= require_(diff_bytes_(printed, kTasksDoc) == 1, "exactly one byte differs");
        const uint32_t mark = doc->node(ids[0]).mark_off;
        ok &= require_(printed[mark] == 'x', "the checkbox mark is now 'x'");
        ok &= require_(next.patches().size() == 1 && next.patches()[0].first == mark, "one patch at the mark");

        // 원본 문서는 그대로다
        ok &= require_(doc->print() == kTasksDoc, "source document is unchanged");
        ok &= require_(doc->patches().empty(), "source document has no patches");
        return ok;
    }

    static bool test_uncheck_uses_space_() {
        const auto doc = parse_(kTasksDoc);
        if (!require_(doc.has_value(), "parse must succeed")) return false;
        const auto ids = tasks_(*doc);
        if (!require_(ids.size() == 3, "three tasks")) return false;

        bool ok = true;
        const auto next = doc->with_task_checked({{ids[1], false}});
        const std::string printed = next.print();
        ok &= require_(diff_bytes_(printed, kTasksDoc) == 1, "exactly one byte differs");
        ok &= require_(printed.find("- [ ] 1.2 Done\r\n") != std::string::npos, "unchecked mark is a space, CRLF kept");
        ok &= require_(next.print_node(ids[1]).rfind("- [ ] 1.2 Done\r\n", 0) == 0, "print_node sees the patch");
        return ok;
    }

    static bool test_flip_back_restores_source_() {
        const auto doc = parse_(kTasksDoc);
        if (!require_(doc.has_value(), "parse must succeed")) return false;
        const auto ids = tasks_(*doc);
        if (!require_(ids.size() == 3, "three tasks")) return false;

        const auto flipped = doc->with_task_checked({{ids[2], true}});
        const auto back = flipped.with_task_checked({{ids[2], false}});

        bool ok = true;
        ok &= require_(back.patches().empty(), "restoring the source state drops the patch");
        ok &= require_(back.print() == kTasksDoc, "output equals the source again");
        return ok;
    }

    static bool test_non_task_edits_ignored_() {
        const auto doc = parse_(kTasksDoc);
        if (!require_(doc.has_value(), "parse must succeed")) return false;

        const NodeId header = doc->children(doc->root())[0];
        const auto next = doc->with_task_checked({{header, true}, {specdoc::ast::k_invalid_node, true}});

        bool ok = true;
        ok &= require_(next.patches().empty(), "non-task ids are ignored");
        ok &= require_(next.print() == kTasksDoc, "output unchanged");
        return ok;
    }

    static bool test_print_range_() {
        const auto doc = parse_(kTasksDoc);
        if (!require_(doc.has_value(), "parse must succeed")) return false;
        const auto ids = tasks_(*doc);
        if (!require_(ids.size() == 3, "three tasks")) return false;

        bool ok = true;
        const std::string full = doc->print();
        ok &= require_(doc->print_range(0, doc->size()) == full, "full range equals print()");
        ok &= require_(doc->print_range(2, 7) == full.substr(2, 5), "range cuts through leaves");
        ok &= require_(doc->print_range(5, 5).empty(), "empty range");

        const auto next = doc->with_task_checked({{ids[0], true}});
        const uint32_t mark = doc->node(ids[0]).mark_off;
        ok &= require_(next.print_range(mark, mark + 1) == "x", "range covering only the mark sees the patch");
        return ok;
    }

    static bool test_plain_text_and_summary_() {
        const auto doc = parse_(kTasksDoc);
        if (!require_(doc.has_value(), "parse must succeed")) return false;
        const auto ids = tasks_(*doc);
        if (!require_(ids.size() == 3, "three tasks")) return false;

        bool ok = true;
        ok &= require_(specdoc::print::plain_text(*doc, ids[0]) == "Spaced   task", "plain text drops emphasis markers");

        const std::string summary = specdoc::print::node_summary(*doc, ids[1]);
        ok &= require_(summary == "TaskItem [x] id=1.2 \"Done\"", "task summary");

        const std::string header = specdoc::print::node_summary(*doc, doc->children(doc->root())[0]);
        ok &= require_(header == "Header(h1) \"Tasks\"", "header summary");

        const std::string tree = specdoc::print::dump_tree(*doc);
        ok &= require_(tree.rfind("Document [0, ", 0) == 0, "dump starts at the document");
        ok &= require_(tree.find("\n  Header(h1) \"Tasks\" [0, 11)\n") != std::string::npos, "header line in dump");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"checkbox_flip_is_one_byte", test_checkbox_flip_is_one_byte_},
        {"uncheck_uses_space", test_uncheck_uses_space_},
        {"flip_back_restores_source", test_flip_back_restores_source_},
        {"non_task_edits_ignored", test_non_task_edits_ignored_},
        {"print_range", test_print_range_},
        {"plain_text_and_summary", test_plain_text_and_summary_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
