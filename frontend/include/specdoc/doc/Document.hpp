// frontend/include/specdoc/doc/Document.hpp
#pragma once
#include <specdoc/ast/Nodes.hpp>
#include <specdoc/ast/Visitor.hpp>
#include <specdoc/diag/Diagnostic.hpp>
#include <specdoc/doc/NodeHandle.hpp>
#include <specdoc/parse/IncrementalParse.hpp>
#include <specdoc/query/Query.hpp>
#include <specdoc/text/LineIndex.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


namespace specdoc {

    /// @brief 교체할 바이트 구간 [lo, hi) (이전 문서 기준)
    struct EditRange {
        uint32_t lo = 0;
        uint32_t hi = 0;
    };

    class Document;

    /// @brief `parse(text)`. 실패는 잘못된 UTF-8 (kInvalidUtf8, fatal) 뿐이다.
    std::optional<Document> parse(std::string text, diag::Bag& bag, uint32_t file_id = 0);

    /// @brief prev.print() 의 edit 구간을 new_text 로 바꾼 문서.
    ///        영향받은 최상위 block 구간만 다시 파싱하고 나머지 서브트리(와 NodeId)는 재사용한다.
    ///        결과는 full parse 와 구조적으로 같다.
    std::optional<Document> incremental_update(const Document& prev,
                                               EditRange edit,
                                               std::string_view new_text,
                                               diag::Bag& bag,
                                               IncrementalStats* stats = nullptr);

    /// @brief 노드 kind, 순서, 필드, 내용 비교 (NodeId 는 비교하지 않음)
    bool structurally_equal(const Document& a, const Document& b);

    struct TaskCheckEdit {
        ast::NodeId id = ast::k_invalid_node;
        bool checked = false;
    };

    /// @brief 파싱된 문서. 불변이며 복사는 저장소를 공유한다.
    ///        편집은 항상 새 Document 를 만든다.
    class Document {
    public:
        Document() = default;

        const std::string& text() const { return *text_; }
        uint32_t size() const { return static_cast<uint32_t>(text_->size()); }
        uint32_t file_id() const { return file_id_; }
        uint64_t generation() const { return generation_; }

        ast::NodeId root() const { return root_; }
        const ast::NodeArena& arena() const { return *arena_; }
        const ast::Node& node(ast::NodeId id) const { return arena_->node(id); }
        std::span<const ast::NodeId> children(ast::NodeId id) const { return arena_->children(id); }

        /// @brief 원문 구간
        std::string_view slice(Span sp) const;

        NodeHandle handle(ast::NodeId id) const { return NodeHandle{id, generation_}; }

        /// @brief 이 문서 세대의 유효한 handle 인지
        bool owns(const NodeHandle& h) const {
            return h.generation == generation_ && h.id != ast::k_invalid_node && arena_->valid(h.id);
        }

        const LineIndex& lines() const { return *lines_; }
        LineCol line_col(uint32_t offset) const { return lines_->offset_to_line_col(offset); }

        // --------------------
        // printer
        // --------------------

        /// @brief 전체 문서. 수정되지 않은 노드는 원문 그대로, checkbox 가 바뀐 task 는 그 1바이트만 바뀐다.
        std::string print() const;
        std::string print_node(ast::NodeId id) const;
        /// @brief print() 결과의 [lo, hi) 구간 (오프셋은 원문 기준)
        std::string print_range(uint32_t lo, uint32_t hi) const;

        /// @brief 수정된 checkbox: (mark 바이트 오프셋, 새 문자). 오프셋 오름차순.
        const std::vector<std::pair<uint32_t, char>>& patches() const { return patches_; }

        // --------------------
        // traversal
        // --------------------
        void visit(ast::Visitor& v) const { ast::walk(*arena_, root_, v); }

        /// @brief 선택자 문법 오류는 bag 에 보고하고 nullopt.
        ///        결과는 이 Document 의 저장소를 공유한다.
        std::optional<query::Matches> query(std::string_view selector, diag::Bag& bag) const;

        // --------------------
        // edits
        // --------------------

        /// @brief TaskItem 의 checked 를 바꾼 새 Document. TaskItem 이 아닌 id 는 무시한다.
        Document with_task_checked(const std::vector<TaskCheckEdit>& edits) const;

    private:
        friend std::optional<Document> parse(std::string text, diag::Bag& bag, uint32_t file_id);
        friend std::optional<Document> incremental_update(const Document& prev,
                                                          EditRange edit,
                                                          std::string_view new_text,
                                                          diag::Bag& bag,
                                                          IncrementalStats* stats);

        void rebuild_patches_();
        /// @brief full parse 마다 새 세대. 이전 세대의 NodeId 는 새 arena 에서 무효다.
        static uint64_t next_generation_();

        std::shared_ptr<const std::string> text_ = std::make_shared<const std::string>();
        std::shared_ptr<const LineIndex> lines_ = std::make_shared<const LineIndex>();
        std::shared_ptr<const ast::NodeArena> arena_ = std::make_shared<const ast::NodeArena>();
        ast::NodeId root_ = ast::k_invalid_node;
        uint64_t generation_ = 0;
        uint32_t file_id_ = 0;
        std::vector<std::pair<uint32_t, char>> patches_{};
    };

} // namespace specdoc
