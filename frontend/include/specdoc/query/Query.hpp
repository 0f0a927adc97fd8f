// frontend/include/specdoc/query/Query.hpp
#pragma once
#include <specdoc/doc/NodeHandle.hpp>
#include <specdoc/query/Selector.hpp>

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>


namespace specdoc {
    class Document;
}

namespace specdoc::query {

    /// @brief 문서 순서(pre-order) + 논리적 부모.
    ///        최상위 block 은 section header 아래로 들어간다:
    ///        header(level L) 의 부모는 앞쪽의 가장 가까운 level < L header,
    ///        그 외 최상위 block 의 부모는 앞쪽의 가장 가까운 header. 없으면 document.
    struct TreeIndex {
        std::vector<ast::NodeId> order{};
        std::vector<ast::NodeId> parent{};   // NodeId 로 인덱싱. 도달 불가 노드는 k_invalid_node
    };

    TreeIndex build_tree_index(const Document& doc);

    /// @brief 노드의 속성값. 해당 없는 속성은 nullopt.
    std::optional<std::string> attr_value(const Document& doc, ast::NodeId id, Attr a);

    bool matches_node(const Document& doc, const TreeIndex& index, const Selector& sel, ast::NodeId id);

    /// @brief 지연 평가되는 매치 결과. begin() 을 다시 부르면 처음부터 다시 돈다.
    ///        Document 사본(공유 저장소)을 들고 있으므로 원래 Document 보다 오래 살아도 된다.
    class Matches {
    public:
        class iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = NodeHandle;
            using difference_type = std::ptrdiff_t;
            using pointer = const NodeHandle*;
            using reference = const NodeHandle&;

            iterator() = default;

            reference operator*() const { return current_; }
            pointer operator->() const { return &current_; }

            iterator& operator++() {
                ++pos_;
                seek_();
                return *this;
            }

            iterator operator++(int) {
                iterator tmp = *this;
                ++(*this);
                return tmp;
            }

            friend bool operator==(const iterator& a, const iterator& b) { return a.pos_ == b.pos_; }
            friend bool operator!=(const iterator& a, const iterator& b) { return a.pos_ != b.pos_; }

        private:
            friend class Matches;
            iterator(const Matches* owner, size_t pos) : owner_(owner), pos_(pos) { seek_(); }

            void seek_();

            const Matches* owner_ = nullptr;
            size_t pos_ = 0;
            NodeHandle current_{};
        };

        Matches(const Document& doc, Selector sel);

        iterator begin() const { return iterator(this, 0); }
        iterator end() const { return iterator(this, index_->order.size()); }

        std::vector<NodeHandle> collect() const;
        size_t count() const;
        bool empty() const { return begin() == end(); }

        const Selector& selector() const { return sel_; }

    private:
        std::shared_ptr<const Document> doc_{};
        std::shared_ptr<const TreeIndex> index_{};
        Selector sel_{};
    };

    /// @brief compile_selector + Matches
    std::optional<Matches> run_query(const Document& doc, std::string_view selector, diag::Bag& bag);

} // namespace specdoc::query
