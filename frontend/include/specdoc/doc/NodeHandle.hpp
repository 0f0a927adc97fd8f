// frontend/include/specdoc/doc/NodeHandle.hpp
#pragma once
#include <specdoc/ast/Nodes.hpp>

#include <cstdint>


namespace specdoc {

    /// @brief 문서 세대(generation) 에 묶인 노드 참조.
    ///        full parse 는 새 세대를 만들고, incremental update 는 세대를 유지한다.
    struct NodeHandle {
        ast::NodeId id = ast::k_invalid_node;
        uint64_t generation = 0;
    };

    inline bool operator==(const NodeHandle& a, const NodeHandle& b) {
        return a.id == b.id && a.generation == b.generation;
    }

} // namespace specdoc
