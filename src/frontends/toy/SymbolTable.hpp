//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/toy/SymbolTable.hpp
// Purpose: Declares the lexicographically ordered symbol table backing the PIF.
// Key invariants: Binary search tree order under byte comparison; keys are unique.
// Ownership/Lifetime: The table owns every node; NodeIds are arena indices valid
//                     for the table's lifetime.
// Links: docs/toy-language.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexis::frontends::toy
{

/// @brief Stable identity of a symbol table node (index into the node arena).
using NodeId = uint32_t;

/// @brief Sentinel for an absent child or an unassigned identity.
inline constexpr NodeId kNoNode = std::numeric_limits<NodeId>::max();

/// @brief Unbalanced binary search tree keyed by lexeme.
/// @details Nodes live in a contiguous arena and reference their children by
///          NodeId, so identities survive arena growth.  Each node caches the
///          size of its subtree, which lets rank() answer in O(height) rather
///          than walking the tree.  Sorted insertion orders degrade the tree to
///          a list; every traversal is iterative so such inputs never recurse
///          to depth n.
/// @invariant For every node, keys in the left subtree compare less and keys
///            in the right subtree compare greater than the node's key.
class SymbolTable
{
  public:
    /// @brief Insert @p key unless it is already present.
    /// @return Identity of the node holding @p key (existing or new).
    NodeId insert(std::string_view key);

    /// @brief Locate @p key.
    [[nodiscard]] std::optional<NodeId> find(std::string_view key) const;

    /// @brief Zero-based position of @p key in the current in-order traversal.
    /// @details Later insertions of smaller keys shift the rank of existing keys.
    /// @return The rank, or std::nullopt when @p key is absent.
    [[nodiscard]] std::optional<std::size_t> rank(std::string_view key) const;

    /// @brief All keys in ascending order.
    [[nodiscard]] std::vector<std::string> inOrderKeys() const;

    /// @brief Rank of every node, indexed by NodeId, from one in-order traversal.
    [[nodiscard]] std::vector<std::size_t> ranks() const;

    /// @brief Key stored at node @p id.
    /// @pre @p id was returned by insert() or find() on this table.
    [[nodiscard]] const std::string &key(NodeId id) const;

    /// @brief Number of edges on the longest root-to-leaf path plus one; 0 when empty.
    [[nodiscard]] std::size_t height() const;

    /// @brief Number of distinct keys.
    [[nodiscard]] std::size_t size() const noexcept
    {
        return nodes_.size();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return nodes_.empty();
    }

  private:
    struct Node
    {
        std::string key;
        NodeId left{kNoNode};
        NodeId right{kNoNode};
        std::size_t subtreeSize{1};
    };

    [[nodiscard]] std::size_t subtreeSize(NodeId id) const
    {
        return id == kNoNode ? 0 : nodes_[id].subtreeSize;
    }

    /// @brief Visit node ids in ascending key order.
    template <typename Visitor> void forEachInOrder(Visitor &&visit) const;

    std::vector<Node> nodes_;
    NodeId root_{kNoNode};
};

} // namespace lexis::frontends::toy
