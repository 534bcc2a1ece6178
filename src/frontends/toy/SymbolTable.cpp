//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/toy/SymbolTable.cpp
// Purpose: Implements the arena-backed binary search tree symbol table.
// Key invariants: subtreeSize of every node equals 1 + sizes of its children.
// Ownership/Lifetime: Nodes are owned by the arena vector and never removed.
// Links: docs/toy-language.md
//
//===----------------------------------------------------------------------===//

#include "frontends/toy/SymbolTable.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace lexis::frontends::toy
{

NodeId SymbolTable::insert(std::string_view key)
{
    if (auto existing = find(key))
        return *existing;

    if (nodes_.size() >= kNoNode)
        throw std::length_error("symbol table node arena exhausted");

    const auto id = static_cast<NodeId>(nodes_.size());
    nodes_.push_back(Node{std::string(key)});

    if (root_ == kNoNode)
    {
        root_ = id;
        return id;
    }

    // The key is known to be new, so every node on the descent path gains a
    // descendant.
    NodeId cur = root_;
    while (true)
    {
        Node &node = nodes_[cur];
        ++node.subtreeSize;
        NodeId &child = key < node.key ? node.left : node.right;
        if (child == kNoNode)
        {
            child = id;
            return id;
        }
        cur = child;
    }
}

std::optional<NodeId> SymbolTable::find(std::string_view key) const
{
    NodeId cur = root_;
    while (cur != kNoNode)
    {
        const Node &node = nodes_[cur];
        const int cmp = key.compare(node.key);
        if (cmp == 0)
            return cur;
        cur = cmp < 0 ? node.left : node.right;
    }
    return std::nullopt;
}

std::optional<std::size_t> SymbolTable::rank(std::string_view key) const
{
    std::size_t before = 0;
    NodeId cur = root_;
    while (cur != kNoNode)
    {
        const Node &node = nodes_[cur];
        const int cmp = key.compare(node.key);
        if (cmp == 0)
            return before + subtreeSize(node.left);
        if (cmp < 0)
        {
            cur = node.left;
        }
        else
        {
            before += subtreeSize(node.left) + 1;
            cur = node.right;
        }
    }
    return std::nullopt;
}

template <typename Visitor> void SymbolTable::forEachInOrder(Visitor &&visit) const
{
    std::vector<NodeId> stack;
    NodeId cur = root_;
    while (cur != kNoNode || !stack.empty())
    {
        while (cur != kNoNode)
        {
            stack.push_back(cur);
            cur = nodes_[cur].left;
        }
        cur = stack.back();
        stack.pop_back();
        visit(cur);
        cur = nodes_[cur].right;
    }
}

std::vector<std::string> SymbolTable::inOrderKeys() const
{
    std::vector<std::string> keys;
    keys.reserve(nodes_.size());
    forEachInOrder([&](NodeId id) { keys.push_back(nodes_[id].key); });
    return keys;
}

std::vector<std::size_t> SymbolTable::ranks() const
{
    std::vector<std::size_t> result(nodes_.size(), 0);
    std::size_t next = 0;
    forEachInOrder([&](NodeId id) { result[id] = next++; });
    return result;
}

const std::string &SymbolTable::key(NodeId id) const
{
    return nodes_.at(id).key;
}

std::size_t SymbolTable::height() const
{
    if (root_ == kNoNode)
        return 0;

    std::size_t best = 0;
    std::vector<std::pair<NodeId, std::size_t>> stack{{root_, 1}};
    while (!stack.empty())
    {
        auto [id, depth] = stack.back();
        stack.pop_back();
        best = std::max(best, depth);
        const Node &node = nodes_[id];
        if (node.left != kNoNode)
            stack.emplace_back(node.left, depth + 1);
        if (node.right != kNoNode)
            stack.emplace_back(node.right, depth + 1);
    }
    return best;
}

} // namespace lexis::frontends::toy
