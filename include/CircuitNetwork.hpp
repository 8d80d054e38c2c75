/*
 * Copyright (c) 2022, Shiv Nadar University, Delhi NCR, India. All Rights
 * Reserved. Permission to use, copy, modify and distribute this software for
 * educational, research, and not-for-profit purposes, without fee and without a
 * signed license agreement, is hereby granted, provided that this paragraph and
 * the following two paragraphs appear in all copies, modifications, and
 * distributions.
 *
 * IN NO EVENT SHALL SHIV NADAR UNIVERSITY BE LIABLE TO ANY PARTY FOR DIRECT,
 * INDIRECT, SPECIAL, INCIDENTAL, OR CONSEQUENTIAL DAMAGES, INCLUDING LOST
 * PROFITS, ARISING OUT OF THE USE OF THIS SOFTWARE.
 *
 * SHIV NADAR UNIVERSITY SPECIFICALLY DISCLAIMS ANY WARRANTIES, INCLUDING, BUT
 * NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE. THE SOFTWARE PROVIDED HEREUNDER IS PROVIDED "AS IS". SHIV
 * NADAR UNIVERSITY HAS NO OBLIGATION TO PROVIDE MAINTENANCE, SUPPORT, UPDATES,
 * ENHANCEMENTS, OR MODIFICATIONS.
 */

/**
 * @file CircuitNetwork.hpp
 * @brief Index-addressed series/parallel network tree.
 *
 * A practice circuit is a single source driving a strictly nested
 * series/parallel tree of resistive loads. The tree is stored in an arena:
 * every `CircuitNode` receives a stable `NodeIndex` when it is added to the
 * `CircuitNetwork`, and internal nodes refer to their children by index.
 *
 * Construction enforces the tree invariants:
 *  - children must already exist when their parent is added, so cycles are
 *    unrepresentable;
 *  - a node can be attached to one parent only;
 *  - a component id can appear in one leaf only;
 *  - series and parallel groups need at least one child.
 *
 * Violations throw `std::invalid_argument` naming the offending node.
 *
 * The three node shapes form a `std::variant`; recursive algorithms walk the
 * tree with `std::visit` and the `overloaded` helper below so the compiler
 * checks that every shape is handled.
 *
 * Example:
 * @code
 * CircuitNetwork net;
 * NodeIndex r1 = net.addComponent("R1");
 * NodeIndex r2 = net.addComponent("R2");
 * NodeIndex r3 = net.addComponent("R3");
 * NodeIndex bank = net.addParallel("bank", {r2, r3});
 * net.setRoot(net.addSeries("main", {r1, bank}));
 * // net.toString() == "(SERIES:main R1 (PARALLEL:bank R2 R3))"
 * @endcode
 */

#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

using NodeIndex = std::size_t;

/** @brief Visitor helper combining several lambdas into one overload set. */
template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

/**
 * @enum NodeKind
 * @brief Which case of the CircuitNode variant a node holds.
 */
enum class NodeKind
{
    Component, /**< Leaf referencing one load component */
    Series,    /**< Children carry identical current */
    Parallel   /**< Children share identical voltage */
};

inline std::ostream& operator<<(std::ostream& os, NodeKind kind)
{
    switch (kind) {
        case NodeKind::Component:
            os << "component";
            break;
        case NodeKind::Series:
            os << "series";
            break;
        case NodeKind::Parallel:
            os << "parallel";
            break;
        default:
            os << "UnknownNodeKind";
            break;
    }
    return os;
}

/** @brief Leaf: one load component, referenced by id. */
struct ComponentRef
{
    std::string componentId;
};

/** @brief Sub-network whose children all carry the same current. */
struct SeriesGroup
{
    std::string id;
    std::string label;
    std::vector<NodeIndex> children;
};

/** @brief Sub-network whose children all see the same voltage. */
struct ParallelGroup
{
    std::string id;
    std::string label;
    std::vector<NodeIndex> children;
};

/**
 * @struct CircuitNode
 * @brief One arena slot: its stable index plus the tagged shape.
 */
struct CircuitNode
{
    NodeIndex index = 0;
    std::variant<ComponentRef, SeriesGroup, ParallelGroup> shape;

    NodeKind kind() const;

    /** @brief Children of an internal node; empty for a leaf. */
    const std::vector<NodeIndex>& children() const;

    /** @brief Component id for a leaf, group id otherwise. */
    const std::string& id() const;

    /** @brief Label for a group (falls back to id), component id for a leaf. */
    const std::string& displayName() const;
};

/**
 * @class CircuitNetwork
 * @brief Arena owning every node of one practice circuit.
 */
class CircuitNetwork
{
   public:
    /**
     * @brief Add a leaf for component `componentId`.
     * @throws std::invalid_argument if the id is empty or already has a leaf.
     */
    NodeIndex addComponent(const std::string& componentId);

    /**
     * @brief Add a series group over existing, unattached children.
     * @throws std::invalid_argument on an empty child list, an unknown index
     *         or a child that already has a parent.
     */
    NodeIndex addSeries(const std::string& id, std::vector<NodeIndex> children,
                        const std::string& label = "");

    /** @brief Parallel counterpart of addSeries(); same preconditions. */
    NodeIndex addParallel(const std::string& id,
                          std::vector<NodeIndex> children,
                          const std::string& label = "");

    /**
     * @brief Mark `index` as the tree root.
     * @throws std::invalid_argument if the index is unknown or has a parent.
     */
    void setRoot(NodeIndex index);

    bool hasRoot() const { return rootIndex.has_value(); }

    /** @throws std::logic_error when no root was set. */
    NodeIndex root() const;

    /** @throws std::out_of_range for an unknown index. */
    const CircuitNode& node(NodeIndex index) const;

    std::size_t size() const { return nodes.size(); }
    bool empty() const { return nodes.empty(); }

    /** @brief Component ids of the leaves below the root, in tree order. */
    std::vector<std::string> leafIds() const;

    /** @brief Leaf index for a component id, if the network has one. */
    std::optional<NodeIndex> findLeaf(const std::string& componentId) const;

    /**
     * @brief Human-readable node reference for diagnostics, e.g.
     * "series 'main'" or "component 'R1'".
     */
    std::string describe(NodeIndex index) const;

    /** @brief S-expression of the tree, e.g. "(SERIES:s1 R1 R2)". */
    std::string toString() const;

   private:
    NodeIndex addGroup(NodeKind kind, const std::string& id,
                       std::vector<NodeIndex> children, const std::string& label);
    void collectLeaves(NodeIndex index, std::vector<std::string>& out) const;
    void render(NodeIndex index, std::ostream& os) const;

    std::vector<CircuitNode> nodes;
    std::vector<bool> attached;  // parallel to `nodes`: has a parent
    std::optional<NodeIndex> rootIndex;
};
