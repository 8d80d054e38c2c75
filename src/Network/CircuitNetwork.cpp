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
 * @file CircuitNetwork.cpp
 * @brief Arena construction and traversal helpers for CircuitNetwork.
 */

#include "CircuitNetwork.hpp"

#include <sstream>
#include <stdexcept>

NodeKind CircuitNode::kind() const
{
    return std::visit(
        overloaded{[](const ComponentRef&) { return NodeKind::Component; },
                   [](const SeriesGroup&) { return NodeKind::Series; },
                   [](const ParallelGroup&) { return NodeKind::Parallel; }},
        shape);
}

const std::vector<NodeIndex>& CircuitNode::children() const
{
    static const std::vector<NodeIndex> none;
    return std::visit(
        overloaded{
            [](const ComponentRef&) -> const std::vector<NodeIndex>& {
                return none;
            },
            [](const SeriesGroup& g) -> const std::vector<NodeIndex>& {
                return g.children;
            },
            [](const ParallelGroup& g) -> const std::vector<NodeIndex>& {
                return g.children;
            }},
        shape);
}

const std::string& CircuitNode::id() const
{
    return std::visit(
        overloaded{
            [](const ComponentRef& c) -> const std::string& {
                return c.componentId;
            },
            [](const SeriesGroup& g) -> const std::string& { return g.id; },
            [](const ParallelGroup& g) -> const std::string& { return g.id; }},
        shape);
}

const std::string& CircuitNode::displayName() const
{
    return std::visit(
        overloaded{
            [](const ComponentRef& c) -> const std::string& {
                return c.componentId;
            },
            [](const SeriesGroup& g) -> const std::string& {
                return g.label.empty() ? g.id : g.label;
            },
            [](const ParallelGroup& g) -> const std::string& {
                return g.label.empty() ? g.id : g.label;
            }},
        shape);
}

NodeIndex CircuitNetwork::addComponent(const std::string& componentId)
{
    if (componentId.empty())
        throw std::invalid_argument("Component leaf requires a non-empty id");
    if (findLeaf(componentId)) {
        throw std::invalid_argument("Component '" + componentId +
                                    "' appears more than once in the network");
    }

    CircuitNode node;
    node.index = nodes.size();
    node.shape = ComponentRef{componentId};
    nodes.push_back(node);
    attached.push_back(false);
    return node.index;
}

NodeIndex CircuitNetwork::addSeries(const std::string& id,
                                    std::vector<NodeIndex> children,
                                    const std::string& label)
{
    return addGroup(NodeKind::Series, id, std::move(children), label);
}

NodeIndex CircuitNetwork::addParallel(const std::string& id,
                                      std::vector<NodeIndex> children,
                                      const std::string& label)
{
    return addGroup(NodeKind::Parallel, id, std::move(children), label);
}

NodeIndex CircuitNetwork::addGroup(NodeKind kind, const std::string& id,
                                   std::vector<NodeIndex> children,
                                   const std::string& label)
{
    std::ostringstream who;
    who << kind << " '" << id << "'";

    if (children.empty())
        throw std::invalid_argument(who.str() + " must have at least one child");

    // Validate every child before touching the arena so a failed call leaves
    // the network unchanged.
    for (size_t i = 0; i < children.size(); ++i) {
        NodeIndex child = children[i];
        if (child >= nodes.size()) {
            throw std::invalid_argument(who.str() + " references unknown node #" +
                                        std::to_string(child));
        }
        if (attached[child]) {
            throw std::invalid_argument(who.str() + ": " + describe(child) +
                                        " already has a parent");
        }
        for (size_t j = 0; j < i; ++j) {
            if (children[j] == child) {
                throw std::invalid_argument(who.str() + " lists " +
                                            describe(child) + " twice");
            }
        }
        if (rootIndex && *rootIndex == child) {
            throw std::invalid_argument(who.str() + ": " + describe(child) +
                                        " is already the root");
        }
    }

    CircuitNode node;
    node.index = nodes.size();
    if (kind == NodeKind::Series)
        node.shape = SeriesGroup{id, label, children};
    else
        node.shape = ParallelGroup{id, label, children};

    for (NodeIndex child : children) attached[child] = true;
    nodes.push_back(std::move(node));
    attached.push_back(false);
    return nodes.size() - 1;
}

void CircuitNetwork::setRoot(NodeIndex index)
{
    if (index >= nodes.size())
        throw std::invalid_argument("Root references unknown node #" +
                                    std::to_string(index));
    if (attached[index])
        throw std::invalid_argument("Root " + describe(index) +
                                    " already has a parent");
    rootIndex = index;
}

NodeIndex CircuitNetwork::root() const
{
    if (!rootIndex) throw std::logic_error("Circuit network has no root");
    return *rootIndex;
}

const CircuitNode& CircuitNetwork::node(NodeIndex index) const
{
    if (index >= nodes.size())
        throw std::out_of_range("Unknown circuit node #" + std::to_string(index));
    return nodes[index];
}

std::vector<std::string> CircuitNetwork::leafIds() const
{
    std::vector<std::string> out;
    if (rootIndex) collectLeaves(*rootIndex, out);
    return out;
}

void CircuitNetwork::collectLeaves(NodeIndex index,
                                   std::vector<std::string>& out) const
{
    const CircuitNode& n = nodes[index];
    if (n.kind() == NodeKind::Component) {
        out.push_back(n.id());
        return;
    }
    for (NodeIndex child : n.children()) collectLeaves(child, out);
}

std::optional<NodeIndex> CircuitNetwork::findLeaf(
    const std::string& componentId) const
{
    for (const auto& n : nodes) {
        if (const auto* ref = std::get_if<ComponentRef>(&n.shape)) {
            if (ref->componentId == componentId) return n.index;
        }
    }
    return std::nullopt;
}

std::string CircuitNetwork::describe(NodeIndex index) const
{
    const CircuitNode& n = node(index);
    std::ostringstream oss;
    oss << n.kind() << " '" << n.id() << "'";
    return oss.str();
}

std::string CircuitNetwork::toString() const
{
    if (!rootIndex) return "()";
    std::ostringstream oss;
    render(*rootIndex, oss);
    return oss.str();
}

void CircuitNetwork::render(NodeIndex index, std::ostream& os) const
{
    const CircuitNode& n = nodes[index];
    std::visit(overloaded{[&os](const ComponentRef& c) { os << c.componentId; },
                          [&](const SeriesGroup& g) {
                              os << "(SERIES:" << g.id;
                              for (NodeIndex child : g.children) {
                                  os << ' ';
                                  render(child, os);
                              }
                              os << ')';
                          },
                          [&](const ParallelGroup& g) {
                              os << "(PARALLEL:" << g.id;
                              for (NodeIndex child : g.children) {
                                  os << ' ';
                                  render(child, os);
                              }
                              os << ')';
                          }},
               n.shape);
}
