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
 * @file MetricPropagator.hpp
 * @brief Top-down current/voltage split across a series/parallel tree.
 *
 * Starting from the total current and voltage at the source, the propagator
 * walks the tree:
 *  - series:   every child carries the parent current; child voltage is
 *              current * R_child (voltage divider);
 *  - parallel: every child sees the parent voltage; child current is
 *              voltage / R_child (current divider);
 *  - leaf:     the incoming (I, E) pair is merged over the component's
 *              solver inputs and resolved with `solveWireMetrics()`.
 *
 * Authored current or voltage on a leaf must agree with the propagated value
 * (AUTHORED_VALUE_TOLERANCE); a mismatch is a content-authoring error and
 * raises `InconsistentDataError`. Any non-finite intermediate value raises
 * `PropagationError` naming the node.
 */

#pragma once

#include <map>
#include <string>

#include "CircuitNetwork.hpp"
#include "PracticeProblem.hpp"
#include "ResistanceResolver.hpp"
#include "WireMetrics.hpp"

/** @brief Leaf component id -> resolved metrics. */
using MetricsById = std::map<std::string, WireMetrics>;

/** @brief Relative tolerance between authored and physics-derived values. */
constexpr double AUTHORED_VALUE_TOLERANCE = 1e-3;

class MetricPropagator
{
   public:
    /**
     * @param network Tree to walk.
     * @param components Load lookup.
     * @param resolver Resolver of the same solve (its cache is reused).
     */
    MetricPropagator(const CircuitNetwork& network,
                     const ComponentMap& components,
                     ResistanceResolver& resolver);

    /**
     * @brief Propagate from the root.
     * @return One entry per leaf of the network.
     */
    MetricsById propagate(double totalCurrent, double totalVoltage);

   private:
    void propagateNode(NodeIndex index, double current, double voltage,
                       MetricsById& out);
    WireMetrics resolveLeaf(const std::string& componentId, double current,
                            double voltage) const;

    const CircuitNetwork& network;
    const ComponentMap& components;
    ResistanceResolver& resolver;
};
