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
 * @file MetricPropagator.cpp
 * @brief Implementation of the voltage/current divider walk.
 */

#include "MetricPropagator.hpp"

#include <cmath>
#include <sstream>

#include "PracticeErrors.hpp"

MetricPropagator::MetricPropagator(const CircuitNetwork& network,
                                   const ComponentMap& components,
                                   ResistanceResolver& resolver)
    : network(network), components(components), resolver(resolver)
{
}

MetricsById MetricPropagator::propagate(double totalCurrent,
                                        double totalVoltage)
{
    MetricsById out;
    propagateNode(network.root(), totalCurrent, totalVoltage, out);
    return out;
}

void MetricPropagator::propagateNode(NodeIndex index, double current,
                                     double voltage, MetricsById& out)
{
    if (!std::isfinite(current) || !std::isfinite(voltage)) {
        std::ostringstream oss;
        oss << "Invalid propagation state at " << network.describe(index)
            << " (I = " << current << " A, E = " << voltage << " V)";
        throw PropagationError(network.node(index).id(), oss.str());
    }

    const CircuitNode& node = network.node(index);
    std::visit(overloaded{[&](const ComponentRef& ref) {
                              out[ref.componentId] =
                                  resolveLeaf(ref.componentId, current, voltage);
                          },
                          [&](const SeriesGroup& group) {
                              for (NodeIndex child : group.children) {
                                  double childVoltage =
                                      current * resolver.resolve(child);
                                  propagateNode(child, current, childVoltage, out);
                              }
                          },
                          [&](const ParallelGroup& group) {
                              for (NodeIndex child : group.children) {
                                  double childResistance = resolver.resolve(child);
                                  if (childResistance <= 0.0) {
                                      throw DomainError(
                                          "Parallel branch resistance must be "
                                          "positive (" +
                                          network.describe(child) + ")");
                                  }
                                  propagateNode(child, voltage / childResistance,
                                                voltage, out);
                              }
                          }},
               node.shape);
}

WireMetrics MetricPropagator::resolveLeaf(const std::string& componentId,
                                          double current, double voltage) const
{
    auto it = components.find(componentId);
    if (it == components.end() || it->second == nullptr) {
        throw PropagationError(componentId, "Component '" + componentId +
                                                "' not found during propagation");
    }

    const PartialWireMetrics authored = it->second->solverInputs();

    // Authored current/voltage must match what the network imposes.
    const std::pair<MetricKey, double> imposed[] = {
        {MetricKey::Current, current}, {MetricKey::Voltage, voltage}};
    for (const auto& entry : imposed) {
        std::optional<double> value = authored.find(entry.first);
        if (value && !nearlyEqual(*value, entry.second, AUTHORED_VALUE_TOLERANCE)) {
            std::ostringstream oss;
            oss << "Component '" << componentId << "' authored " << entry.first
                << " " << *value << " contradicts the solved value "
                << entry.second;
            throw InconsistentDataError(oss.str());
        }
    }

    PartialWireMetrics incoming;
    incoming.set(MetricKey::Current, current);
    incoming.set(MetricKey::Voltage, voltage);

    WireMetrics resolved =
        solveWireMetrics(mergeMetrics(authored, incoming)).metrics;

    if (!isPhysicallyConsistent(resolved, AUTHORED_VALUE_TOLERANCE)) {
        std::ostringstream oss;
        oss << "Component '" << componentId
            << "' authored values violate Ohm's or the power law (" << resolved
            << ")";
        throw InconsistentDataError(oss.str());
    }
    return resolved;
}
