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
 * @file ResistanceResolver.cpp
 * @brief Recursive series/parallel reduction with a per-solve index cache.
 */

#include "ResistanceResolver.hpp"

#include <cmath>
#include <sstream>

#include "PracticeErrors.hpp"

ResistanceResolver::ResistanceResolver(const CircuitNetwork& network,
                                       const ComponentMap& components)
    : network(network), components(components), cache(network.size())
{
}

double ResistanceResolver::componentResistance(
    const std::string& componentId) const
{
    auto it = components.find(componentId);
    if (it == components.end() || it->second == nullptr)
        throw MissingDataError("Unknown component '" + componentId + "'");

    std::optional<double> r =
        it->second->solverInputs().find(MetricKey::Resistance);
    if (!r || !std::isfinite(*r) || *r <= 0.0) {
        throw MissingDataError("Component '" + componentId +
                               "' is missing a resistance value for solving");
    }
    return *r;
}

double ResistanceResolver::resolve(NodeIndex index)
{
    const CircuitNode& node = network.node(index);
    if (cache[index]) return *cache[index];

    ++evaluationCount;
    double result = std::visit(
        overloaded{
            [this](const ComponentRef& ref) {
                return componentResistance(ref.componentId);
            },
            [this](const SeriesGroup& group) {
                double sum = 0.0;
                for (NodeIndex child : group.children) sum += resolve(child);
                return sum;
            },
            [this, index](const ParallelGroup& group) {
                double reciprocal = 0.0;
                for (NodeIndex child : group.children) {
                    double childResistance = resolve(child);
                    if (childResistance <= 0.0) {
                        std::ostringstream oss;
                        oss << "Parallel branch resistance must be positive ("
                            << network.describe(child) << " in "
                            << network.describe(index) << " is "
                            << childResistance << " Ω)";
                        throw DomainError(oss.str());
                    }
                    reciprocal += 1.0 / childResistance;
                }
                if (!(reciprocal > 0.0)) {
                    throw DomainError(
                        "Parallel network reciprocal resistance must be "
                        "positive in " +
                        network.describe(index));
                }
                return 1.0 / reciprocal;
            }},
        node.shape);

    cache[index] = result;
    return result;
}
