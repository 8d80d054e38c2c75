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
 * @file SolutionSteps.cpp
 * @brief Builds the worked solution text from a solve result.
 */

#include "SolutionSteps.hpp"

#include <sstream>

#include "ResistanceResolver.hpp"

static std::string ohms(double value)
{
    return formatMetricValue(value, MetricKey::Resistance);
}

static std::string rowName(const PracticeProblem& problem,
                           const std::string& componentId)
{
    const PracticeComponent* component = problem.findComponent(componentId);
    if (component && !component->label.empty()) return component->label;
    return componentId;
}

static std::string groupFormula(NodeKind kind, size_t childCount)
{
    std::ostringstream oss;
    if (kind == NodeKind::Series) {
        oss << "R_T = ";
        for (size_t i = 0; i < childCount; ++i)
            oss << (i ? " + " : "") << "R_" << (i + 1);
    } else {
        oss << "1/R_T = ";
        for (size_t i = 0; i < childCount; ++i)
            oss << (i ? " + " : "") << "1/R_" << (i + 1);
    }
    return oss.str();
}

// Post-order walk: one step per group, innermost groups first.
static void combineGroups(const CircuitNetwork& network,
                          ResistanceResolver& resolver, NodeIndex index,
                          std::vector<SolutionStep>& steps)
{
    const CircuitNode& node = network.node(index);
    if (node.kind() == NodeKind::Component) return;

    for (NodeIndex child : node.children())
        combineGroups(network, resolver, child, steps);

    const std::vector<NodeIndex>& children = node.children();
    std::ostringstream detail;
    detail << "R_" << node.displayName() << " = ";
    if (node.kind() == NodeKind::Series) {
        for (size_t i = 0; i < children.size(); ++i)
            detail << (i ? " + " : "") << ohms(resolver.resolve(children[i]));
    } else {
        detail << "1 / (";
        for (size_t i = 0; i < children.size(); ++i)
            detail << (i ? " + " : "") << "1/"
                   << ohms(resolver.resolve(children[i]));
        detail << ")";
    }
    detail << " = " << ohms(resolver.resolve(index));

    SolutionStep step;
    step.title = std::string("Combine ") + network.describe(index);
    step.detail = detail.str();
    step.formula = groupFormula(node.kind(), children.size());
    steps.push_back(step);
}

static SolutionStep driveStep(const PracticeProblem& problem,
                              const SolveResult& result)
{
    const WireMetrics& t = result.totals;
    PartialWireMetrics drive =
        mergeMetrics(problem.totalsGivens, problem.source.solverInputs());

    SolutionStep step;
    std::ostringstream detail;
    if (drive.has(MetricKey::Voltage)) {
        step.title = "Solve for circuit current";
        detail << "I_T = E / R_T = "
               << formatMetricValue(t.voltage, MetricKey::Voltage) << " ÷ "
               << ohms(t.resistance) << " = "
               << formatMetricValue(t.current, MetricKey::Current);
        step.formula = "I = E / R";
    } else if (drive.has(MetricKey::Current)) {
        step.title = "Solve for source voltage";
        detail << "E = I_T × R_T = "
               << formatMetricValue(t.current, MetricKey::Current) << " × "
               << ohms(t.resistance) << " = "
               << formatMetricValue(t.voltage, MetricKey::Voltage);
        step.formula = "E = I × R";
    } else {
        step.title = "Solve for circuit current";
        detail << "I_T = √(P_T / R_T) = √("
               << formatMetricValue(t.watts, MetricKey::Watts) << " ÷ "
               << ohms(t.resistance) << ") = "
               << formatMetricValue(t.current, MetricKey::Current);
        step.formula = "I = √(P / R)";
    }
    step.detail = detail.str();
    return step;
}

std::vector<SolutionStep> buildSolutionSteps(const PracticeProblem& problem,
                                             const SolveResult& result)
{
    std::vector<SolutionStep> steps;
    if (!problem.network.hasRoot()) return steps;

    ComponentMap components = createComponentMap(problem);
    ResistanceResolver resolver(problem.network, components);
    combineGroups(problem.network, resolver, problem.network.root(), steps);

    steps.push_back(driveStep(problem, result));

    std::vector<std::string> leaves = problem.network.leafIds();

    std::ostringstream drops;
    for (size_t i = 0; i < leaves.size(); ++i) {
        auto it = result.components.find(leaves[i]);
        if (it == result.components.end()) continue;
        const WireMetrics& m = it->second;
        drops << (i ? "\n" : "") << rowName(problem, leaves[i])
              << ": E = I × R = "
              << formatMetricValue(m.current, MetricKey::Current) << " × "
              << ohms(m.resistance) << " = "
              << formatMetricValue(m.voltage, MetricKey::Voltage);
    }
    steps.push_back(SolutionStep{"Distribute voltage and current", drops.str(),
                                 "E_x = I_x × R_x"});

    std::ostringstream power;
    for (const auto& id : leaves) {
        auto it = result.components.find(id);
        if (it == result.components.end()) continue;
        const WireMetrics& m = it->second;
        power << rowName(problem, id) << ": P = E × I = "
              << formatMetricValue(m.voltage, MetricKey::Voltage) << " × "
              << formatMetricValue(m.current, MetricKey::Current) << " = "
              << formatMetricValue(m.watts, MetricKey::Watts) << "\n";
    }
    power << "Total: P_T = E × I = "
          << formatMetricValue(result.totals.voltage, MetricKey::Voltage)
          << " × "
          << formatMetricValue(result.totals.current, MetricKey::Current)
          << " = " << formatMetricValue(result.totals.watts, MetricKey::Watts);
    steps.push_back(
        SolutionStep{"Calculate component power", power.str(), "P = E × I"});

    return steps;
}
