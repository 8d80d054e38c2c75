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
 * @file PracticeSolver.cpp
 * @brief Implementation of the solve orchestrator and its boundary.
 */

#include "PracticeSolver.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "ResistanceResolver.hpp"

SolveAttempt SolveAttempt::success(SolveResult result)
{
    return SolveAttempt(std::move(result));
}

SolveAttempt SolveAttempt::failure(SolveErrorKind kind,
                                   const std::string& message)
{
    return SolveAttempt(SolveFailure{kind, message});
}

const SolveResult& SolveAttempt::data() const
{
    if (const auto* result = std::get_if<SolveResult>(&outcome)) return *result;
    throw std::logic_error("SolveAttempt holds a failure: " +
                           std::get<SolveFailure>(outcome).message);
}

const SolveFailure& SolveAttempt::error() const
{
    if (const auto* failure = std::get_if<SolveFailure>(&outcome))
        return *failure;
    throw std::logic_error("SolveAttempt holds a result, not a failure");
}

// Check an authored value against the solved one; `who` names the row.
static void checkAuthored(const PartialWireMetrics& authored,
                          const WireMetrics& solved, const std::string& who)
{
    for (MetricKey key : METRIC_ORDER) {
        std::optional<double> value = authored.find(key);
        if (value && !nearlyEqual(*value, solved.get(key), AUTHORED_VALUE_TOLERANCE)) {
            std::ostringstream oss;
            oss << who << " authored " << key << " " << *value
                << " contradicts the solved value " << solved.get(key);
            throw InconsistentDataError(oss.str());
        }
    }
}

SolveResult solvePracticeProblem(const PracticeProblem& problem)
{
    if (!problem.network.hasRoot())
        throw MissingDataError("Problem '" + problem.id + "' has no network");

    // Every load must sit below the root, or its row has nothing to grade
    // against.
    std::vector<std::string> leaves = problem.network.leafIds();
    for (const auto& component : problem.components) {
        if (std::find(leaves.begin(), leaves.end(), component.id) ==
            leaves.end()) {
            throw MissingDataError("Load '" + component.id +
                                   "' is not part of the network of problem '" +
                                   problem.id + "'");
        }
    }

    ComponentMap componentMap = createComponentMap(problem);
    ResistanceResolver resolver(problem.network, componentMap);

    double totalResistance = resolver.total();
    if (!std::isfinite(totalResistance)) {
        throw PropagationError(problem.network.node(problem.network.root()).id(),
                               "Invalid numeric value for total resistance");
    }

    // Totals: the network resistance plus whatever drives it. The source's
    // authored quantities win over the totals-row givens.
    PartialWireMetrics sourceInputs = problem.source.solverInputs();
    PartialWireMetrics drive = mergeMetrics(problem.totalsGivens, sourceInputs);
    drive.erase(MetricKey::Resistance);
    drive.set(MetricKey::Resistance, totalResistance);

    WireMetrics totals = solveWireMetrics(drive).metrics;
    if (!isPhysicallyConsistent(totals, AUTHORED_VALUE_TOLERANCE)) {
        std::ostringstream oss;
        oss << "Source '" << problem.source.id
            << "' authored values violate Ohm's or the power law (" << totals
            << ")";
        throw InconsistentDataError(oss.str());
    }
    checkAuthored(sourceInputs, totals, "Source '" + problem.source.id + "'");
    checkAuthored(problem.totalsGivens, totals, "Totals row");

    SolveResult result;
    result.equivalentResistance = totalResistance;
    result.totals = totals;
    result.source = totals;

    MetricPropagator propagator(problem.network, componentMap, resolver);
    result.components = propagator.propagate(totals.current, totals.voltage);
    return result;
}

SolveAttempt trySolvePracticeProblem(const PracticeProblem& problem)
{
    try {
        return SolveAttempt::success(solvePracticeProblem(problem));
    } catch (const PracticeError& ex) {
        std::cerr << "Warning: [PracticeSolver] Failed to solve '" << problem.id
                  << "': " << ex.kind() << ": " << ex.what() << std::endl;
        return SolveAttempt::failure(ex.kind(), ex.what());
    } catch (const std::exception& ex) {
        std::cerr << "Warning: [PracticeSolver] Failed to solve '" << problem.id
                  << "': " << ex.what() << std::endl;
        return SolveAttempt::failure(SolveErrorKind::Unknown, ex.what());
    }
}

std::optional<WireMetrics> rowMetrics(const SolveResult& result,
                                      const PracticeProblem& problem,
                                      const std::string& rowId)
{
    if (rowId == TOTALS_ROW_ID) return result.totals;
    if (rowId == problem.source.id) return result.source;
    auto it = result.components.find(rowId);
    if (it != result.components.end()) return it->second;
    return std::nullopt;
}

std::optional<double> targetValue(const SolveResult& result,
                                  const PracticeProblem& problem)
{
    std::optional<WireMetrics> row =
        rowMetrics(result, problem, problem.targetMetric.rowId);
    if (!row) return std::nullopt;
    return row->get(problem.targetMetric.key);
}

std::map<std::string, double> flowScale(const SolveResult& result)
{
    std::map<std::string, double> scale;
    double total = std::fabs(result.totals.current);
    for (const auto& entry : result.components) {
        scale[entry.first] =
            total > 0.0 ? std::fabs(entry.second.current) / total : 0.0;
    }
    return scale;
}
