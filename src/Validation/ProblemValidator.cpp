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
 * @file ProblemValidator.cpp
 * @brief Implementation of the load-time problem audit.
 */

#include "ProblemValidator.hpp"

#include <cmath>
#include <sstream>

#include "NodalCrossCheck.hpp"
#include "PracticeSolver.hpp"

// A row the learner can finish by hand needs two visible quantities (or the
// resistance itself).
static bool resistanceVisible(const PracticeComponent& component)
{
    return component.givens.has(MetricKey::Resistance) ||
           component.givens.count() >= 2;
}

static std::size_t learnerCells(const PracticeProblem& problem)
{
    std::size_t total = (problem.components.size() + 2) * METRIC_ORDER.size();
    std::size_t given = problem.source.givens.count() +
                        problem.totalsGivens.count();
    for (const auto& component : problem.components)
        given += component.givens.count();
    return total - given;
}

std::vector<ValidationIssue> validateProblem(const PracticeProblem& problem,
                                             double crossCheckTolerance)
{
    return validateSolved(problem, trySolvePracticeProblem(problem),
                          crossCheckTolerance);
}

std::vector<ValidationIssue> validateSolved(const PracticeProblem& problem,
                                            const SolveAttempt& attempt,
                                            double crossCheckTolerance)
{
    std::vector<ValidationIssue> issues;

    if (!attempt.ok()) {
        std::ostringstream oss;
        oss << attempt.error().kind << ": " << attempt.error().message;
        issues.push_back(ValidationIssue{IssueSeverity::Error, oss.str()});
    } else {
        const SolveResult& result = attempt.data();

        NodalCheckReport report = crossCheckSolution(problem, result);
        if (!report.solved) {
            issues.push_back(ValidationIssue{
                IssueSeverity::Error, "Nodal cross-check failed: " + report.message});
        } else if (!report.consistent(crossCheckTolerance)) {
            std::ostringstream oss;
            oss << "Nodal cross-check deviates at '" << report.worstComponent
                << "' (current " << report.maxCurrentDeviation << ", voltage "
                << report.maxVoltageDeviation << ")";
            issues.push_back(ValidationIssue{IssueSeverity::Error, oss.str()});
        }

        std::optional<double> target = targetValue(result, problem);
        if (!target || !std::isfinite(*target)) {
            std::ostringstream oss;
            oss << "Target " << problem.targetMetric.rowId << " "
                << problem.targetMetric.key << " is not finite";
            issues.push_back(ValidationIssue{IssueSeverity::Error, oss.str()});
        }
    }

    if (learnerCells(problem) == 0) {
        issues.push_back(ValidationIssue{
            IssueSeverity::Warning, "Worksheet has no cells for the learner"});
    }

    for (const auto& component : problem.components) {
        if (!resistanceVisible(component)) {
            issues.push_back(ValidationIssue{
                IssueSeverity::Warning,
                "Load '" + component.id +
                    "' has no resistance visible to the learner"});
        }
    }
    return issues;
}

bool hasErrors(const std::vector<ValidationIssue>& issues)
{
    for (const auto& issue : issues) {
        if (issue.severity == IssueSeverity::Error) return true;
    }
    return false;
}

std::string firstError(const std::vector<ValidationIssue>& issues)
{
    for (const auto& issue : issues) {
        if (issue.severity == IssueSeverity::Error) return issue.message;
    }
    return std::string();
}
