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
 * @file ProblemValidator.hpp
 * @brief Load-time audit of authored practice problems.
 *
 * The parser only checks structure. The validator solves each problem and
 * audits what the learner will see:
 *
 *  - error: the solve fails (the message carries the failure kind);
 *  - error: the nodal cross-check cannot solve the circuit or deviates from
 *    the propagated solution by more than `crossCheckTolerance`;
 *  - error: the target value is not finite;
 *  - warning: every worksheet cell is given, so there is nothing to answer;
 *  - warning: a load's resistance is neither given nor derivable from its
 *    other given values, so the sheet cannot be finished by hand.
 *
 * Problems with at least one error are shown as unavailable by the driver.
 */

#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "PracticeProblem.hpp"
#include "PracticeSolver.hpp"

enum class IssueSeverity
{
    Warning,
    Error
};

inline std::ostream& operator<<(std::ostream& os, IssueSeverity severity)
{
    switch (severity) {
        case IssueSeverity::Warning:
            os << "Warning";
            break;
        case IssueSeverity::Error:
            os << "Error";
            break;
        default:
            os << "UnknownSeverity";
            break;
    }
    return os;
}

struct ValidationIssue
{
    IssueSeverity severity = IssueSeverity::Error;
    std::string message;
};

/**
 * @brief Audit one problem.
 *
 * @param problem Problem to audit.
 * @param crossCheckTolerance Largest accepted relative deviation between the
 *                            nodal solution and the propagated one.
 * @return Issues found, errors and warnings interleaved in check order.
 */
std::vector<ValidationIssue> validateProblem(const PracticeProblem& problem,
                                             double crossCheckTolerance = 1e-6);

/**
 * @brief Audit a problem whose solve attempt is already known.
 *
 * Same checks as validateProblem() without solving again.
 */
std::vector<ValidationIssue> validateSolved(const PracticeProblem& problem,
                                            const SolveAttempt& attempt,
                                            double crossCheckTolerance = 1e-6);

/** @brief True if any issue in `issues` is an error. */
bool hasErrors(const std::vector<ValidationIssue>& issues);

/** @brief Message of the first error, or an empty string. */
std::string firstError(const std::vector<ValidationIssue>& issues);
