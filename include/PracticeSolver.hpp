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
 * @file PracticeSolver.hpp
 * @brief Public solve entrypoint for practice problems.
 *
 * `solvePracticeProblem()` ties the pipeline together:
 *  1. reduce the network to its equivalent resistance (ResistanceResolver);
 *  2. resolve the circuit totals from that resistance plus what the source
 *     (and the totals row) gives;
 *  3. propagate the total current/voltage to every load (MetricPropagator).
 *
 * It throws the `PracticeError` family. `trySolvePracticeProblem()` is the
 * boundary used by callers: it never throws a solver error and instead
 * returns a `SolveAttempt` holding either the result or a tagged failure.
 *
 * Every call builds its own resolver and cache, so solving the same problem
 * twice yields bit-identical output and solving two problems back-to-back
 * shares no state.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>

#include "MetricPropagator.hpp"
#include "PracticeErrors.hpp"
#include "PracticeProblem.hpp"
#include "WireMetrics.hpp"

/**
 * @struct SolveResult
 * @brief Everything the grading layer and the views need from one solve.
 */
struct SolveResult
{
    WireMetrics totals;          /**< Circuit totals row */
    WireMetrics source;          /**< Source row */
    MetricsById components;      /**< One entry per load */
    double equivalentResistance = 0.0;
};

/**
 * @struct SolveFailure
 * @brief Tagged failure produced at the solve boundary.
 */
struct SolveFailure
{
    SolveErrorKind kind = SolveErrorKind::Unknown;
    std::string message;
};

/**
 * @class SolveAttempt
 * @brief Either a SolveResult or a SolveFailure.
 */
class SolveAttempt
{
   public:
    static SolveAttempt success(SolveResult result);
    static SolveAttempt failure(SolveErrorKind kind, const std::string& message);

    bool ok() const { return std::holds_alternative<SolveResult>(outcome); }

    /** @throws std::logic_error when the attempt failed. */
    const SolveResult& data() const;

    /** @throws std::logic_error when the attempt succeeded. */
    const SolveFailure& error() const;

   private:
    explicit SolveAttempt(std::variant<SolveResult, SolveFailure> outcome)
        : outcome(std::move(outcome))
    {
    }

    std::variant<SolveResult, SolveFailure> outcome;
};

/**
 * @brief Solve a problem, throwing on malformed content.
 *
 * @throws MissingDataError, DomainError, PropagationError,
 *         InconsistentDataError
 */
SolveResult solvePracticeProblem(const PracticeProblem& problem);

/**
 * @brief Solve a problem and convert every error into a SolveFailure.
 *
 * A warning naming the problem is written to stderr on failure.
 */
SolveAttempt trySolvePracticeProblem(const PracticeProblem& problem);

/**
 * @brief Metrics of one worksheet row (source id, load id or totals).
 */
std::optional<WireMetrics> rowMetrics(const SolveResult& result,
                                      const PracticeProblem& problem,
                                      const std::string& rowId);

/**
 * @brief Value of the problem's target metric (the "reveal answer" read).
 */
std::optional<double> targetValue(const SolveResult& result,
                                  const PracticeProblem& problem);

/**
 * @brief Each load's current as a fraction of the total current.
 *
 * Consumed by the current-flow animation to scale per-branch visuals. All
 * fractions are 0 when the total current is 0.
 */
std::map<std::string, double> flowScale(const SolveResult& result);
