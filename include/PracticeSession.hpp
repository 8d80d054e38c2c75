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
 * @file PracticeSession.hpp
 * @brief Active-problem lifecycle and the practice driver entrypoint.
 *
 * `PracticeSession` owns one selected problem, its solve attempt, the grader
 * built from it and the current worksheet snapshot. Selecting a problem
 * always discards the previous snapshot and starts from a fresh baseline.
 *
 * The free functions below are the pieces `main` strings together: load the
 * catalogs, audit every problem, write the diagnostics log, print the
 * W.I.R.E. table and grade an answer script.
 */

#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "PracticeProblem.hpp"
#include "PracticeSolver.hpp"
#include "SolutionSteps.hpp"
#include "TutorOptions.hpp"
#include "Worksheet.hpp"

/**
 * @class PracticeSession
 * @brief One learner working on one problem at a time.
 */
class PracticeSession
{
   public:
    explicit PracticeSession(GradingTolerance tolerance = GradingTolerance());

    /**
     * @brief Make `problem` active: solve it, build the grader and a fresh
     * baseline. A failing solve leaves the session unavailable, not broken.
     */
    void selectProblem(const PracticeProblem& problem);

    bool hasProblem() const { return active.has_value(); }

    /** @throws std::logic_error when no problem is selected. */
    const PracticeProblem& problem() const;

    /** @throws std::logic_error when no problem is selected. */
    const SolveAttempt& attempt() const;

    /** @brief Problem selected and solved. */
    bool available() const;

    /** @brief "Kind: message" of the failed solve; empty when available. */
    const std::string& unavailableReason() const { return reason; }

    /** @throws std::logic_error when no problem is selected. */
    const Worksheet& worksheet() const;

    /**
     * @brief Apply one cell edit and return the new snapshot.
     * @throws std::logic_error when no problem is selected.
     */
    const Worksheet& edit(const std::string& rowId, MetricKey key,
                          const std::string& raw);

    /** @brief Throw away every learner entry. */
    void resetToBaseline();

    bool complete() const;

    /**
     * @brief Value of the target metric once the sheet is complete.
     *
     * @param force Reveal even if the sheet is incomplete.
     * @return The value, or nothing if unavailable or not yet earned.
     */
    std::optional<double> revealTarget(bool force = false) const;

    /** @brief Worked solution; empty while unavailable. */
    std::vector<SolutionStep> solutionSteps() const;

    const GradingTolerance& tolerance() const { return window; }

   private:
    void requireProblem() const;

    GradingTolerance window;
    std::optional<PracticeProblem> active;
    std::optional<SolveAttempt> solved;
    std::optional<WorksheetGrader> grader;
    Worksheet sheet;
    std::string reason;
};

/**
 * @brief Print the worksheet as a W.I.R.E. table.
 *
 * Given cells are bracketed; graded cells carry a status mark
 * (`ok`, `x`, `?` for invalid input).
 */
void printWireTable(std::ostream& os, const Worksheet& sheet);

/**
 * @brief Feed an answer script into the session.
 *
 * Each line is `rowId metric free text`. Blank lines and lines starting with
 * `#` or `*` are skipped. Malformed lines are reported to `std::cerr` as
 * `Line N: ...`.
 *
 * @return Number of malformed lines.
 */
int applyAnswers(PracticeSession& session, std::istream& in);

/**
 * @brief Driver used by `main`.
 *
 * Without `--problem` every loaded problem is listed with its availability;
 * with it, the selected worksheet is graded against the answer script (if
 * any) and printed.
 *
 * @param files Catalog paths.
 * @param options Validated options.
 * @return Process exit code.
 */
int runPractice(const std::vector<std::string>& files,
                const TutorOptions& options);
