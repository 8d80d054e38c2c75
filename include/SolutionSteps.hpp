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
 * @file SolutionSteps.hpp
 * @brief Worked explanation of a solved practice problem.
 */

#pragma once

#include <string>
#include <vector>

#include "PracticeProblem.hpp"
#include "PracticeSolver.hpp"

/**
 * @struct SolutionStep
 * @brief One step of the worked solution shown after the sheet is finished.
 */
struct SolutionStep
{
    std::string title;
    std::string detail;  /**< One or more lines with substituted values */
    std::string formula; /**< Symbolic form, may be empty */
};

/**
 * @brief Build the solution steps for `problem` from its solve result.
 *
 * Steps, in order:
 *  1. one step per series/parallel group, innermost first, combining the
 *     children into an equivalent resistance;
 *  2. the circuit current (or the source voltage when the source is
 *     specified by its current);
 *  3. the per-component voltage drops and branch currents;
 *  4. the per-component and total power.
 *
 * @throws MissingDataError or DomainError if the network cannot be reduced
 *         (only possible when `result` does not belong to `problem`).
 */
std::vector<SolutionStep> buildSolutionSteps(const PracticeProblem& problem,
                                             const SolveResult& result);
