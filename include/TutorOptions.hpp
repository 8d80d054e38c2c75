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

#pragma once

#include <cmath>
#include <stdexcept>
#include <string>

#include "Worksheet.hpp"

/*
 * TutorOptions.hpp
 *
 * Lightweight configuration container for the command-line driver.
 *
 * `TutorOptions` carries the grading window, the problem selection and the
 * diagnostics settings from `main` (or tests) into `runPractice()`. Fields are
 * public so the getopt loop can fill them directly; `validate()` rejects
 * combinations that cannot work.
 */
/**
 * @struct TutorOptions
 * @brief Runtime options for grading, output and diagnostics.
 */
struct TutorOptions
{
    /** @brief Relative acceptance window for answers (fraction, 0.01 = 1 %). */
    double relTol = 0.01;

    /** @brief Absolute acceptance window used near zero. */
    double absTol = 1e-3;

    /** @brief Expected magnitudes below this use `absTol` instead of `relTol`. */
    double nearZero = 1e-4;

    /**
     * @brief Problem to work on. Empty selects every available problem
     *        (listing mode), unless answers are given.
     */
    std::string problemId;

    /**
     * @brief Answer script: a path, or "-" for stdin. Each non-comment line is
     *        `rowId metric free text`, e.g. `R1 E 6.0 V`.
     */
    std::string answersFile;

    /** @brief Path to the diagnostics log written by the driver. */
    std::string diagFile = "wire_tutor.log";

    /** @brief Log derivations and cross-check figures for every problem. */
    bool diagVerbose = false;

    /** @brief Print the worked solution steps after the worksheet. */
    bool showSteps = false;

    /** @brief Print the target answer even when the sheet is incomplete. */
    bool revealAll = false;

    /** @brief Print the nodal cross-check report of each problem. */
    bool audit = false;

    /**
     * @brief Validate option values.
     *
     * Throws:
     *   - std::invalid_argument for negative or non-finite tolerances, or an
     *     answer script without a selected problem.
     */
    void validate() const
    {
        if (!(relTol >= 0.0) || !(relTol < 1.0))
            throw std::invalid_argument("rel-tol must be in [0, 1)");
        if (!(absTol >= 0.0) || !std::isfinite(absTol))
            throw std::invalid_argument("abs-tol must be >= 0");
        if (!(nearZero >= 0.0) || !std::isfinite(nearZero))
            throw std::invalid_argument("near-zero must be >= 0");
        if (!answersFile.empty() && problemId.empty())
            throw std::invalid_argument("--answers requires --problem");
        if (diagFile.empty())
            throw std::invalid_argument("diag-file must not be empty");
    }

    /** @brief Grading window built from the tolerance fields. */
    GradingTolerance grading() const
    {
        GradingTolerance tolerance;
        tolerance.relative = relTol;
        tolerance.absolute = absTol;
        tolerance.nearZero = nearZero;
        return tolerance;
    }
};
