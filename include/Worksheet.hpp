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
 * @file Worksheet.hpp
 * @brief W.I.R.E. worksheet snapshots and the grading reducer.
 *
 * A `Worksheet` is an immutable snapshot: one row for the source, one per
 * load (authored order) and one for the circuit totals, each holding four
 * cells in W, I, R, E order. `WorksheetGrader` owns the expected values of a
 * solved problem and produces new snapshots:
 *
 *  - `baseline()` seeds given cells with the solved value (formatted by the
 *    display contract) and locks them; every other cell starts blank.
 *  - `onCellEdit(snapshot, row, key, raw)` grades one cell and recomputes the
 *    completion flag. Editing a given cell or an unknown row returns the
 *    snapshot unchanged.
 *
 * Cell state machine:
 * @code
 *   given   (locked, never changes)
 *   blank   <- empty text
 *   invalid <- text without a numeral
 *   correct / incorrect <- numeral graded against the expected value
 * @endcode
 */

#pragma once

#include <array>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "PracticeProblem.hpp"
#include "PracticeSolver.hpp"
#include "WireMetrics.hpp"

enum class CellStatus
{
    Given,
    Blank,
    Invalid,
    Correct,
    Incorrect
};

inline std::ostream& operator<<(std::ostream& os, CellStatus status)
{
    switch (status) {
        case CellStatus::Given:
            os << "given";
            break;
        case CellStatus::Blank:
            os << "blank";
            break;
        case CellStatus::Invalid:
            os << "invalid";
            break;
        case CellStatus::Correct:
            os << "correct";
            break;
        case CellStatus::Incorrect:
            os << "incorrect";
            break;
        default:
            os << "UnknownStatus";
            break;
    }
    return os;
}

struct WorksheetCell
{
    std::string raw;
    std::optional<double> value;
    CellStatus status = CellStatus::Blank;
    bool given = false;
};

bool operator==(const WorksheetCell& a, const WorksheetCell& b);
bool operator!=(const WorksheetCell& a, const WorksheetCell& b);

enum class RowRole
{
    Source,
    Load,
    Total
};

struct WorksheetRow
{
    std::string id;
    std::string label;
    RowRole role = RowRole::Load;
    std::array<WorksheetCell, 4> cells;

    const WorksheetCell& cell(MetricKey key) const
    {
        return cells[metricIndex(key)];
    }
};

/**
 * @class Worksheet
 * @brief Immutable snapshot of every cell plus the completion flag.
 */
class Worksheet
{
   public:
    const std::vector<WorksheetRow>& rows() const { return rowList; }

    const WorksheetRow* findRow(const std::string& rowId) const;

    /** @brief Cell at (row, key), or nullptr for an unknown row. */
    const WorksheetCell* cell(const std::string& rowId, MetricKey key) const;

    bool complete() const { return isComplete; }

    /** @brief Number of cells currently in `status`. */
    std::size_t countStatus(CellStatus status) const;

    friend bool operator==(const Worksheet& a, const Worksheet& b);

   private:
    friend class WorksheetGrader;

    std::vector<WorksheetRow> rowList;
    bool isComplete = false;
};

bool operator!=(const Worksheet& a, const Worksheet& b);

/**
 * @struct GradingTolerance
 * @brief Acceptance window of a numeric answer.
 *
 * If |expected| < nearZero the answer is accepted when |diff| <= absolute;
 * otherwise when |diff| / |expected| <= relative.
 */
struct GradingTolerance
{
    double relative = 0.01;
    double absolute = 1e-3;
    double nearZero = 1e-4;
};

/**
 * @brief Extract the first signed decimal or scientific numeral in `raw`.
 *
 * "12.5 V" -> 12.5, "I = -3e-2 A" -> -0.03.
 *
 * @throws InputParseError when no numeral is present or it overflows.
 */
double parseMetricInput(const std::string& raw);

bool withinTolerance(double expected, double actual,
                     const GradingTolerance& tolerance = GradingTolerance());

/**
 * @brief Text shown for a cell: the parsed value at the metric's display
 * precision, or the raw text when nothing parsed.
 */
std::string displayCell(const WorksheetCell& cell, MetricKey key);

/**
 * @class WorksheetGrader
 * @brief Reducer over Worksheet snapshots for one solved problem.
 */
class WorksheetGrader
{
   public:
    /**
     * @param problem Problem whose rows define the sheet layout.
     * @param attempt Solve outcome; on failure every cell lacks an expected
     *                value and grades incorrect.
     * @param tolerance Acceptance window.
     */
    WorksheetGrader(const PracticeProblem& problem, const SolveAttempt& attempt,
                    GradingTolerance tolerance = GradingTolerance());

    Worksheet baseline() const;

    Worksheet onCellEdit(const Worksheet& previous, const std::string& rowId,
                         MetricKey key, const std::string& raw) const;

    /** @brief Given or correct everywhere. */
    static bool computeComplete(const Worksheet& sheet);

    std::optional<double> expected(const std::string& rowId, MetricKey key) const;

    const GradingTolerance& tolerance() const { return window; }

   private:
    struct RowSpec
    {
        std::string id;
        std::string label;
        RowRole role;
        PartialWireMetrics givens;
    };

    WorksheetCell gradeCell(const std::string& rowId, MetricKey key,
                            const std::string& raw) const;

    std::vector<RowSpec> layout;
    std::map<std::string, WireMetrics> expectedValues;
    GradingTolerance window;
};
