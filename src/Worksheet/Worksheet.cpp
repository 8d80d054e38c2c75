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
 * @file Worksheet.cpp
 * @brief Worksheet snapshots, numeral extraction and tolerance grading.
 *
 * The reducer copies the previous snapshot, replaces exactly one cell and
 * recomputes the completion flag; no other cell is regraded.
 */

#include "Worksheet.hpp"

#include <cmath>
#include <regex>
#include <stdexcept>

#include "PracticeErrors.hpp"

bool operator==(const WorksheetCell& a, const WorksheetCell& b)
{
    return a.raw == b.raw && a.value == b.value && a.status == b.status &&
           a.given == b.given;
}

bool operator!=(const WorksheetCell& a, const WorksheetCell& b)
{
    return !(a == b);
}

const WorksheetRow* Worksheet::findRow(const std::string& rowId) const
{
    for (const auto& row : rowList) {
        if (row.id == rowId) return &row;
    }
    return nullptr;
}

const WorksheetCell* Worksheet::cell(const std::string& rowId,
                                     MetricKey key) const
{
    const WorksheetRow* row = findRow(rowId);
    return row ? &row->cell(key) : nullptr;
}

std::size_t Worksheet::countStatus(CellStatus status) const
{
    std::size_t n = 0;
    for (const auto& row : rowList)
        for (const auto& c : row.cells)
            if (c.status == status) ++n;
    return n;
}

bool operator==(const Worksheet& a, const Worksheet& b)
{
    if (a.isComplete != b.isComplete || a.rowList.size() != b.rowList.size())
        return false;
    for (size_t i = 0; i < a.rowList.size(); ++i) {
        const WorksheetRow& ra = a.rowList[i];
        const WorksheetRow& rb = b.rowList[i];
        if (ra.id != rb.id || ra.label != rb.label || ra.role != rb.role ||
            ra.cells != rb.cells)
            return false;
    }
    return true;
}

bool operator!=(const Worksheet& a, const Worksheet& b) { return !(a == b); }

double parseMetricInput(const std::string& raw)
{
    static const std::regex numeral(R"([-+]?\d*\.?\d+(?:[eE][-+]?\d+)?)");

    std::smatch match;
    if (!std::regex_search(raw, match, numeral))
        throw InputParseError("No numeric value in '" + raw + "'");

    try {
        double value = std::stod(match.str());
        if (!std::isfinite(value))
            throw InputParseError("Numeric value out of range in '" + raw + "'");
        return value;
    } catch (const std::out_of_range&) {
        throw InputParseError("Numeric value out of range in '" + raw + "'");
    } catch (const std::invalid_argument&) {
        throw InputParseError("No numeric value in '" + raw + "'");
    }
}

bool withinTolerance(double expected, double actual,
                     const GradingTolerance& tolerance)
{
    double absoluteExpected = std::fabs(expected);
    double absoluteDiff = std::fabs(expected - actual);
    if (absoluteExpected < tolerance.nearZero)
        return absoluteDiff <= tolerance.absolute;
    return absoluteDiff / absoluteExpected <= tolerance.relative;
}

std::string displayCell(const WorksheetCell& cell, MetricKey key)
{
    if (cell.value) return formatMetricNumber(*cell.value, key);
    return cell.raw;
}

WorksheetGrader::WorksheetGrader(const PracticeProblem& problem,
                                 const SolveAttempt& attempt,
                                 GradingTolerance tolerance)
    : window(tolerance)
{
    layout.push_back(RowSpec{problem.source.id, problem.source.label,
                             RowRole::Source, problem.source.givens});
    for (const auto& component : problem.components) {
        layout.push_back(RowSpec{component.id, component.label, RowRole::Load,
                                 component.givens});
    }
    layout.push_back(RowSpec{TOTALS_ROW_ID, "Totals", RowRole::Total,
                             problem.totalsGivens});

    if (!attempt.ok()) return;
    const SolveResult& result = attempt.data();
    for (const auto& rowSpec : layout) {
        if (auto metrics = rowMetrics(result, problem, rowSpec.id))
            expectedValues[rowSpec.id] = *metrics;
    }
}

std::optional<double> WorksheetGrader::expected(const std::string& rowId,
                                                MetricKey key) const
{
    auto it = expectedValues.find(rowId);
    if (it == expectedValues.end()) return std::nullopt;
    return it->second.get(key);
}

Worksheet WorksheetGrader::baseline() const
{
    Worksheet sheet;
    for (const auto& rowSpec : layout) {
        WorksheetRow row;
        row.id = rowSpec.id;
        row.label = rowSpec.label.empty() ? rowSpec.id : rowSpec.label;
        row.role = rowSpec.role;
        for (MetricKey key : METRIC_ORDER) {
            WorksheetCell& c = row.cells[metricIndex(key)];
            c.given = rowSpec.givens.has(key);
            c.status = c.given ? CellStatus::Given : CellStatus::Blank;
            std::optional<double> value = expected(rowSpec.id, key);
            if (c.given && value && std::isfinite(*value)) {
                c.raw = formatMetricNumber(*value, key);
                c.value = *value;
            }
        }
        sheet.rowList.push_back(row);
    }
    sheet.isComplete = computeComplete(sheet);
    return sheet;
}

WorksheetCell WorksheetGrader::gradeCell(const std::string& rowId,
                                         MetricKey key,
                                         const std::string& raw) const
{
    WorksheetCell c;
    c.raw = raw;

    if (raw.find_first_not_of(" \t\r\n") == std::string::npos) {
        c.status = CellStatus::Blank;
        return c;
    }

    double parsed = 0.0;
    try {
        parsed = parseMetricInput(raw);
    } catch (const InputParseError&) {
        c.status = CellStatus::Invalid;
        return c;
    }

    c.value = parsed;
    std::optional<double> want = expected(rowId, key);
    c.status = want && withinTolerance(*want, parsed, window)
                   ? CellStatus::Correct
                   : CellStatus::Incorrect;
    return c;
}

Worksheet WorksheetGrader::onCellEdit(const Worksheet& previous,
                                      const std::string& rowId, MetricKey key,
                                      const std::string& raw) const
{
    const WorksheetRow* row = previous.findRow(rowId);
    if (row == nullptr || row->cell(key).given) return previous;

    Worksheet next = previous;
    for (auto& r : next.rowList) {
        if (r.id == rowId) {
            r.cells[metricIndex(key)] = gradeCell(rowId, key, raw);
            break;
        }
    }
    next.isComplete = computeComplete(next);
    return next;
}

bool WorksheetGrader::computeComplete(const Worksheet& sheet)
{
    for (const auto& row : sheet.rowList) {
        for (const auto& c : row.cells) {
            if (c.given) continue;
            if (c.status != CellStatus::Correct) return false;
        }
    }
    return true;
}
