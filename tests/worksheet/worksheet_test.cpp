#include <gtest/gtest.h>

#include "PracticeErrors.hpp"
#include "TestProblems.hpp"
#include "Worksheet.hpp"

#include <string>

/*
 * worksheet_test.cpp
 *
 * Unit tests for the worksheet grading engine.
 *
 * These tests exercise:
 *  - numeral extraction from free text (units, signs, exponents)
 *  - the relative and near-zero absolute tolerance branches
 *  - baseline layout: source, loads, totals; given cells seeded and locked
 *  - the edit reducer: blank / invalid / correct / incorrect, one cell only
 *  - completion tracking and grading after a failed solve
 */

namespace
{
// 24 V across two 100 ohm loads: each load drops 12 V at 0.12 A.
PracticeProblem twelveVoltProblem()
{
  return seriesProblem(24.0, {100, 100});
}

void fillAll(const WorksheetGrader& grader, Worksheet& sheet,
             const SolveResult& result, const PracticeProblem& problem)
{
  for (const auto& row : sheet.rows()) {
    std::optional<WireMetrics> expected = rowMetrics(result, problem, row.id);
    ASSERT_TRUE(expected.has_value());
    for (MetricKey key : METRIC_ORDER) {
      if (row.cell(key).given) continue;
      sheet = grader.onCellEdit(sheet, row.id, key,
                                std::to_string(expected->get(key)));
    }
  }
}
}  // namespace

TEST(ParseMetricInput, ExtractsFirstNumeral)
{
  EXPECT_DOUBLE_EQ(parseMetricInput("12.5 V"), 12.5);
  EXPECT_DOUBLE_EQ(parseMetricInput("  -3"), -3.0);
  EXPECT_DOUBLE_EQ(parseMetricInput("I = 2.5e-3 A"), 2.5e-3);
  EXPECT_DOUBLE_EQ(parseMetricInput(".5"), 0.5);
  EXPECT_DOUBLE_EQ(parseMetricInput("about 7 or 8"), 7.0);
}

TEST(ParseMetricInput, NoNumeralThrows)
{
  EXPECT_THROW(parseMetricInput("abc"), InputParseError);
  EXPECT_THROW(parseMetricInput(""), InputParseError);
  EXPECT_THROW(parseMetricInput("1e999"), InputParseError);
}

TEST(WithinTolerance, RelativeBranch)
{
  EXPECT_TRUE(withinTolerance(12.0, 12.11));
  EXPECT_FALSE(withinTolerance(12.0, 12.2));
  EXPECT_TRUE(withinTolerance(-5.0, -5.04));
}

TEST(WithinTolerance, NearZeroAbsoluteBranch)
{
  EXPECT_TRUE(withinTolerance(0.00003, 0.0009));
  EXPECT_FALSE(withinTolerance(0.00003, 0.002));
  EXPECT_TRUE(withinTolerance(0.0, 0.0));

  GradingTolerance strict;
  strict.absolute = 1e-6;
  EXPECT_FALSE(withinTolerance(0.00003, 0.0009, strict));
}

TEST(WorksheetGrader, BaselineLayout)
{
  PracticeProblem p = twelveVoltProblem();
  WorksheetGrader grader(p, trySolvePracticeProblem(p));
  Worksheet sheet = grader.baseline();

  ASSERT_EQ(sheet.rows().size(), 4u);
  EXPECT_EQ(sheet.rows()[0].id, "src");
  EXPECT_EQ(sheet.rows()[0].role, RowRole::Source);
  EXPECT_EQ(sheet.rows()[1].id, "R1");
  EXPECT_EQ(sheet.rows()[3].id, TOTALS_ROW_ID);
  EXPECT_EQ(sheet.rows()[3].label, "Totals");
  EXPECT_EQ(sheet.rows()[3].role, RowRole::Total);

  const WorksheetCell* given = sheet.cell("R1", MetricKey::Resistance);
  ASSERT_NE(given, nullptr);
  EXPECT_TRUE(given->given);
  EXPECT_EQ(given->status, CellStatus::Given);
  EXPECT_EQ(given->raw, "100.0");

  const WorksheetCell* source = sheet.cell("src", MetricKey::Voltage);
  ASSERT_NE(source, nullptr);
  EXPECT_EQ(source->raw, "24.00");

  EXPECT_EQ(sheet.cell("R1", MetricKey::Voltage)->status, CellStatus::Blank);
  EXPECT_EQ(sheet.cell("R9", MetricKey::Voltage), nullptr);
  EXPECT_EQ(sheet.countStatus(CellStatus::Given), 3u);
  EXPECT_EQ(sheet.countStatus(CellStatus::Blank), 13u);
  EXPECT_FALSE(sheet.complete());
}

TEST(WorksheetGrader, GradesEdits)
{
  PracticeProblem p = twelveVoltProblem();
  WorksheetGrader grader(p, trySolvePracticeProblem(p));
  Worksheet sheet = grader.baseline();

  sheet = grader.onCellEdit(sheet, "R1", MetricKey::Voltage, "12.11");
  EXPECT_EQ(sheet.cell("R1", MetricKey::Voltage)->status, CellStatus::Correct);

  sheet = grader.onCellEdit(sheet, "R1", MetricKey::Voltage, "12.2");
  EXPECT_EQ(sheet.cell("R1", MetricKey::Voltage)->status,
            CellStatus::Incorrect);

  sheet = grader.onCellEdit(sheet, "R1", MetricKey::Voltage, "abc");
  EXPECT_EQ(sheet.cell("R1", MetricKey::Voltage)->status, CellStatus::Invalid);
  EXPECT_FALSE(sheet.cell("R1", MetricKey::Voltage)->value.has_value());
  EXPECT_EQ(displayCell(*sheet.cell("R1", MetricKey::Voltage),
                        MetricKey::Voltage),
            "abc");

  sheet = grader.onCellEdit(sheet, "R1", MetricKey::Voltage, "");
  EXPECT_EQ(sheet.cell("R1", MetricKey::Voltage)->status, CellStatus::Blank);

  sheet = grader.onCellEdit(sheet, "R1", MetricKey::Current, "0.12 A");
  const WorksheetCell* current = sheet.cell("R1", MetricKey::Current);
  EXPECT_EQ(current->status, CellStatus::Correct);
  EXPECT_EQ(current->raw, "0.12 A");
  EXPECT_EQ(displayCell(*current, MetricKey::Current), "0.120");
}

TEST(WorksheetGrader, EditTouchesOneCellOnly)
{
  PracticeProblem p = twelveVoltProblem();
  WorksheetGrader grader(p, trySolvePracticeProblem(p));
  Worksheet before = grader.baseline();
  Worksheet after = grader.onCellEdit(before, "R2", MetricKey::Watts, "1.44");

  EXPECT_NE(before, after);
  EXPECT_EQ(before.cell("R2", MetricKey::Watts)->status, CellStatus::Blank);
  for (size_t r = 0; r < before.rows().size(); ++r) {
    for (MetricKey key : METRIC_ORDER) {
      if (before.rows()[r].id == "R2" && key == MetricKey::Watts) continue;
      EXPECT_EQ(before.rows()[r].cell(key), after.rows()[r].cell(key));
    }
  }
}

TEST(WorksheetGrader, GivenCellsAndUnknownRowsAreIgnored)
{
  PracticeProblem p = twelveVoltProblem();
  WorksheetGrader grader(p, trySolvePracticeProblem(p));
  Worksheet sheet = grader.baseline();

  EXPECT_EQ(grader.onCellEdit(sheet, "R1", MetricKey::Resistance, "5"), sheet);
  EXPECT_EQ(grader.onCellEdit(sheet, "nope", MetricKey::Voltage, "5"), sheet);
}

TEST(WorksheetGrader, CompletesWhenEveryOpenCellIsCorrect)
{
  PracticeProblem p = twelveVoltProblem();
  SolveAttempt attempt = trySolvePracticeProblem(p);
  ASSERT_TRUE(attempt.ok());
  WorksheetGrader grader(p, attempt);
  Worksheet sheet = grader.baseline();

  fillAll(grader, sheet, attempt.data(), p);
  EXPECT_TRUE(sheet.complete());
  EXPECT_TRUE(WorksheetGrader::computeComplete(sheet));

  sheet = grader.onCellEdit(sheet, TOTALS_ROW_ID, MetricKey::Watts, "99");
  EXPECT_FALSE(sheet.complete());
}

TEST(WorksheetGrader, FailedSolveGradesIncorrect)
{
  PracticeProblem p = twelveVoltProblem();
  p.components[0].givens.erase(MetricKey::Resistance);

  testing::internal::CaptureStderr();
  SolveAttempt attempt = trySolvePracticeProblem(p);
  testing::internal::GetCapturedStderr();
  ASSERT_FALSE(attempt.ok());

  WorksheetGrader grader(p, attempt);
  Worksheet sheet = grader.baseline();
  EXPECT_FALSE(grader.expected("R2", MetricKey::Voltage).has_value());

  const WorksheetCell* given = sheet.cell("src", MetricKey::Voltage);
  EXPECT_TRUE(given->given);
  EXPECT_TRUE(given->raw.empty());

  sheet = grader.onCellEdit(sheet, "R2", MetricKey::Voltage, "12");
  EXPECT_EQ(sheet.cell("R2", MetricKey::Voltage)->status,
            CellStatus::Incorrect);
  EXPECT_FALSE(sheet.complete());
}

TEST(WorksheetGrader, CustomToleranceWindow)
{
  PracticeProblem p = twelveVoltProblem();
  GradingTolerance loose;
  loose.relative = 0.05;
  WorksheetGrader grader(p, trySolvePracticeProblem(p), loose);

  Worksheet sheet =
      grader.onCellEdit(grader.baseline(), "R1", MetricKey::Voltage, "12.5");
  EXPECT_EQ(sheet.cell("R1", MetricKey::Voltage)->status, CellStatus::Correct);
  EXPECT_DOUBLE_EQ(grader.tolerance().relative, 0.05);
}
