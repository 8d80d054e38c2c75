#include <gtest/gtest.h>

#include "ProblemParser.hpp"
#include "ProblemValidator.hpp"
#include "TestProblems.hpp"

#include <sstream>
#include <string>

/*
 * problem_validator_test.cpp
 *
 * Unit tests for validateProblem(...) and validateSolved(...).
 *
 * These tests exercise:
 *  - every shipped catalog problem passing the audit
 *  - solve failures, unplaced loads and non-finite targets surfacing as
 *    errors
 *  - warnings for sheets with nothing to answer and for loads whose
 *    resistance the learner cannot see
 */

TEST(ProblemValidator, ShippedCatalogIsClean)
{
  ProblemParser parser;
  testing::internal::CaptureStderr();
  parser.parse(std::string(WIRE_TUTOR_PROBLEMS_DIR) + "/practice.prb");
  testing::internal::GetCapturedStderr();
  ASSERT_FALSE(parser.problems.empty());

  for (const auto& problem : parser.problems) {
    std::vector<ValidationIssue> issues = validateProblem(problem, 1e-9);
    EXPECT_FALSE(hasErrors(issues))
        << problem.id << ": " << firstError(issues);
    EXPECT_TRUE(issues.empty()) << problem.id;
  }
}

TEST(ProblemValidator, SolveFailureIsAnError)
{
  PracticeProblem p = seriesProblem(12.0, {10, 20});
  p.components[0].givens.erase(MetricKey::Resistance);

  testing::internal::CaptureStderr();
  std::vector<ValidationIssue> issues = validateProblem(p);
  testing::internal::GetCapturedStderr();

  ASSERT_TRUE(hasErrors(issues));
  EXPECT_EQ(firstError(issues).rfind("MissingDataError: ", 0), 0u);
}

TEST(ProblemValidator, UnplacedLoadIsAnError)
{
  PracticeProblem p = makeProblem("orphan", 12.0, {10, 20, 30});
  NodeIndex r1 = p.network.addComponent("R1");
  NodeIndex r2 = p.network.addComponent("R2");
  p.network.setRoot(p.network.addSeries("main", {r1, r2}));

  testing::internal::CaptureStderr();
  std::vector<ValidationIssue> issues = validateProblem(p);
  testing::internal::GetCapturedStderr();

  ASSERT_TRUE(hasErrors(issues));
  EXPECT_NE(firstError(issues).find("Load 'R3'"), std::string::npos);
}

TEST(ProblemValidator, UnknownTargetRowIsAnError)
{
  PracticeProblem p = seriesProblem(12.0, {10, 20});
  p.targetMetric = TargetMetric{"R7", MetricKey::Voltage};

  std::vector<ValidationIssue> issues = validateProblem(p);
  ASSERT_TRUE(hasErrors(issues));
  EXPECT_NE(firstError(issues).find("is not finite"), std::string::npos);
}

TEST(ProblemValidator, HiddenResistanceWarns)
{
  PracticeProblem p = seriesProblem(12.0, {10, 20});
  p.components[1].givens.erase(MetricKey::Resistance);
  p.components[1].values.set(MetricKey::Resistance, 20.0);

  std::vector<ValidationIssue> issues = validateProblem(p);
  EXPECT_FALSE(hasErrors(issues));
  ASSERT_EQ(issues.size(), 1u);
  EXPECT_EQ(issues[0].severity, IssueSeverity::Warning);
  EXPECT_EQ(issues[0].message,
            "Load 'R2' has no resistance visible to the learner");
}

TEST(ProblemValidator, FullyGivenSheetWarns)
{
  PracticeProblem p = seriesProblem(10.0, {10});
  SolveResult r = solvePracticeProblem(p);
  p.source.givens = toPartial(r.source);
  p.totalsGivens = toPartial(r.totals);
  p.components[0].givens = toPartial(r.components.at("R1"));

  std::vector<ValidationIssue> issues = validateSolved(p, trySolvePracticeProblem(p));
  EXPECT_FALSE(hasErrors(issues));
  ASSERT_EQ(issues.size(), 1u);
  EXPECT_EQ(issues[0].message, "Worksheet has no cells for the learner");
}

TEST(ProblemValidator, SeverityPrints)
{
  std::ostringstream oss;
  oss << IssueSeverity::Warning << " " << IssueSeverity::Error;
  EXPECT_EQ(oss.str(), "Warning Error");
  EXPECT_TRUE(firstError({}).empty());
}
