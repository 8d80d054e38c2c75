#include <gtest/gtest.h>

#include "NodalCrossCheck.hpp"
#include "PracticeErrors.hpp"
#include "TestProblems.hpp"

#include <cmath>

/*
 * nodal_cross_check_test.cpp
 *
 * Unit tests for flattenNetwork(...) and crossCheckSolution(...).
 *
 * These tests exercise:
 *  - node numbering of flattened series, parallel and nested networks
 *  - agreement between the MNA solution and the tree propagation
 *  - detection of a tampered propagated solution
 *  - a flattening failure reported through the report message
 */

TEST(FlattenNetwork, SeriesCreatesInternalNodes)
{
  PracticeProblem p = seriesProblem(12.0, {10, 20, 30});
  NodalCircuit c = flattenNetwork(p);

  EXPECT_EQ(c.nodeCount, 4);
  ASSERT_EQ(c.branches.size(), 3u);
  EXPECT_EQ(c.branches[0].nodeA, 1);
  EXPECT_EQ(c.branches[0].nodeB, 2);
  EXPECT_EQ(c.branches[1].nodeA, 2);
  EXPECT_EQ(c.branches[1].nodeB, 3);
  EXPECT_EQ(c.branches[2].nodeA, 3);
  EXPECT_EQ(c.branches[2].nodeB, 0);
}

TEST(FlattenNetwork, ParallelSharesTerminals)
{
  PracticeProblem p = parallelProblem(12.0, {10, 20, 30});
  NodalCircuit c = flattenNetwork(p);

  EXPECT_EQ(c.nodeCount, 2);
  for (const auto& branch : c.branches) {
    EXPECT_EQ(branch.nodeA, 1);
    EXPECT_EQ(branch.nodeB, 0);
  }
}

TEST(FlattenNetwork, MissingResistanceThrows)
{
  PracticeProblem p = seriesProblem(12.0, {10, 20});
  p.components[0].givens.erase(MetricKey::Resistance);
  EXPECT_THROW(flattenNetwork(p), MissingDataError);
}

TEST(CrossCheck, SeriesAgrees)
{
  PracticeProblem p = seriesProblem(12.0, {10, 20, 30});
  SolveResult r = solvePracticeProblem(p);
  NodalCheckReport report = crossCheckSolution(p, r);

  ASSERT_TRUE(report.solved) << report.message;
  EXPECT_TRUE(report.consistent(1e-9));
  EXPECT_NEAR(report.sourceCurrent, 0.2, 1e-12);
  EXPECT_LT(report.residual, 1e-9);
  EXPECT_NEAR(report.nodeVoltages(1), 12.0, 1e-12);
  EXPECT_NEAR(report.nodeVoltages(3), 6.0, 1e-12);
}

TEST(CrossCheck, CombinationAgrees)
{
  PracticeProblem p = comboProblem();
  SolveResult r = solvePracticeProblem(p);
  NodalCheckReport report = crossCheckSolution(p, r);

  ASSERT_TRUE(report.solved) << report.message;
  EXPECT_TRUE(report.consistent(1e-9));
  EXPECT_NEAR(report.sourceCurrent, r.totals.current, 1e-12);
  EXPECT_NEAR(report.leafMetrics.at("R2").current,
              r.components.at("R2").current, 1e-12);
}

TEST(CrossCheck, TamperedSolutionDeviates)
{
  PracticeProblem p = comboProblem();
  SolveResult r = solvePracticeProblem(p);
  r.components["R3"].current *= 1.5;

  NodalCheckReport report = crossCheckSolution(p, r);
  ASSERT_TRUE(report.solved);
  EXPECT_FALSE(report.consistent());
  EXPECT_EQ(report.worstComponent, "R3");
  EXPECT_NEAR(report.maxCurrentDeviation, 1.0 / 3.0, 1e-9);
}

TEST(CrossCheck, FlatteningFailureIsReported)
{
  PracticeProblem p = seriesProblem(12.0, {10, 20});
  SolveResult r = solvePracticeProblem(p);
  p.components[1].givens.erase(MetricKey::Resistance);

  NodalCheckReport report = crossCheckSolution(p, r);
  EXPECT_FALSE(report.solved);
  EXPECT_FALSE(report.consistent());
  EXPECT_NE(report.message.find("R2"), std::string::npos);
}
