#include <gtest/gtest.h>

#include "CircuitNetwork.hpp"
#include "PracticeSolver.hpp"
#include "ProblemParser.hpp"
#include "TestProblems.hpp"

#include <stdexcept>
#include <string>

/*
 * practice_solver_test.cpp
 *
 * Unit tests for solvePracticeProblem(...) and its non-throwing boundary
 * trySolvePracticeProblem(...).
 *
 * These tests exercise:
 *  - series, parallel and combination solves (totals, source and loads)
 *  - a problem driven by the totals row instead of the source voltage
 *  - tagged failures: missing data, inconsistent authored values, no network,
 *    a load left out of the network
 *  - the warning written to stderr when a solve fails
 *  - row lookup, the target value and the flow scale
 *  - every shipped catalog problem: repeat solves agree exactly, each load
 *    obeys Ohm's law and the group sums add up to the totals
 */

namespace
{
// Current through and voltage across a subtree, rebuilt from the leaf rows.
// Series children must share one current, parallel children one voltage.
WireMetrics subtreeFlow(const CircuitNetwork& net, NodeIndex index,
                        const SolveResult& r)
{
  const CircuitNode& node = net.node(index);
  if (node.kind() == NodeKind::Component) return r.components.at(node.id());

  WireMetrics flow;
  bool first = true;
  for (NodeIndex child : node.children()) {
    WireMetrics c = subtreeFlow(net, child, r);
    if (node.kind() == NodeKind::Series) {
      if (!first)
        EXPECT_TRUE(nearlyEqual(c.current, flow.current)) << node.id();
      flow.current = c.current;
      flow.voltage = first ? c.voltage : flow.voltage + c.voltage;
    } else {
      if (!first)
        EXPECT_TRUE(nearlyEqual(c.voltage, flow.voltage)) << node.id();
      flow.voltage = c.voltage;
      flow.current = first ? c.current : flow.current + c.current;
    }
    first = false;
  }
  return flow;
}
}  // namespace

TEST(PracticeSolver, SeriesCurrent)
{
  PracticeProblem p = seriesProblem(12.0, {10, 20, 30});
  SolveResult r = solvePracticeProblem(p);

  EXPECT_NEAR(r.equivalentResistance, 60.0, 1e-12);
  EXPECT_NEAR(r.totals.current, 0.2, 1e-12);
  EXPECT_NEAR(r.totals.watts, 2.4, 1e-12);
  EXPECT_EQ(r.source, r.totals);
  ASSERT_EQ(r.components.size(), 3u);
  EXPECT_NEAR(r.components.at("R3").voltage, 6.0, 1e-12);
}

TEST(PracticeSolver, ParallelTotals)
{
  PracticeProblem p = parallelProblem(18.0, {180, 90, 270});
  SolveResult r = solvePracticeProblem(p);

  EXPECT_NEAR(r.totals.resistance, 49.0909090909, 1e-6);
  EXPECT_NEAR(r.totals.current, 0.3666666667, 1e-9);
  EXPECT_NEAR(r.components.at("R2").current, 0.2, 1e-12);
}

TEST(PracticeSolver, CombinationBranch)
{
  PracticeProblem p = comboProblem();
  SolveResult r = solvePracticeProblem(p);

  double total = 30.0 / 275.0;
  EXPECT_NEAR(r.totals.current, total, 1e-12);
  EXPECT_NEAR(r.components.at("R2").current, total * 2.0 / 3.0, 1e-12);
  EXPECT_NEAR(r.components.at("R3").current, total / 3.0, 1e-12);

  std::optional<double> target = targetValue(r, p);
  ASSERT_TRUE(target.has_value());
  EXPECT_NEAR(*target, 0.0727272727, 1e-9);
}

TEST(PracticeSolver, TotalsRowCanDriveTheCircuit)
{
  PracticeProblem p = seriesProblem(12.0, {10, 20, 30});
  p.source.givens.erase(MetricKey::Voltage);
  p.totalsGivens.set(MetricKey::Current, 0.5);

  SolveResult r = solvePracticeProblem(p);
  EXPECT_NEAR(r.totals.voltage, 30.0, 1e-12);
  EXPECT_NEAR(r.components.at("R1").voltage, 5.0, 1e-12);
}

TEST(PracticeSolver, MissingDriveIsMissingData)
{
  PracticeProblem p = seriesProblem(12.0, {10, 20});
  p.source.givens.erase(MetricKey::Voltage);
  EXPECT_THROW(solvePracticeProblem(p), MissingDataError);
}

TEST(PracticeSolver, ContradictingSourceIsInconsistent)
{
  PracticeProblem p = seriesProblem(12.0, {10, 20, 30});
  p.source.givens.set(MetricKey::Current, 1.0);
  EXPECT_THROW(solvePracticeProblem(p), InconsistentDataError);
}

TEST(PracticeSolver, ContradictingTotalsIsInconsistent)
{
  PracticeProblem p = seriesProblem(12.0, {10, 20, 30});
  p.totalsGivens.set(MetricKey::Resistance, 55.0);
  EXPECT_THROW(solvePracticeProblem(p), InconsistentDataError);
}

TEST(TrySolve, SuccessCarriesData)
{
  PracticeProblem p = seriesProblem(12.0, {10, 20, 30});
  SolveAttempt attempt = trySolvePracticeProblem(p);
  ASSERT_TRUE(attempt.ok());
  EXPECT_NEAR(attempt.data().totals.current, 0.2, 1e-12);
  EXPECT_THROW(attempt.error(), std::logic_error);
}

TEST(TrySolve, FailureIsTaggedAndLogged)
{
  PracticeProblem p = seriesProblem(12.0, {10, 20});
  p.components[0].givens.erase(MetricKey::Resistance);

  testing::internal::CaptureStderr();
  SolveAttempt attempt = trySolvePracticeProblem(p);
  std::string err = testing::internal::GetCapturedStderr();

  ASSERT_FALSE(attempt.ok());
  EXPECT_EQ(attempt.error().kind, SolveErrorKind::MissingData);
  EXPECT_NE(attempt.error().message.find("R1"), std::string::npos);
  EXPECT_NE(err.find("Warning: [PracticeSolver]"), std::string::npos);
  EXPECT_NE(err.find("series-test"), std::string::npos);
  EXPECT_THROW(attempt.data(), std::logic_error);
}

TEST(TrySolve, NoNetworkIsMissingData)
{
  PracticeProblem p = makeProblem("empty", 12.0, {10});

  testing::internal::CaptureStderr();
  SolveAttempt attempt = trySolvePracticeProblem(p);
  testing::internal::GetCapturedStderr();

  ASSERT_FALSE(attempt.ok());
  EXPECT_EQ(attempt.error().kind, SolveErrorKind::MissingData);
}

TEST(PracticeSolver, RowLookupAndFlowScale)
{
  PracticeProblem p = parallelProblem(24.0, {100, 200});
  SolveResult r = solvePracticeProblem(p);

  EXPECT_TRUE(rowMetrics(r, p, TOTALS_ROW_ID).has_value());
  EXPECT_TRUE(rowMetrics(r, p, "src").has_value());
  EXPECT_TRUE(rowMetrics(r, p, "R2").has_value());
  EXPECT_FALSE(rowMetrics(r, p, "R9").has_value());

  std::map<std::string, double> scale = flowScale(r);
  EXPECT_NEAR(scale["R1"], 2.0 / 3.0, 1e-12);
  EXPECT_NEAR(scale["R2"], 1.0 / 3.0, 1e-12);
}

TEST(PracticeSolver, LoadOutsideNetworkIsMissingData)
{
  PracticeProblem p = makeProblem("orphan", 12.0, {10, 20, 30});
  NodeIndex r1 = p.network.addComponent("R1");
  NodeIndex r2 = p.network.addComponent("R2");
  p.network.setRoot(p.network.addSeries("main", {r1, r2}));

  EXPECT_THROW(solvePracticeProblem(p), MissingDataError);

  testing::internal::CaptureStderr();
  SolveAttempt attempt = trySolvePracticeProblem(p);
  std::string err = testing::internal::GetCapturedStderr();

  ASSERT_FALSE(attempt.ok());
  EXPECT_EQ(attempt.error().kind, SolveErrorKind::MissingData);
  EXPECT_NE(attempt.error().message.find("Load 'R3'"), std::string::npos);
  EXPECT_NE(err.find("orphan"), std::string::npos);
}

TEST(PracticeSolver, ShippedCatalogSolvesConsistently)
{
  ProblemParser parser;
  testing::internal::CaptureStderr();
  int errors =
      parser.parse(std::string(WIRE_TUTOR_PROBLEMS_DIR) + "/practice.prb");
  std::string err = testing::internal::GetCapturedStderr();
  ASSERT_EQ(errors, 0) << err;
  ASSERT_FALSE(parser.problems.empty());

  for (const PracticeProblem& p : parser.problems) {
    SCOPED_TRACE(p.id);
    SolveResult first = solvePracticeProblem(p);
    SolveResult second = solvePracticeProblem(p);

    EXPECT_EQ(first.equivalentResistance, second.equivalentResistance);
    EXPECT_EQ(first.totals, second.totals);
    EXPECT_EQ(first.source, second.source);
    EXPECT_TRUE(first.components == second.components);

    ASSERT_EQ(first.components.size(), p.components.size());
    for (const auto& entry : first.components)
      EXPECT_TRUE(isPhysicallyConsistent(entry.second)) << entry.first;
    EXPECT_TRUE(isPhysicallyConsistent(first.totals));

    WireMetrics root = subtreeFlow(p.network, p.network.root(), first);
    EXPECT_TRUE(nearlyEqual(root.current, first.totals.current));
    EXPECT_TRUE(nearlyEqual(root.voltage, first.totals.voltage));
  }
}
