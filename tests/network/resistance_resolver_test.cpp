#include <gtest/gtest.h>

#include "PracticeErrors.hpp"
#include "ResistanceResolver.hpp"
#include "TestProblems.hpp"

/*
 * resistance_resolver_test.cpp
 *
 * Unit tests for ResistanceResolver.
 *
 * These tests exercise:
 *  - series sums, parallel reciprocals and a nested combination
 *  - the per-solve cache (each node reduced at most once)
 *  - MissingDataError for a load without resistance
 *  - rejection of a zero-ohm parallel branch
 */

TEST(ResistanceResolver, SeriesSum)
{
  PracticeProblem p = seriesProblem(12.0, {10, 20, 30});
  ComponentMap map = createComponentMap(p);
  ResistanceResolver resolver(p.network, map);
  EXPECT_NEAR(resolver.total(), 60.0, 1e-12);
}

TEST(ResistanceResolver, ParallelReciprocal)
{
  PracticeProblem p = parallelProblem(10.0, {100, 100});
  ComponentMap map = createComponentMap(p);
  ResistanceResolver resolver(p.network, map);
  EXPECT_NEAR(resolver.total(), 50.0, 1e-12);
}

TEST(ResistanceResolver, NestedCombination)
{
  PracticeProblem p = comboProblem();
  ComponentMap map = createComponentMap(p);
  ResistanceResolver resolver(p.network, map);
  EXPECT_NEAR(resolver.total(), 275.0, 1e-9);

  NodeIndex branch = p.network.node(p.network.root()).children()[1];
  EXPECT_NEAR(resolver.resolve(branch), 100.0, 1e-9);
}

TEST(ResistanceResolver, EachNodeReducedOnce)
{
  PracticeProblem p = comboProblem();
  ComponentMap map = createComponentMap(p);
  ResistanceResolver resolver(p.network, map);

  resolver.total();
  std::size_t first = resolver.evaluations();
  EXPECT_EQ(first, p.network.size());

  resolver.total();
  for (std::size_t i = 0; i < p.network.size(); ++i) resolver.resolve(i);
  EXPECT_EQ(resolver.evaluations(), first);
}

TEST(ResistanceResolver, MissingResistanceThrows)
{
  PracticeProblem p = seriesProblem(12.0, {10, 20});
  p.components[1].givens.erase(MetricKey::Resistance);
  ComponentMap map = createComponentMap(p);
  ResistanceResolver resolver(p.network, map);
  EXPECT_THROW(resolver.total(), MissingDataError);
}

TEST(ResistanceResolver, HiddenResistanceIsUsed)
{
  PracticeProblem p = seriesProblem(12.0, {10, 20});
  p.components[1].givens.erase(MetricKey::Resistance);
  p.components[1].values.set(MetricKey::Resistance, 50.0);
  ComponentMap map = createComponentMap(p);
  ResistanceResolver resolver(p.network, map);
  EXPECT_NEAR(resolver.total(), 60.0, 1e-12);
}

TEST(ResistanceResolver, ZeroOhmParallelBranchRejected)
{
  PracticeProblem p = parallelProblem(10.0, {100, 0.0});
  ComponentMap map = createComponentMap(p);
  ResistanceResolver resolver(p.network, map);
  EXPECT_THROW(resolver.total(), MissingDataError);
}
