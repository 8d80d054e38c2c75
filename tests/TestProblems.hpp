#pragma once

/*
 * TestProblems.hpp
 *
 * Small problem builders shared by the unit tests. Every builder wires the
 * loads R1..Rn under a single root group with id "main" and a source row
 * with id "src".
 */

#include <string>
#include <vector>

#include "PracticeProblem.hpp"

inline PracticeComponent makeLoad(const std::string& id, double resistance)
{
  PracticeComponent c;
  c.id = id;
  c.label = id;
  c.role = ComponentRole::Load;
  c.givens.set(MetricKey::Resistance, resistance);
  return c;
}

inline PracticeProblem makeProblem(const std::string& id, double volts,
                                   const std::vector<double>& resistances)
{
  PracticeProblem p;
  p.id = id;
  p.title = id;
  p.source.id = "src";
  p.source.label = "Source";
  p.source.role = ComponentRole::Source;
  p.source.givens.set(MetricKey::Voltage, volts);
  for (size_t i = 0; i < resistances.size(); ++i)
    p.components.push_back(
        makeLoad("R" + std::to_string(i + 1), resistances[i]));
  p.targetMetric = TargetMetric{TOTALS_ROW_ID, MetricKey::Current};
  return p;
}

inline PracticeProblem seriesProblem(double volts,
                                     const std::vector<double>& resistances)
{
  PracticeProblem p = makeProblem("series-test", volts, resistances);
  p.topology = PracticeTopology::Series;
  std::vector<NodeIndex> leaves;
  for (const auto& c : p.components)
    leaves.push_back(p.network.addComponent(c.id));
  p.network.setRoot(p.network.addSeries("main", leaves));
  return p;
}

inline PracticeProblem parallelProblem(double volts,
                                       const std::vector<double>& resistances)
{
  PracticeProblem p = makeProblem("parallel-test", volts, resistances);
  p.topology = PracticeTopology::Parallel;
  std::vector<NodeIndex> leaves;
  for (const auto& c : p.components)
    leaves.push_back(p.network.addComponent(c.id));
  p.network.setRoot(p.network.addParallel("main", leaves));
  return p;
}

// 30 V across R1=100 + (R2=150 || R3=300) + R4=75, i.e. 275 ohm total.
inline PracticeProblem comboProblem()
{
  PracticeProblem p = makeProblem("combo-test", 30.0, {100, 150, 300, 75});
  p.topology = PracticeTopology::Combination;
  NodeIndex r1 = p.network.addComponent("R1");
  NodeIndex r2 = p.network.addComponent("R2");
  NodeIndex r3 = p.network.addComponent("R3");
  NodeIndex r4 = p.network.addComponent("R4");
  NodeIndex branch = p.network.addParallel("branch", {r2, r3});
  p.network.setRoot(p.network.addSeries("main", {r1, branch, r4}));
  p.targetMetric = TargetMetric{"R2", MetricKey::Current};
  return p;
}
