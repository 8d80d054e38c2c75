#include <gtest/gtest.h>

#include "PracticeErrors.hpp"
#include "WireMetrics.hpp"

#include <cmath>
#include <limits>
#include <string>

/*
 * wire_metrics_test.cpp
 *
 * Unit tests for the W.I.R.E. metrics calculator.
 *
 * These tests exercise:
 *  - every pair of known quantities resolving the full tuple
 *  - supplied values never being overwritten, and derivation records
 *  - MissingDataError for fewer than two values and for E = I = 0
 *  - non-finite values being dropped by PartialWireMetrics::set
 *  - metric key parsing and the display formatting contract
 */

namespace
{
PartialWireMetrics knownPair(MetricKey a, double va, MetricKey b, double vb)
{
  PartialWireMetrics known;
  known.set(a, va);
  known.set(b, vb);
  return known;
}

void expectTuple(const WireMetrics& m, double w, double i, double r, double e)
{
  EXPECT_NEAR(m.watts, w, 1e-9);
  EXPECT_NEAR(m.current, i, 1e-9);
  EXPECT_NEAR(m.resistance, r, 1e-9);
  EXPECT_NEAR(m.voltage, e, 1e-9);
}
}  // namespace

// 12 V across 4 ohm: I = 3 A, W = 36 W
TEST(SolveWireMetrics, ResolvesFromEveryPair)
{
  using K = MetricKey;
  expectTuple(solveWireMetrics(knownPair(K::Voltage, 12, K::Resistance, 4)).metrics,
              36, 3, 4, 12);
  expectTuple(solveWireMetrics(knownPair(K::Current, 3, K::Resistance, 4)).metrics,
              36, 3, 4, 12);
  expectTuple(solveWireMetrics(knownPair(K::Voltage, 12, K::Current, 3)).metrics,
              36, 3, 4, 12);
  expectTuple(solveWireMetrics(knownPair(K::Watts, 36, K::Resistance, 4)).metrics,
              36, 3, 4, 12);
  expectTuple(solveWireMetrics(knownPair(K::Watts, 36, K::Current, 3)).metrics,
              36, 3, 4, 12);
  expectTuple(solveWireMetrics(knownPair(K::Watts, 36, K::Voltage, 12)).metrics,
              36, 3, 4, 12);
}

TEST(SolveWireMetrics, SuppliedValuesAreNotDerived)
{
  SolvedWireMetrics solved = solveWireMetrics(
      knownPair(MetricKey::Voltage, 12, MetricKey::Resistance, 4));

  EXPECT_EQ(solved.derived.count(MetricKey::Voltage), 0u);
  EXPECT_EQ(solved.derived.count(MetricKey::Resistance), 0u);
  ASSERT_EQ(solved.derived.count(MetricKey::Current), 1u);
  EXPECT_EQ(solved.derived.at(MetricKey::Current).formula, "I = E / R");
  EXPECT_EQ(solved.derived.count(MetricKey::Watts), 1u);
}

TEST(SolveWireMetrics, AllFourKnownIsReturnedUnchanged)
{
  PartialWireMetrics known;
  known.set(MetricKey::Watts, 36);
  known.set(MetricKey::Current, 3);
  known.set(MetricKey::Resistance, 4);
  known.set(MetricKey::Voltage, 12);

  SolvedWireMetrics solved = solveWireMetrics(known);
  expectTuple(solved.metrics, 36, 3, 4, 12);
  EXPECT_TRUE(solved.derived.empty());
}

TEST(SolveWireMetrics, FewerThanTwoValuesThrows)
{
  PartialWireMetrics none;
  EXPECT_THROW(solveWireMetrics(none), MissingDataError);

  PartialWireMetrics one;
  one.set(MetricKey::Voltage, 5);
  EXPECT_THROW(solveWireMetrics(one), MissingDataError);
}

TEST(SolveWireMetrics, ZeroVoltageAndCurrentCannotResolve)
{
  PartialWireMetrics known =
      knownPair(MetricKey::Voltage, 0.0, MetricKey::Current, 0.0);
  try {
    solveWireMetrics(known);
    FAIL() << "expected MissingDataError";
  } catch (const MissingDataError& ex) {
    EXPECT_EQ(ex.kind(), SolveErrorKind::MissingData);
  }
}

TEST(PartialWireMetrics, NonFiniteValuesAreDropped)
{
  PartialWireMetrics m;
  m.set(MetricKey::Voltage, std::numeric_limits<double>::quiet_NaN());
  m.set(MetricKey::Current, std::numeric_limits<double>::infinity());
  EXPECT_TRUE(m.empty());
  EXPECT_THROW(m.get(MetricKey::Voltage), std::out_of_range);
}

TEST(PartialWireMetrics, MergeOverridesWin)
{
  PartialWireMetrics base;
  base.set(MetricKey::Voltage, 10);
  base.set(MetricKey::Resistance, 5);
  PartialWireMetrics over;
  over.set(MetricKey::Voltage, 20);

  PartialWireMetrics merged = mergeMetrics(base, over);
  EXPECT_DOUBLE_EQ(merged.get(MetricKey::Voltage), 20);
  EXPECT_DOUBLE_EQ(merged.get(MetricKey::Resistance), 5);
  EXPECT_EQ(merged.count(), 2u);
}

TEST(MetricKeys, ParsesNamesAndSymbols)
{
  MetricKey key = MetricKey::Watts;
  EXPECT_TRUE(parseMetricKey("e", key));
  EXPECT_EQ(key, MetricKey::Voltage);
  EXPECT_TRUE(parseMetricKey("Current", key));
  EXPECT_EQ(key, MetricKey::Current);
  EXPECT_TRUE(parseMetricKey("P", key));
  EXPECT_EQ(key, MetricKey::Watts);
  EXPECT_FALSE(parseMetricKey("X", key));

  EXPECT_EQ(metricSymbol(MetricKey::Voltage), "E");
  EXPECT_EQ(metricUnit(MetricKey::Current), "A");
  EXPECT_EQ(metricPrecision(MetricKey::Current), 3);
  EXPECT_EQ(metricPrecision(MetricKey::Resistance), 2);
}

TEST(MetricKeys, RejectsNonAsciiNames)
{
  MetricKey key = MetricKey::Watts;
  EXPECT_FALSE(parseMetricKey("\xCE\xA9", key));  // U+03A9 OHM in UTF-8
  EXPECT_FALSE(parseMetricKey("\xB5" "A", key));
  EXPECT_FALSE(parseMetricKey("volt\xFF", key));
}

TEST(Consistency, OhmAndPowerLaw)
{
  WireMetrics good{36, 3, 4, 12};
  EXPECT_TRUE(isPhysicallyConsistent(good));

  WireMetrics bad{36, 3, 4, 13};
  EXPECT_FALSE(isPhysicallyConsistent(bad, 1e-3));

  EXPECT_FALSE(nearlyEqual(std::nan(""), 1.0));
  EXPECT_TRUE(nearlyEqual(100.0, 100.05, 1e-3));
}

TEST(FormatNumber, CapsDecimalsByMagnitude)
{
  EXPECT_EQ(formatNumber(1234.567, 3), "1234.6");
  EXPECT_EQ(formatNumber(123.456, 3), "123.5");
  EXPECT_EQ(formatNumber(12.3456, 3), "12.35");
  EXPECT_EQ(formatNumber(0.087273, 3), "0.087");
  EXPECT_EQ(formatNumber(5.0, 2), "5.00");
}

TEST(FormatNumber, NonFiniteIsDash)
{
  EXPECT_EQ(formatNumber(std::numeric_limits<double>::infinity()), "-");
  EXPECT_EQ(formatMetricValue(std::nan(""), MetricKey::Voltage), "-");
  EXPECT_EQ(formatMetricValue(12.0, MetricKey::Voltage), "12.00 V");
  EXPECT_EQ(formatMetricNumber(0.04, MetricKey::Current), "0.040");
}
