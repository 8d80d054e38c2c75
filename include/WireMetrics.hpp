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
 * @file WireMetrics.hpp
 * @brief W.I.R.E. quantities and the electrical metrics calculator.
 *
 * A circuit element's electrical state is described by four quantities:
 * power (Watts), current (I), Resistance and voltage (E). This header defines
 * the fully resolved tuple (`WireMetrics`), the partially known set
 * (`PartialWireMetrics`) and `solveWireMetrics()`, the small constraint solver
 * that derives the missing quantities from Ohm's law (E = I * R) and the power
 * law (W = E * I).
 *
 * It also owns the numeric display contract: every metric has a fixed
 * precision and unit shared by seeded worksheet values and echoed learner
 * input (see `formatMetricNumber`).
 *
 * Example:
 * @code
 * PartialWireMetrics known;
 * known.set(MetricKey::Voltage, 12.0);
 * known.set(MetricKey::Resistance, 4.0);
 * SolvedWireMetrics solved = solveWireMetrics(known);
 * // solved.metrics.current == 3.0, solved.metrics.watts == 36.0
 * @endcode
 */

#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

/**
 * @enum MetricKey
 * @brief One column of the W.I.R.E. worksheet.
 */
enum class MetricKey
{
    Watts,      /**< Power in watts */
    Current,    /**< Current in amperes */
    Resistance, /**< Resistance in ohms */
    Voltage     /**< Voltage (E) in volts */
};

/** @brief Worksheet column order: W, I, R, E. */
constexpr std::array<MetricKey, 4> METRIC_ORDER = {
    MetricKey::Watts, MetricKey::Current, MetricKey::Resistance,
    MetricKey::Voltage};

inline std::ostream& operator<<(std::ostream& os, MetricKey key)
{
    switch (key) {
        case MetricKey::Watts:
            os << "watts";
            break;
        case MetricKey::Current:
            os << "current";
            break;
        case MetricKey::Resistance:
            os << "resistance";
            break;
        case MetricKey::Voltage:
            os << "voltage";
            break;
        default:
            os << "UnknownMetric";
            break;
    }
    return os;
}

/** @brief Position of `key` inside METRIC_ORDER (and inside cell arrays). */
std::size_t metricIndex(MetricKey key);

/** @brief Column symbol: "W", "I", "R" or "E". */
std::string metricSymbol(MetricKey key);

/** @brief Display unit: "W", "A", "Ω" or "V". */
std::string metricUnit(MetricKey key);

/** @brief Fixed display precision (decimals) of a metric column. */
int metricPrecision(MetricKey key);

/**
 * @brief Parse a metric name or symbol, case-insensitively.
 *
 * Accepted spellings: W, P, WATTS, POWER / I, CURRENT / R, RESISTANCE /
 * E, V, VOLTAGE.
 *
 * @param text Token to interpret.
 * @param[out] key Set to the matching metric on success.
 * @return True when the token names a metric.
 */
bool parseMetricKey(const std::string& text, MetricKey& key);

/**
 * @struct WireMetrics
 * @brief Fully resolved (W, I, R, E) tuple for one circuit element.
 */
struct WireMetrics
{
    double watts = 0.0;
    double current = 0.0;
    double resistance = 0.0;
    double voltage = 0.0;

    double get(MetricKey key) const;
};

bool operator==(const WireMetrics& a, const WireMetrics& b);
bool operator!=(const WireMetrics& a, const WireMetrics& b);

/**
 * @class PartialWireMetrics
 * @brief Zero to four known quantities.
 *
 * Non-finite values are silently dropped by `set()` so that a partially
 * authored record can never carry NaN or infinity into the solver.
 */
class PartialWireMetrics
{
   public:
    PartialWireMetrics() = default;

    bool has(MetricKey key) const;
    std::optional<double> find(MetricKey key) const;

    /**
     * @brief Value of a known quantity.
     * @throws std::out_of_range when `key` is not known.
     */
    double get(MetricKey key) const;

    void set(MetricKey key, double value);
    void erase(MetricKey key);

    std::size_t count() const;
    bool empty() const { return count() == 0; }

   private:
    std::array<std::optional<double>, 4> values;
};

/**
 * @brief Layer `overrides` over `base`; keys known in `overrides` win.
 */
PartialWireMetrics mergeMetrics(const PartialWireMetrics& base,
                                const PartialWireMetrics& overrides);

/** @brief Wrap a fully resolved tuple as a partial set with all four keys. */
PartialWireMetrics toPartial(const WireMetrics& metrics);

/**
 * @struct Derivation
 * @brief How a quantity was derived by `solveWireMetrics()`.
 */
struct Derivation
{
    std::string formula;           /**< e.g. "I = E / R" */
    std::vector<MetricKey> inputs; /**< quantities the formula consumed */
};

/**
 * @struct SolvedWireMetrics
 * @brief Result of the metrics calculator: the tuple plus its derivations.
 *
 * Keys supplied by the caller never appear in `derived`.
 */
struct SolvedWireMetrics
{
    WireMetrics metrics;
    std::map<MetricKey, Derivation> derived;
};

/**
 * @brief Derive the full W.I.R.E. tuple from a partial set.
 *
 * Applies Ohm's law and the power law in all their rearrangements until no
 * further quantity can be derived (at most `maxIterations` passes). Supplied
 * quantities take precedence and are never overwritten. Divisions by
 * magnitudes at or below `tolerance` are skipped.
 *
 * @param input Known quantities.
 * @param tolerance Smallest divisor magnitude considered non-zero.
 * @param maxIterations Upper bound on derivation passes.
 * @return The resolved tuple with derivation records.
 * @throws MissingDataError when fewer than two quantities are known, or the
 *         known ones cannot pin down the remaining quantities.
 */
SolvedWireMetrics solveWireMetrics(const PartialWireMetrics& input,
                                   double tolerance = 1e-9,
                                   int maxIterations = 16);

/**
 * @brief True when `a` and `b` agree within `relTol` relative to the larger
 * magnitude. Differences below 1e-12 always compare equal; non-finite values
 * never do.
 */
bool nearlyEqual(double a, double b, double relTol = 1e-9);

/**
 * @brief Check E = I * R and W = E * I within `relTol`.
 */
bool isPhysicallyConsistent(const WireMetrics& metrics, double relTol = 1e-9);

/**
 * @brief Format a number the way the worksheet displays it.
 *
 * Magnitudes >= 1000 use one decimal, >= 100 at most one, >= 10 at most two,
 * otherwise `digits`. Non-finite values format as "-".
 */
std::string formatNumber(double value, int digits = 2);

/** @brief `formatNumber` at the metric's fixed precision, without unit. */
std::string formatMetricNumber(double value, MetricKey key);

/** @brief `formatMetricNumber` followed by a space and the unit. */
std::string formatMetricValue(double value, MetricKey key);

std::ostream& operator<<(std::ostream& os, const WireMetrics& metrics);
