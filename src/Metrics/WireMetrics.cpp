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
 * @file WireMetrics.cpp
 * @brief Implementation of the W.I.R.E. metrics calculator and formatting.
 *
 * `solveWireMetrics()` runs a fixed-point loop over the twelve
 * rearrangements of Ohm's law and the power law. Each rule only fires for a
 * quantity that is still unknown, so supplied values are never overwritten
 * and the loop terminates as soon as a pass derives nothing new.
 */

#include "WireMetrics.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "PracticeErrors.hpp"

std::size_t metricIndex(MetricKey key)
{
    switch (key) {
        case MetricKey::Watts:
            return 0;
        case MetricKey::Current:
            return 1;
        case MetricKey::Resistance:
            return 2;
        case MetricKey::Voltage:
            return 3;
    }
    throw std::invalid_argument("Unknown metric key");
}

std::string metricSymbol(MetricKey key)
{
    switch (key) {
        case MetricKey::Watts:
            return "W";
        case MetricKey::Current:
            return "I";
        case MetricKey::Resistance:
            return "R";
        case MetricKey::Voltage:
            return "E";
    }
    return "?";
}

std::string metricUnit(MetricKey key)
{
    switch (key) {
        case MetricKey::Watts:
            return "W";
        case MetricKey::Current:
            return "A";
        case MetricKey::Resistance:
            return "Ω";
        case MetricKey::Voltage:
            return "V";
    }
    return "";
}

int metricPrecision(MetricKey key)
{
    // Current is usually fractional (mA range) so it keeps one extra digit.
    switch (key) {
        case MetricKey::Current:
            return 3;
        case MetricKey::Watts:
        case MetricKey::Resistance:
        case MetricKey::Voltage:
            return 2;
    }
    return 2;
}

bool parseMetricKey(const std::string& text, MetricKey& key)
{
    std::string up = text;
    std::transform(up.begin(), up.end(), up.begin(),
                   [](unsigned char c) { return (char)std::toupper(c); });

    if (up == "W" || up == "P" || up == "WATTS" || up == "POWER") {
        key = MetricKey::Watts;
        return true;
    }
    if (up == "I" || up == "CURRENT") {
        key = MetricKey::Current;
        return true;
    }
    if (up == "R" || up == "RESISTANCE") {
        key = MetricKey::Resistance;
        return true;
    }
    if (up == "E" || up == "V" || up == "VOLTAGE") {
        key = MetricKey::Voltage;
        return true;
    }
    return false;
}

double WireMetrics::get(MetricKey key) const
{
    switch (key) {
        case MetricKey::Watts:
            return watts;
        case MetricKey::Current:
            return current;
        case MetricKey::Resistance:
            return resistance;
        case MetricKey::Voltage:
            return voltage;
    }
    throw std::invalid_argument("Unknown metric key");
}

bool operator==(const WireMetrics& a, const WireMetrics& b)
{
    return a.watts == b.watts && a.current == b.current &&
           a.resistance == b.resistance && a.voltage == b.voltage;
}

bool operator!=(const WireMetrics& a, const WireMetrics& b) { return !(a == b); }

bool PartialWireMetrics::has(MetricKey key) const
{
    return values[metricIndex(key)].has_value();
}

std::optional<double> PartialWireMetrics::find(MetricKey key) const
{
    return values[metricIndex(key)];
}

double PartialWireMetrics::get(MetricKey key) const
{
    const auto& slot = values[metricIndex(key)];
    if (!slot) {
        std::ostringstream oss;
        oss << "Metric '" << key << "' is not known";
        throw std::out_of_range(oss.str());
    }
    return *slot;
}

void PartialWireMetrics::set(MetricKey key, double value)
{
    if (!std::isfinite(value)) return;  // sanitise
    values[metricIndex(key)] = value;
}

void PartialWireMetrics::erase(MetricKey key)
{
    values[metricIndex(key)].reset();
}

std::size_t PartialWireMetrics::count() const
{
    return static_cast<std::size_t>(
        std::count_if(values.begin(), values.end(),
                      [](const std::optional<double>& v) { return v.has_value(); }));
}

PartialWireMetrics mergeMetrics(const PartialWireMetrics& base,
                                const PartialWireMetrics& overrides)
{
    PartialWireMetrics merged = base;
    for (MetricKey key : METRIC_ORDER) {
        if (auto v = overrides.find(key)) merged.set(key, *v);
    }
    return merged;
}

PartialWireMetrics toPartial(const WireMetrics& metrics)
{
    PartialWireMetrics partial;
    for (MetricKey key : METRIC_ORDER) partial.set(key, metrics.get(key));
    return partial;
}

SolvedWireMetrics solveWireMetrics(const PartialWireMetrics& input,
                                   double tolerance, int maxIterations)
{
    if (input.count() < 2) {
        std::ostringstream oss;
        oss << "At least two known quantities are required to resolve W.I.R.E. "
               "metrics (got "
            << input.count() << ")";
        throw MissingDataError(oss.str());
    }

    std::optional<double> watts = input.find(MetricKey::Watts);
    std::optional<double> current = input.find(MetricKey::Current);
    std::optional<double> resistance = input.find(MetricKey::Resistance);
    std::optional<double> voltage = input.find(MetricKey::Voltage);

    SolvedWireMetrics result;

    // Assign a derived value if it is finite; returns true when it fired.
    auto derive = [&result](std::optional<double>& slot, MetricKey key,
                            double value, const char* formula,
                            std::vector<MetricKey> inputs) {
        if (slot || !std::isfinite(value)) return false;
        slot = value;
        result.derived[key] = Derivation{formula, std::move(inputs)};
        return true;
    };

    using K = MetricKey;
    for (int iteration = 0; iteration < maxIterations; ++iteration) {
        bool changed = false;

        if (!voltage && current && resistance)
            changed |= derive(voltage, K::Voltage, *current * *resistance,
                              "E = I × R", {K::Current, K::Resistance});

        if (!current && voltage && resistance &&
            std::fabs(*resistance) > tolerance)
            changed |= derive(current, K::Current, *voltage / *resistance,
                              "I = E / R", {K::Voltage, K::Resistance});

        if (!resistance && voltage && current && std::fabs(*current) > tolerance)
            changed |= derive(resistance, K::Resistance, *voltage / *current,
                              "R = E / I", {K::Voltage, K::Current});

        if (!watts && voltage && current)
            changed |= derive(watts, K::Watts, *voltage * *current,
                              "P = E × I", {K::Voltage, K::Current});

        if (!watts && current && resistance)
            changed |= derive(watts, K::Watts, *current * *current * *resistance,
                              "P = I² × R", {K::Current, K::Resistance});

        if (!watts && voltage && resistance && std::fabs(*resistance) > tolerance)
            changed |= derive(watts, K::Watts, *voltage * *voltage / *resistance,
                              "P = E² / R", {K::Voltage, K::Resistance});

        if (!voltage && watts && current && std::fabs(*current) > tolerance)
            changed |= derive(voltage, K::Voltage, *watts / *current,
                              "E = P / I", {K::Watts, K::Current});

        if (!voltage && watts && resistance && *watts >= 0 && *resistance >= 0)
            changed |= derive(voltage, K::Voltage, std::sqrt(*watts * *resistance),
                              "E = √(P × R)", {K::Watts, K::Resistance});

        if (!current && watts && voltage && std::fabs(*voltage) > tolerance)
            changed |= derive(current, K::Current, *watts / *voltage,
                              "I = P / E", {K::Watts, K::Voltage});

        if (!current && watts && resistance && *resistance >= tolerance &&
            *watts >= 0)
            changed |= derive(current, K::Current, std::sqrt(*watts / *resistance),
                              "I = √(P / R)", {K::Watts, K::Resistance});

        if (!resistance && watts && current && std::fabs(*current) > tolerance)
            changed |= derive(resistance, K::Resistance,
                              *watts / (*current * *current), "R = P / I²",
                              {K::Watts, K::Current});

        if (!resistance && watts && voltage && std::fabs(*watts) > tolerance)
            changed |= derive(resistance, K::Resistance,
                              *voltage * *voltage / *watts, "R = E² / P",
                              {K::Voltage, K::Watts});

        if (!changed) break;
    }

    if (!watts || !current || !resistance || !voltage) {
        throw MissingDataError(
            "Unable to resolve all W.I.R.E. metrics from provided values");
    }

    result.metrics.watts = *watts;
    result.metrics.current = *current;
    result.metrics.resistance = *resistance;
    result.metrics.voltage = *voltage;
    return result;
}

bool nearlyEqual(double a, double b, double relTol)
{
    if (!std::isfinite(a) || !std::isfinite(b)) return false;
    double diff = std::fabs(a - b);
    if (diff <= 1e-12) return true;
    return diff <= relTol * std::max(std::fabs(a), std::fabs(b));
}

bool isPhysicallyConsistent(const WireMetrics& m, double relTol)
{
    return nearlyEqual(m.voltage, m.current * m.resistance, relTol) &&
           nearlyEqual(m.watts, m.voltage * m.current, relTol);
}

std::string formatNumber(double value, int digits)
{
    if (!std::isfinite(value)) return "-";

    double magnitude = std::fabs(value);
    int applied = digits;
    if (magnitude >= 1000)
        applied = 1;
    else if (magnitude >= 100)
        applied = std::min(digits, 1);
    else if (magnitude >= 10)
        applied = std::min(digits, 2);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(applied) << value;
    return oss.str();
}

std::string formatMetricNumber(double value, MetricKey key)
{
    return formatNumber(value, metricPrecision(key));
}

std::string formatMetricValue(double value, MetricKey key)
{
    if (!std::isfinite(value)) return "-";
    return formatMetricNumber(value, key) + " " + metricUnit(key);
}

std::ostream& operator<<(std::ostream& os, const WireMetrics& metrics)
{
    os << "W=" << formatMetricValue(metrics.watts, MetricKey::Watts)
       << " I=" << formatMetricValue(metrics.current, MetricKey::Current)
       << " R=" << formatMetricValue(metrics.resistance, MetricKey::Resistance)
       << " E=" << formatMetricValue(metrics.voltage, MetricKey::Voltage);
    return os;
}
