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
 * @file PracticeProblem.hpp
 * @brief Static problem content: components, network and target metric.
 *
 * A `PracticeProblem` is authored externally (a `.prb` catalog read by
 * `ProblemParser`, or built in code) and is the sole input of the solver.
 * Nothing in the library mutates a problem once it is built.
 */

#pragma once

#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "CircuitNetwork.hpp"
#include "WireMetrics.hpp"

/** @brief Row id of the circuit-totals row of every worksheet. */
inline const std::string TOTALS_ROW_ID = "totals";

enum class ComponentRole
{
    Source, /**< The single independent source */
    Load    /**< A resistive load inside the network */
};

enum class PracticeTopology
{
    Series,
    Parallel,
    Combination
};

enum class PracticeDifficulty
{
    Intro,
    Standard,
    Challenge
};

inline std::ostream& operator<<(std::ostream& os, ComponentRole role)
{
    switch (role) {
        case ComponentRole::Source:
            os << "source";
            break;
        case ComponentRole::Load:
            os << "load";
            break;
        default:
            os << "UnknownRole";
            break;
    }
    return os;
}

inline std::ostream& operator<<(std::ostream& os, PracticeTopology topology)
{
    switch (topology) {
        case PracticeTopology::Series:
            os << "series";
            break;
        case PracticeTopology::Parallel:
            os << "parallel";
            break;
        case PracticeTopology::Combination:
            os << "combination";
            break;
        default:
            os << "UnknownTopology";
            break;
    }
    return os;
}

inline std::ostream& operator<<(std::ostream& os, PracticeDifficulty difficulty)
{
    switch (difficulty) {
        case PracticeDifficulty::Intro:
            os << "intro";
            break;
        case PracticeDifficulty::Standard:
            os << "standard";
            break;
        case PracticeDifficulty::Challenge:
            os << "challenge";
            break;
        default:
            os << "UnknownDifficulty";
            break;
    }
    return os;
}

/**
 * @struct PracticeComponent
 * @brief The source or one load of a problem.
 *
 * `givens` are shown to the learner and locked in the worksheet. `values`
 * are authored solver inputs that may stay hidden. The solver reads
 * `solverInputs()`, i.e. `values` layered over `givens`.
 */
struct PracticeComponent
{
    std::string id;
    std::string label;
    ComponentRole role = ComponentRole::Load;
    PartialWireMetrics givens;
    PartialWireMetrics values;
    std::string notes;

    PartialWireMetrics solverInputs() const
    {
        return mergeMetrics(givens, values);
    }
};

/**
 * @struct TargetMetric
 * @brief The one cell the learner must ultimately find.
 *
 * `rowId` is the source id, a load id or TOTALS_ROW_ID.
 */
struct TargetMetric
{
    std::string rowId;
    MetricKey key = MetricKey::Current;
};

/**
 * @struct PracticeProblem
 * @brief One worksheet problem with its network and metadata.
 */
struct PracticeProblem
{
    std::string id;
    std::string title;
    PracticeTopology topology = PracticeTopology::Series;
    PracticeDifficulty difficulty = PracticeDifficulty::Intro;
    std::string prompt;
    std::string targetQuestion;
    TargetMetric targetMetric;
    std::vector<std::string> conceptTags;
    std::string presetHint;

    PracticeComponent source;
    std::vector<PracticeComponent> components;
    CircuitNetwork network;
    PartialWireMetrics totalsGivens;

    /** @brief Load component by id, or nullptr. */
    const PracticeComponent* findComponent(const std::string& componentId) const;

    /** @brief True for the source id, any load id and TOTALS_ROW_ID. */
    bool hasRow(const std::string& rowId) const;
};

/** @brief Load id -> component lookup used by the solver passes. */
using ComponentMap = std::map<std::string, const PracticeComponent*>;

/**
 * @brief Build the lookup table for `problem.components`.
 *
 * Pointers refer into `problem`, which must outlive the map.
 */
ComponentMap createComponentMap(const PracticeProblem& problem);
