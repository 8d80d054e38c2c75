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
 * @file NodalCrossCheck.hpp
 * @brief Independent Kirchhoff check of a solved practice problem.
 *
 * The series/parallel walk in `MetricPropagator` never forms a nodal system.
 * This module does: it flattens the network tree into a two-terminal
 * resistor circuit, stamps it into a Modified Nodal Analysis (MNA) system
 * with one ideal voltage source carrying the solved total voltage, solves
 * the system with Eigen and compares every leaf's current and voltage drop
 * with the propagated solution.
 *
 * Node numbering:
 *  - 0 is ground (the source's negative terminal);
 *  - 1 is the supply node (the source's positive terminal);
 *  - every series group with n children adds n - 1 internal nodes.
 *
 * Unknown ordering in the MNA vector: node voltages 1..N-1, then the source
 * current.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "MetricPropagator.hpp"
#include "PracticeProblem.hpp"
#include "PracticeSolver.hpp"

/**
 * @struct NodalBranch
 * @brief One load resistor between two flattened nodes.
 */
struct NodalBranch
{
    std::string componentId;
    int nodeA = 0;
    int nodeB = 0;
    double resistance = 0.0;
};

/**
 * @struct NodalCircuit
 * @brief Flattened network: node count (ground included) and branches.
 */
struct NodalCircuit
{
    int nodeCount = 2;
    std::vector<NodalBranch> branches;
};

/**
 * @brief Flatten the problem's network between supply node 1 and ground.
 *
 * @throws MissingDataError if the problem has no network or a load lacks a
 *         finite positive resistance.
 */
NodalCircuit flattenNetwork(const PracticeProblem& problem);

/**
 * @struct NodalCheckReport
 * @brief Outcome of the nodal cross-check.
 */
struct NodalCheckReport
{
    bool solved = false;       /**< MNA system was assembled and invertible */
    std::string message;       /**< Reason when `solved` is false */
    int nodeCount = 0;         /**< Flattened nodes, ground included */
    double maxCurrentDeviation = 0.0;
    double maxVoltageDeviation = 0.0;
    std::string worstComponent; /**< Leaf with the largest deviation */
    double residual = 0.0;      /**< ||A x - b|| of the MNA solve */
    double sourceCurrent = 0.0; /**< Current delivered by the source */
    MetricsById leafMetrics;    /**< Per-leaf metrics from the nodal solution */
    Eigen::VectorXd nodeVoltages; /**< Indexed by node number, ground = 0 */

    /** @brief Solved and both deviations within `tolerance`. */
    bool consistent(double tolerance = 1e-6) const;
};

/**
 * @brief Solve the flattened circuit and compare it with `result`.
 *
 * Deviations are relative to the propagated value (absolute when that value
 * is zero). Never throws for content problems: failures are reported through
 * `solved` and `message`.
 */
NodalCheckReport crossCheckSolution(const PracticeProblem& problem,
                                    const SolveResult& result);
