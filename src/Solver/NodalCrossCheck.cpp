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
 * @file NodalCrossCheck.cpp
 * @brief Flattening, MNA stamping and comparison for the nodal cross-check.
 *
 * Stamps follow the usual MNA conventions: a resistor adds its conductance
 * to the 2x2 block of its terminals (diagonal only when one terminal is
 * ground); the voltage source adds its current unknown to the KCL row of the
 * supply node and one element row V(1) = E.
 */

#include "NodalCrossCheck.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "PracticeErrors.hpp"

static void placeNode(const CircuitNetwork& network,
                      const ComponentMap& components, NodeIndex index,
                      int nodeA, int nodeB, NodalCircuit& out)
{
    const CircuitNode& node = network.node(index);
    std::visit(
        overloaded{
            [&](const ComponentRef& ref) {
                auto it = components.find(ref.componentId);
                if (it == components.end() || it->second == nullptr)
                    throw MissingDataError("Unknown component '" +
                                           ref.componentId + "'");
                std::optional<double> r =
                    it->second->solverInputs().find(MetricKey::Resistance);
                if (!r || !std::isfinite(*r) || *r <= 0.0)
                    throw MissingDataError("Component '" + ref.componentId +
                                           "' is missing a resistance value");
                out.branches.push_back(
                    NodalBranch{ref.componentId, nodeA, nodeB, *r});
            },
            [&](const SeriesGroup& group) {
                int from = nodeA;
                for (size_t i = 0; i < group.children.size(); ++i) {
                    int to = (i + 1 == group.children.size())
                                 ? nodeB
                                 : out.nodeCount++;
                    placeNode(network, components, group.children[i], from, to,
                              out);
                    from = to;
                }
            },
            [&](const ParallelGroup& group) {
                for (NodeIndex child : group.children)
                    placeNode(network, components, child, nodeA, nodeB, out);
            }},
        node.shape);
}

NodalCircuit flattenNetwork(const PracticeProblem& problem)
{
    if (!problem.network.hasRoot())
        throw MissingDataError("Problem '" + problem.id + "' has no network");

    NodalCircuit circuit;
    circuit.nodeCount = 2;  // ground and supply
    ComponentMap components = createComponentMap(problem);
    placeNode(problem.network, components, problem.network.root(), 1, 0,
              circuit);
    return circuit;
}

static void stampConductance(Eigen::MatrixXd& A, int nodeA, int nodeB,
                             double resistance)
{
    double g = 1.0 / resistance;
    if (nodeA == 0 && nodeB == 0) return;
    if (nodeA == 0) {
        A(nodeB - 1, nodeB - 1) += g;
    } else if (nodeB == 0) {
        A(nodeA - 1, nodeA - 1) += g;
    } else {
        int vplus = nodeA - 1;
        int vminus = nodeB - 1;
        A(vplus, vplus) += g;
        A(vplus, vminus) -= g;
        A(vminus, vplus) -= g;
        A(vminus, vminus) += g;
    }
}

static double deviation(double nodal, double propagated)
{
    double diff = std::fabs(nodal - propagated);
    double scale = std::fabs(propagated);
    return scale > 0.0 ? diff / scale : diff;
}

bool NodalCheckReport::consistent(double tolerance) const
{
    return solved && maxCurrentDeviation <= tolerance &&
           maxVoltageDeviation <= tolerance;
}

NodalCheckReport crossCheckSolution(const PracticeProblem& problem,
                                    const SolveResult& result)
{
    NodalCheckReport report;

    NodalCircuit circuit;
    try {
        circuit = flattenNetwork(problem);
    } catch (const MissingDataError& ex) {
        report.message = ex.what();
        return report;
    }
    report.nodeCount = circuit.nodeCount;

    // Unknowns: V(1)..V(N-1), then the source current.
    const int n = circuit.nodeCount - 1;
    const int sourceRow = n;
    Eigen::MatrixXd A = Eigen::MatrixXd::Zero(n + 1, n + 1);
    Eigen::VectorXd b = Eigen::VectorXd::Zero(n + 1);

    for (const auto& branch : circuit.branches)
        stampConductance(A, branch.nodeA, branch.nodeB, branch.resistance);

    // Source between supply node 1 and ground.
    A(0, sourceRow) += 1.0;
    A(sourceRow, 0) += 1.0;
    b(sourceRow) = result.totals.voltage;

    Eigen::FullPivLU<Eigen::MatrixXd> lu(A);
    if (!lu.isInvertible()) {
        report.message = "Nodal matrix is singular";
        return report;
    }
    Eigen::VectorXd x = lu.solve(b);
    if (!x.allFinite()) {
        report.message = "Nodal solution is not finite";
        return report;
    }

    report.residual = (A * x - b).norm();
    report.sourceCurrent = -x(sourceRow);
    report.nodeVoltages = Eigen::VectorXd::Zero(circuit.nodeCount);
    for (int k = 1; k < circuit.nodeCount; ++k)
        report.nodeVoltages(k) = x(k - 1);

    double worst = -1.0;
    for (const auto& branch : circuit.branches) {
        auto it = result.components.find(branch.componentId);
        if (it == result.components.end()) {
            report.message = "Component '" + branch.componentId +
                             "' is missing from the propagated solution";
            return report;
        }

        WireMetrics nodal;
        nodal.voltage = report.nodeVoltages(branch.nodeA) -
                        report.nodeVoltages(branch.nodeB);
        nodal.resistance = branch.resistance;
        nodal.current = nodal.voltage / branch.resistance;
        nodal.watts = nodal.voltage * nodal.current;
        report.leafMetrics[branch.componentId] = nodal;

        double currentDev = deviation(nodal.current, it->second.current);
        double voltageDev = deviation(nodal.voltage, it->second.voltage);
        report.maxCurrentDeviation =
            std::max(report.maxCurrentDeviation, currentDev);
        report.maxVoltageDeviation =
            std::max(report.maxVoltageDeviation, voltageDev);
        if (std::max(currentDev, voltageDev) > worst) {
            worst = std::max(currentDev, voltageDev);
            report.worstComponent = branch.componentId;
        }
    }

    report.solved = true;
    return report;
}
