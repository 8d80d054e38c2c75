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
 * @file ResistanceResolver.hpp
 * @brief Memoized equivalent resistance of a series/parallel network.
 *
 * One resolver instance serves exactly one solve. Its cache is a vector
 * indexed by `NodeIndex`, so repeated visits (the total computation, then
 * one lookup per child during propagation) reuse earlier results without
 * hashing node objects. Discard the resolver with the solve; never share it
 * between problems.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "CircuitNetwork.hpp"
#include "PracticeProblem.hpp"

class ResistanceResolver
{
   public:
    /**
     * @param network Tree to reduce; must outlive the resolver.
     * @param components Load lookup; must outlive the resolver.
     */
    ResistanceResolver(const CircuitNetwork& network,
                       const ComponentMap& components);

    /**
     * @brief Equivalent resistance of the sub-network rooted at `index`.
     *
     * @throws MissingDataError if a leaf's component is unknown or has no
     *         finite positive resistance.
     * @throws DomainError if a parallel child has a non-positive resistance.
     */
    double resolve(NodeIndex index);

    /** @brief Equivalent resistance of the whole network. */
    double total() { return resolve(network.root()); }

    /** @brief Number of nodes actually reduced (cache misses). */
    std::size_t evaluations() const { return evaluationCount; }

   private:
    double componentResistance(const std::string& componentId) const;

    const CircuitNetwork& network;
    const ComponentMap& components;
    std::vector<std::optional<double>> cache;
    std::size_t evaluationCount = 0;
};
