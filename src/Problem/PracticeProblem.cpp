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
 * @file PracticeProblem.cpp
 * @brief Lookup helpers for PracticeProblem.
 */

#include "PracticeProblem.hpp"

const PracticeComponent* PracticeProblem::findComponent(
    const std::string& componentId) const
{
    for (const auto& component : components) {
        if (component.id == componentId) return &component;
    }
    return nullptr;
}

bool PracticeProblem::hasRow(const std::string& rowId) const
{
    return rowId == TOTALS_ROW_ID || rowId == source.id ||
           findComponent(rowId) != nullptr;
}

ComponentMap createComponentMap(const PracticeProblem& problem)
{
    ComponentMap map;
    for (const auto& component : problem.components)
        map[component.id] = &component;
    return map;
}
