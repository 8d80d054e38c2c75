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
 * @file PracticeErrors.hpp
 * @brief Error taxonomy shared by the solver and the grading engine.
 *
 * Every error raised inside the solver pipeline derives from `PracticeError`
 * and carries a `SolveErrorKind` tag. The tag survives the conversion into a
 * `SolveFailure` at the public solve boundary (see PracticeSolver.hpp) so the
 * caller can tell a missing resistance from a propagation blow-up without
 * parsing the message text.
 *
 *  - MissingDataError:      a leaf lacks a usable resistance, or fewer than
 *                           two independent quantities are known.
 *  - DomainError:           a non-positive resistance inside a parallel
 *                           branch.
 *  - PropagationError:      a non-finite value surfaced mid-propagation.
 *  - InconsistentDataError: an authored value contradicts the physics of the
 *                           solved network.
 *  - InputParseError:       no numeral could be extracted from learner text.
 */

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

/**
 * @enum SolveErrorKind
 * @brief Tag identifying which family of error stopped a solve or a parse.
 */
enum class SolveErrorKind
{
    MissingData,  /**< Not enough information to resolve a quantity */
    Domain,       /**< Degenerate parallel branch */
    Propagation,  /**< Non-finite intermediate value */
    Inconsistent, /**< Authored value contradicts Ohm's / power law */
    InputParse,   /**< Learner text holds no numeral */
    Unknown       /**< Anything not raised by this library */
};

inline std::ostream& operator<<(std::ostream& os, SolveErrorKind kind)
{
    switch (kind) {
        case SolveErrorKind::MissingData:
            os << "MissingDataError";
            break;
        case SolveErrorKind::Domain:
            os << "DomainError";
            break;
        case SolveErrorKind::Propagation:
            os << "PropagationError";
            break;
        case SolveErrorKind::Inconsistent:
            os << "InconsistentDataError";
            break;
        case SolveErrorKind::InputParse:
            os << "InputParseError";
            break;
        default:
            os << "UnknownError";
            break;
    }
    return os;
}

/**
 * @class PracticeError
 * @brief Base class of every error raised by the solver and grading code.
 */
class PracticeError : public std::runtime_error
{
   public:
    PracticeError(SolveErrorKind kind, const std::string& message)
        : std::runtime_error(message), errorKind(kind)
    {
    }

    SolveErrorKind kind() const { return errorKind; }

   private:
    SolveErrorKind errorKind;
};

class MissingDataError : public PracticeError
{
   public:
    explicit MissingDataError(const std::string& message)
        : PracticeError(SolveErrorKind::MissingData, message)
    {
    }
};

class DomainError : public PracticeError
{
   public:
    explicit DomainError(const std::string& message)
        : PracticeError(SolveErrorKind::Domain, message)
    {
    }
};

/**
 * @class PropagationError
 * @brief Raised when a current or voltage becomes non-finite while walking
 * the network. `nodeName()` identifies the offending node.
 */
class PropagationError : public PracticeError
{
   public:
    PropagationError(const std::string& node, const std::string& message)
        : PracticeError(SolveErrorKind::Propagation, message), node(node)
    {
    }

    const std::string& nodeName() const { return node; }

   private:
    std::string node;
};

class InconsistentDataError : public PracticeError
{
   public:
    explicit InconsistentDataError(const std::string& message)
        : PracticeError(SolveErrorKind::Inconsistent, message)
    {
    }
};

class InputParseError : public PracticeError
{
   public:
    explicit InputParseError(const std::string& message)
        : PracticeError(SolveErrorKind::InputParse, message)
    {
    }
};
