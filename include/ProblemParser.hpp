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
 * @file ProblemParser.hpp
 * @brief Parser for `.prb` practice-problem catalogs.
 *
 * A catalog is a line-oriented text file in the spirit of a SPICE netlist.
 * Each problem is a `.PROBLEM` ... `.ENDP` block:
 *
 * @code
 * * Three resistors in series
 * .PROBLEM series-square-01
 * .TITLE "Series Circuit - Circuit Current"
 * .TOPOLOGY SERIES
 * .DIFFICULTY INTRO
 * .PROMPT "Three resistors are connected in series across a 24 V battery."
 * .QUESTION "What is the total current?"
 * .TAGS series ohms-law
 * SOURCE battery "Battery" V=24
 * LOAD R1 "R1" R=150
 * LOAD R2 "R2" R=200
 * LOAD R3 "R3" R=250
 * .NETWORK (SERIES:main R1 R2
 * + R3)
 * .TARGET totals I
 * .ENDP
 * @endcode
 *
 * Design notes:
 *  - Keywords and metric names are case-insensitive; ids keep their case.
 *  - A quoted string is one token. A quoted token right after a component id
 *    is its display label.
 *  - `KEY=value` assignments set givens (shown to the learner); a leading
 *    `@` (`@I=2M`) makes the value a hidden solver input instead.
 *  - Values follow the strict SPICE grammar: optional suffix multipliers
 *    (T, G, MEG, K, M, U, N, P, F) and a mantissa fully consumed by
 *    std::stod.
 *  - `*` at the start of a line, or `;` anywhere outside quotes, starts a
 *    comment. A line starting with `+` continues the previous line.
 *  - `.NETWORK` holds an s-expression of `(SERIES[:id] ...)` and
 *    `(PARALLEL[:id] ...)` groups over load ids. Unnamed groups are given
 *    `series-N` / `parallel-N` ids. The network is built at `.ENDP`, so
 *    loads may be declared after it.
 *
 * Errors are printed to `std::cerr` as `Line N: ...` and counted; a problem
 * with at least one error is discarded.
 *
 * Example usage:
 * @code
 * ProblemParser p;
 * if (p.parse("problems/practice.prb") == 0) {
 *   // use p.problems
 * }
 * @endcode
 */

#pragma once

#include <istream>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "PracticeProblem.hpp"

/**
 * @class ProblemParser
 * @brief Reads `.prb` catalogs into PracticeProblem records.
 *
 * Successive calls to `parse()` accumulate problems, so several catalogs can
 * be loaded into one parser. Problem ids must be unique across all of them.
 */
class ProblemParser
{
   public:
    /** @brief Problems parsed without errors, in catalog order. */
    std::vector<PracticeProblem> problems;

    /**
     * @brief Parse a catalog file.
     *
     * @param file Path to the `.prb` file.
     * @return Number of errors reported. Zero indicates a clean parse.
     */
    int parse(const std::string& file);

    /**
     * @brief Parse catalog text from a stream.
     *
     * @param in Catalog text.
     * @param sourceName Name used in file-level diagnostics.
     * @return Number of errors reported.
     */
    int parseStream(std::istream& in, const std::string& sourceName = "<input>");

    /**
     * @brief Check that a statement has at least `minSize` tokens.
     *
     * @param tokens Tokenized statement (keyword included).
     * @param minSize Minimum token count.
     * @param lineNumber Line number for diagnostics.
     * @return True if the statement is long enough.
     */
    bool validateTokens(const std::vector<std::string>& tokens,
                        std::size_t minSize, int lineNumber);

    /**
     * @brief Read the right-hand side of a KEY=value assignment.
     *
     * A decimal or scientific number, optionally followed by an engineering
     * suffix: T, G, MEG, K, M (milli), U, N, P or F, in any case. The number
     * must be consumed whole, so "1.2.3" and a bare "K" are rejected with a
     * "Line N:" diagnostic on stderr.
     *
     * @param valueStr Value token, e.g. "4.7K" or "250m".
     * @param lineNumber Catalog line for diagnostics.
     * @param valid Set to true only when the token was accepted.
     * @return The value in base units, 0.0 when rejected.
     */
    double parseValue(const std::string& valueStr, int lineNumber, bool& valid);

    /** @brief Parsed problem by id, or nullptr. */
    const PracticeProblem* findProblem(const std::string& id) const;

   private:
    struct Token
    {
        std::string text;
        bool quoted = false;
        bool isOpen() const { return !quoted && text == "("; }
        bool isClose() const { return !quoted && text == ")"; }
    };

    struct Statement
    {
        int lineNumber = 0;
        std::vector<Token> tokens;
        int unterminatedLine = 0; /**< Line holding an unclosed quote */
    };

    // Problem under construction between .PROBLEM and .ENDP
    struct Draft
    {
        PracticeProblem problem;
        int startLine = 0;
        int errors = 0;
        bool hasSource = false;
        bool hasTarget = false;
        std::vector<Token> networkTokens;
        int networkLine = 0;
        std::set<std::string> rowIds;
        std::set<std::string> groupIds;
        std::set<std::string> placedLoads;
        int seriesCounter = 0;
        int parallelCounter = 0;
    };

    static std::vector<Token> tokenizeLine(const std::string& line,
                                           bool& unterminatedQuote);
    static std::vector<std::string> texts(const std::vector<Token>& tokens);

    void report(int lineNumber, const std::string& message);
    void countError();
    void parseStatement(const Statement& statement);
    void parseComponent(const Statement& statement, ComponentRole role);
    void parseAssignments(const std::vector<Token>& tokens, std::size_t first,
                          int lineNumber, PartialWireMetrics& givens,
                          PartialWireMetrics& values);
    void finishProblem(int lineNumber);
    std::optional<NodeIndex> parseNetworkNode(const std::vector<Token>& tokens,
                                              std::size_t& pos, int lineNumber);
    void beginProblem(const Statement& statement);

    std::optional<Draft> draft;
    std::set<std::string> problemIds;
    int errorCount = 0;
};
