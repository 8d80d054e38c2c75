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
 * @file ProblemParser.cpp
 * @brief Implementation of the ProblemParser declared in ProblemParser.hpp.
 *
 * The parser works statement by statement. Physical lines are tokenized as
 * they are read; a `+` continuation line is appended to the pending
 * statement, and the pending statement is dispatched once the next
 * non-continuation line (or EOF) is reached.
 *
 * Implementation notes:
 *  - Tokenization keeps quoted strings whole and splits `(` and `)` into
 *    their own tokens so the `.NETWORK` expression can be read by a small
 *    recursive-descent routine.
 *  - Every diagnostic goes through `report()`, which also charges the error
 *    to the open problem; `finishProblem()` keeps the problem only when its
 *    charge is zero.
 */

#include "ProblemParser.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

static std::string toUpper(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return (char)std::toupper(c); });
    return text;
}

std::vector<ProblemParser::Token> ProblemParser::tokenizeLine(
    const std::string& line, bool& unterminatedQuote)
{
    std::vector<Token> tokens;
    std::string cur;
    unterminatedQuote = false;

    auto flush = [&]() {
        if (!cur.empty()) {
            tokens.push_back(Token{cur, false});
            cur.clear();
        }
    };

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == ';') break;  // trailing comment
        if (c == '"') {
            flush();
            size_t close = line.find('"', i + 1);
            if (close == std::string::npos) {
                unterminatedQuote = true;
                tokens.push_back(Token{line.substr(i + 1), true});
                return tokens;
            }
            tokens.push_back(Token{line.substr(i + 1, close - i - 1), true});
            i = close;
            continue;
        }
        if (c == '(' || c == ')') {
            flush();
            tokens.push_back(Token{std::string(1, c), false});
            continue;
        }
        if (std::isspace((unsigned char)c)) {
            flush();
            continue;
        }
        cur.push_back(c);
    }
    flush();
    return tokens;
}

std::vector<std::string> ProblemParser::texts(const std::vector<Token>& tokens)
{
    std::vector<std::string> out;
    out.reserve(tokens.size());
    for (const auto& t : tokens) out.push_back(t.text);
    return out;
}

void ProblemParser::countError()
{
    ++errorCount;
    if (draft) ++draft->errors;
}

void ProblemParser::report(int lineNumber, const std::string& message)
{
    std::cerr << "Line " << lineNumber << ": " << message << std::endl;
    countError();
}

int ProblemParser::parse(const std::string& file)
{
    std::ifstream fileStream(file);
    if (!fileStream) {
        std::cerr << "Error: Problem catalog '" << file
                  << "' could not be opened" << std::endl;
        return 1;
    }
    return parseStream(fileStream, file);
}

int ProblemParser::parseStream(std::istream& in, const std::string& sourceName)
{
    errorCount = 0;
    draft.reset();

    std::optional<Statement> pending;
    std::string line;
    int lineNumber = 0;

    while (std::getline(in, line)) {
        ++lineNumber;

        size_t firstChar = line.find_first_not_of(" \t\r\n");
        if (firstChar == std::string::npos) continue;  // blank line
        char fc = line[firstChar];
        if (fc == '*' || fc == ';') continue;  // comment line

        bool continuation = (fc == '+');
        std::string body = continuation ? line.substr(firstChar + 1) : line;

        bool unterminated = false;
        std::vector<Token> tokens = tokenizeLine(body, unterminated);

        if (continuation) {
            if (!pending) {
                report(lineNumber, "Continuation line without a statement");
                continue;
            }
            pending->tokens.insert(pending->tokens.end(), tokens.begin(),
                                   tokens.end());
            if (unterminated) pending->unterminatedLine = lineNumber;
            continue;
        }

        if (pending) parseStatement(*pending);
        pending.reset();
        if (tokens.empty()) continue;

        Statement statement;
        statement.lineNumber = lineNumber;
        statement.tokens = std::move(tokens);
        if (unterminated) statement.unterminatedLine = lineNumber;
        pending = std::move(statement);
    }
    if (pending) parseStatement(*pending);

    if (draft) {
        report(draft->startLine, ".PROBLEM '" + draft->problem.id +
                                     "' missing matching .ENDP in " +
                                     sourceName);
        draft.reset();
    }
    return errorCount;
}

void ProblemParser::parseStatement(const Statement& statement)
{
    const int lineNumber = statement.lineNumber;
    const std::vector<Token>& tokens = statement.tokens;

    if (statement.unterminatedLine != 0) {
        report(statement.unterminatedLine, "Unterminated quoted string");
        return;
    }
    if (tokens[0].quoted) {
        report(lineNumber, "Unexpected quoted string \"" + tokens[0].text + "\"");
        return;
    }

    std::string keyword = toUpper(tokens[0].text);

    if (keyword == ".PROBLEM") {
        beginProblem(statement);
        return;
    }
    if (!draft) {
        report(lineNumber,
               "Statement '" + tokens[0].text + "' outside a .PROBLEM block");
        return;
    }

    PracticeProblem& problem = draft->problem;
    std::vector<std::string> words = texts(tokens);

    if (keyword == ".TITLE" || keyword == ".PROMPT" || keyword == ".QUESTION") {
        if (!validateTokens(words, 2, lineNumber)) {
            countError();
            return;
        }
        std::ostringstream oss;
        for (size_t i = 1; i < words.size(); ++i)
            oss << (i > 1 ? " " : "") << words[i];
        if (keyword == ".TITLE")
            problem.title = oss.str();
        else if (keyword == ".PROMPT")
            problem.prompt = oss.str();
        else
            problem.targetQuestion = oss.str();
    } else if (keyword == ".TOPOLOGY") {
        if (!validateTokens(words, 2, lineNumber)) {
            countError();
            return;
        }
        std::string value = toUpper(words[1]);
        if (value == "SERIES")
            problem.topology = PracticeTopology::Series;
        else if (value == "PARALLEL")
            problem.topology = PracticeTopology::Parallel;
        else if (value == "COMBINATION")
            problem.topology = PracticeTopology::Combination;
        else
            report(lineNumber, "Unknown topology '" + words[1] + "'");
    } else if (keyword == ".DIFFICULTY") {
        if (!validateTokens(words, 2, lineNumber)) {
            countError();
            return;
        }
        std::string value = toUpper(words[1]);
        if (value == "INTRO")
            problem.difficulty = PracticeDifficulty::Intro;
        else if (value == "STANDARD")
            problem.difficulty = PracticeDifficulty::Standard;
        else if (value == "CHALLENGE")
            problem.difficulty = PracticeDifficulty::Challenge;
        else
            report(lineNumber, "Unknown difficulty '" + words[1] + "'");
    } else if (keyword == ".TAGS") {
        for (size_t i = 1; i < words.size(); ++i)
            problem.conceptTags.push_back(words[i]);
    } else if (keyword == ".HINT") {
        if (!validateTokens(words, 2, lineNumber)) {
            countError();
            return;
        }
        problem.presetHint = words[1];
    } else if (keyword == "SOURCE") {
        parseComponent(statement, ComponentRole::Source);
    } else if (keyword == "LOAD") {
        parseComponent(statement, ComponentRole::Load);
    } else if (keyword == ".TOTALS") {
        PartialWireMetrics hidden;
        parseAssignments(tokens, 1, lineNumber, problem.totalsGivens, hidden);
        if (!hidden.empty())
            report(lineNumber, "Hidden values are not allowed on .TOTALS");
    } else if (keyword == ".NETWORK") {
        if (!draft->networkTokens.empty()) {
            report(lineNumber, "Duplicate .NETWORK statement");
            return;
        }
        if (!validateTokens(words, 2, lineNumber)) {
            countError();
            return;
        }
        draft->networkTokens.assign(tokens.begin() + 1, tokens.end());
        draft->networkLine = lineNumber;
    } else if (keyword == ".TARGET") {
        if (!validateTokens(words, 3, lineNumber)) {
            countError();
            return;
        }
        MetricKey key;
        if (!parseMetricKey(words[2], key)) {
            report(lineNumber, "Unknown metric '" + words[2] + "'");
            return;
        }
        problem.targetMetric = TargetMetric{words[1], key};
        draft->hasTarget = true;
    } else if (keyword == ".ENDP") {
        finishProblem(lineNumber);
    } else {
        report(lineNumber, "Unknown statement '" + tokens[0].text + "'");
    }
}

void ProblemParser::beginProblem(const Statement& statement)
{
    if (draft) {
        report(draft->startLine, ".PROBLEM '" + draft->problem.id +
                                     "' missing matching .ENDP");
        draft.reset();
    }

    draft = Draft();
    draft->startLine = statement.lineNumber;

    if (statement.tokens.size() < 2) {
        report(statement.lineNumber, ".PROBLEM requires an id");
        return;
    }
    draft->problem.id = statement.tokens[1].text;
    if (!problemIds.insert(draft->problem.id).second) {
        report(statement.lineNumber,
               "Duplicate problem id '" + draft->problem.id + "'");
    }
}

void ProblemParser::parseComponent(const Statement& statement,
                                   ComponentRole role)
{
    const int lineNumber = statement.lineNumber;
    const std::vector<Token>& tokens = statement.tokens;
    if (!validateTokens(texts(tokens), 2, lineNumber)) {
        countError();
        return;
    }

    const std::string& id = tokens[1].text;
    if (tokens[1].quoted || tokens[1].isOpen() || tokens[1].isClose()) {
        report(lineNumber, "Invalid component id '" + id + "'");
        return;
    }
    if (id == TOTALS_ROW_ID) {
        report(lineNumber, "Component id '" + id + "' is reserved");
        return;
    }
    if (!draft->rowIds.insert(id).second) {
        report(lineNumber, "Duplicate component id '" + id + "'");
        return;
    }
    if (role == ComponentRole::Source && draft->hasSource) {
        report(lineNumber, "Problem '" + draft->problem.id +
                               "' already has a source ('" +
                               draft->problem.source.id + "')");
        return;
    }

    PracticeComponent component;
    component.id = id;
    component.role = role;
    std::size_t next = 2;
    if (next < tokens.size() && tokens[next].quoted) {
        component.label = tokens[next].text;
        ++next;
    } else {
        component.label = id;
    }
    parseAssignments(tokens, next, lineNumber, component.givens,
                     component.values);

    if (role == ComponentRole::Source) {
        draft->problem.source = component;
        draft->hasSource = true;
    } else {
        draft->problem.components.push_back(component);
    }
}

void ProblemParser::parseAssignments(const std::vector<Token>& tokens,
                                     std::size_t first, int lineNumber,
                                     PartialWireMetrics& givens,
                                     PartialWireMetrics& values)
{
    for (size_t i = first; i < tokens.size(); ++i) {
        if (tokens[i].quoted) {
            report(lineNumber,
                   "Unexpected quoted string \"" + tokens[i].text + "\"");
            continue;
        }

        std::string text = tokens[i].text;
        bool hidden = !text.empty() && text[0] == '@';
        if (hidden) text.erase(0, 1);

        size_t eq = text.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == text.size()) {
            report(lineNumber, "Malformed assignment '" + tokens[i].text + "'");
            continue;
        }

        MetricKey key;
        std::string name = text.substr(0, eq);
        if (!parseMetricKey(name, key)) {
            report(lineNumber, "Unknown metric '" + name + "'");
            continue;
        }

        bool valid = false;
        double value = parseValue(text.substr(eq + 1), lineNumber, valid);
        if (!valid) {
            countError();
            continue;
        }

        if (givens.has(key) || values.has(key)) {
            std::ostringstream oss;
            oss << "Duplicate value for " << metricSymbol(key);
            report(lineNumber, oss.str());
            continue;
        }
        if (hidden)
            values.set(key, value);
        else
            givens.set(key, value);
    }
}

std::optional<NodeIndex> ProblemParser::parseNetworkNode(
    const std::vector<Token>& tokens, std::size_t& pos, int lineNumber)
{
    if (pos >= tokens.size()) {
        report(lineNumber, "Unexpected end of network expression");
        return std::nullopt;
    }

    Draft& d = *draft;
    const Token& token = tokens[pos];
    if (token.isClose()) {
        report(lineNumber, "Unexpected ')' in network expression");
        return std::nullopt;
    }
    if (token.quoted) {
        report(lineNumber, "Unexpected quoted string \"" + token.text +
                               "\" in network expression");
        return std::nullopt;
    }

    // Leaf: a load id
    if (!token.isOpen()) {
        ++pos;
        const std::string& id = token.text;
        if (d.problem.findComponent(id) == nullptr) {
            if (d.hasSource && id == d.problem.source.id)
                report(lineNumber,
                       "Source '" + id + "' cannot appear in the network");
            else
                report(lineNumber, "Unknown load '" + id + "' in network");
            return std::nullopt;
        }
        if (!d.placedLoads.insert(id).second) {
            report(lineNumber,
                   "Load '" + id + "' appears more than once in the network");
            return std::nullopt;
        }
        return d.problem.network.addComponent(id);
    }

    // Group: ( SERIES[:id] ["label"] child... )
    ++pos;
    if (pos >= tokens.size() || tokens[pos].quoted) {
        report(lineNumber, "Expected SERIES or PARALLEL after '('");
        return std::nullopt;
    }
    std::string head = tokens[pos].text;
    ++pos;

    std::string groupId;
    size_t colon = head.find(':');
    if (colon != std::string::npos) {
        groupId = head.substr(colon + 1);
        head = head.substr(0, colon);
    }
    head = toUpper(head);

    NodeKind kind;
    if (head == "SERIES") {
        kind = NodeKind::Series;
        if (groupId.empty())
            groupId = "series-" + std::to_string(++d.seriesCounter);
    } else if (head == "PARALLEL") {
        kind = NodeKind::Parallel;
        if (groupId.empty())
            groupId = "parallel-" + std::to_string(++d.parallelCounter);
    } else {
        report(lineNumber, "Unknown group type '" + head + "'");
        return std::nullopt;
    }

    if (d.groupIds.count(groupId) != 0 || d.rowIds.count(groupId) != 0) {
        report(lineNumber, "Duplicate group id '" + groupId + "'");
        return std::nullopt;
    }

    std::string label;
    if (pos < tokens.size() && tokens[pos].quoted) {
        label = tokens[pos].text;
        ++pos;
    }

    std::vector<NodeIndex> children;
    while (pos < tokens.size() && !tokens[pos].isClose()) {
        std::optional<NodeIndex> child = parseNetworkNode(tokens, pos, lineNumber);
        if (!child) return std::nullopt;
        children.push_back(*child);
    }
    if (pos >= tokens.size()) {
        report(lineNumber, "Missing ')' in network expression");
        return std::nullopt;
    }
    ++pos;  // ')'

    if (children.empty()) {
        report(lineNumber, "Group '" + groupId + "' has no children");
        return std::nullopt;
    }
    d.groupIds.insert(groupId);

    try {
        if (kind == NodeKind::Series)
            return d.problem.network.addSeries(groupId, children, label);
        return d.problem.network.addParallel(groupId, children, label);
    } catch (const std::invalid_argument& ex) {
        report(lineNumber, ex.what());
        return std::nullopt;
    }
}

void ProblemParser::finishProblem(int lineNumber)
{
    Draft& d = *draft;
    PracticeProblem& problem = d.problem;

    if (!d.hasSource)
        report(d.startLine, "Problem '" + problem.id + "' has no SOURCE");

    if (d.networkTokens.empty()) {
        report(d.startLine, "Problem '" + problem.id + "' has no .NETWORK");
    } else {
        std::size_t pos = 0;
        std::optional<NodeIndex> root =
            parseNetworkNode(d.networkTokens, pos, d.networkLine);
        if (root) {
            if (pos != d.networkTokens.size()) {
                report(d.networkLine, "Unexpected token '" +
                                          d.networkTokens[pos].text +
                                          "' after network expression");
            } else {
                problem.network.setRoot(*root);
                for (const auto& component : problem.components) {
                    if (d.placedLoads.count(component.id) == 0) {
                        report(d.networkLine, "Load '" + component.id +
                                                  "' is not part of the network");
                    }
                }
            }
        }
    }

    if (!d.hasTarget) {
        report(d.startLine, "Problem '" + problem.id + "' has no .TARGET");
    } else if (!problem.hasRow(problem.targetMetric.rowId)) {
        report(lineNumber, "Target row '" + problem.targetMetric.rowId +
                               "' does not exist in problem '" + problem.id +
                               "'");
    }

    if (d.errors == 0) {
        problems.push_back(std::move(problem));
    } else {
        std::cerr << "Warning: Problem '" << problem.id << "' discarded ("
                  << d.errors << " error" << (d.errors == 1 ? "" : "s") << ")"
                  << std::endl;
    }
    draft.reset();
}

const PracticeProblem* ProblemParser::findProblem(const std::string& id) const
{
    for (const auto& problem : problems) {
        if (problem.id == id) return &problem;
    }
    return nullptr;
}

bool ProblemParser::validateTokens(const std::vector<std::string>& tokens,
                                   std::size_t minSize, int lineNumber)
{
    if (tokens.size() < minSize) {
        std::cerr << "Line " << lineNumber << ": Expected at least " << minSize
                  << " tokens, got " << tokens.size() << std::endl;
        return false;
    }
    return true;
}

// Engineering multiplier for a value suffix, already upper-cased. "M" is
// milli; mega is spelled "MEG".
static bool unitMultiplier(const std::string& suffix, double& factor)
{
    static const std::unordered_map<std::string, double> multipliers = {
        {"", 1.0},    {"T", 1e12},  {"G", 1e9},   {"MEG", 1e6},
        {"K", 1e3},   {"M", 1e-3},  {"U", 1e-6},  {"N", 1e-9},
        {"P", 1e-12}, {"F", 1e-15}};

    auto found = multipliers.find(suffix);
    if (found == multipliers.end()) return false;
    factor = found->second;
    return true;
}

// Whole-token decimal or scientific literal; trailing junk fails.
static bool readNumber(const std::string& text, double& out)
{
    if (text.empty()) return false;
    try {
        size_t used = 0;
        out = std::stod(text, &used);
        return used == text.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

double ProblemParser::parseValue(const std::string& valueStr, int lineNumber,
                                 bool& valid)
{
    valid = false;

    // Trailing letters are the unit suffix, the rest is the number.
    size_t split = valueStr.size();
    while (split > 0 && std::isalpha((unsigned char)valueStr[split - 1]))
        --split;
    std::string number = valueStr.substr(0, split);
    std::string suffix = toUpper(valueStr.substr(split));

    if (number.empty()) {
        std::cerr << "Line " << lineNumber << ": Invalid value '" << valueStr
                  << "'" << std::endl;
        return 0.0;
    }

    double factor = 1.0;
    if (!unitMultiplier(suffix, factor)) {
        std::cerr << "Line " << lineNumber << ": Unknown suffix '" << suffix
                  << "' in value '" << valueStr << "'" << std::endl;
        return 0.0;
    }

    double base = 0.0;
    if (!readNumber(number, base)) {
        if (suffix.empty()) {
            std::cerr << "Line " << lineNumber << ": Invalid value '"
                      << valueStr << "'" << std::endl;
        } else {
            std::cerr << "Line " << lineNumber << ": Invalid numeric part '"
                      << number << "' in '" << valueStr << "'" << std::endl;
        }
        return 0.0;
    }

    valid = true;
    return base * factor;
}
