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
 * @file PracticeSession.cpp
 * @brief Practice session state plus the catalog-driven driver.
 */

#include "PracticeSession.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "NodalCrossCheck.hpp"
#include "ProblemParser.hpp"
#include "ProblemValidator.hpp"

PracticeSession::PracticeSession(GradingTolerance tolerance)
    : window(tolerance)
{
}

void PracticeSession::requireProblem() const
{
    if (!active) throw std::logic_error("No practice problem selected");
}

void PracticeSession::selectProblem(const PracticeProblem& problem)
{
    active = problem;
    solved = trySolvePracticeProblem(*active);
    grader.emplace(*active, *solved, window);
    sheet = grader->baseline();

    if (solved->ok()) {
        reason.clear();
    } else {
        std::ostringstream oss;
        oss << solved->error().kind << ": " << solved->error().message;
        reason = oss.str();
    }
}

const PracticeProblem& PracticeSession::problem() const
{
    requireProblem();
    return *active;
}

const SolveAttempt& PracticeSession::attempt() const
{
    requireProblem();
    return *solved;
}

bool PracticeSession::available() const { return active && solved->ok(); }

const Worksheet& PracticeSession::worksheet() const
{
    requireProblem();
    return sheet;
}

const Worksheet& PracticeSession::edit(const std::string& rowId, MetricKey key,
                                       const std::string& raw)
{
    requireProblem();
    sheet = grader->onCellEdit(sheet, rowId, key, raw);
    return sheet;
}

void PracticeSession::resetToBaseline()
{
    requireProblem();
    sheet = grader->baseline();
}

bool PracticeSession::complete() const { return active && sheet.complete(); }

std::optional<double> PracticeSession::revealTarget(bool force) const
{
    if (!available()) return std::nullopt;
    if (!force && !sheet.complete()) return std::nullopt;
    return targetValue(solved->data(), *active);
}

std::vector<SolutionStep> PracticeSession::solutionSteps() const
{
    if (!available()) return {};
    return buildSolutionSteps(*active, solved->data());
}

static const char* statusMark(CellStatus status)
{
    switch (status) {
        case CellStatus::Correct:
            return "ok";
        case CellStatus::Incorrect:
            return "x";
        case CellStatus::Invalid:
            return "?";
        default:
            return "";
    }
}

void printWireTable(std::ostream& os, const Worksheet& sheet)
{
    os << std::left << std::setw(14) << "Row";
    for (MetricKey key : METRIC_ORDER)
        os << std::setw(16) << (metricSymbol(key) + " (" + metricUnit(key) + ")");
    os << "\n";

    for (const auto& row : sheet.rows()) {
        os << std::setw(14) << row.label;
        for (MetricKey key : METRIC_ORDER) {
            const WorksheetCell& cell = row.cell(key);
            std::string text = displayCell(cell, key);
            if (cell.given)
                text = "[" + text + "]";
            else if (cell.status != CellStatus::Blank)
                text += std::string(" ") + statusMark(cell.status);
            os << std::setw(16) << text;
        }
        os << "\n";
    }
    os << std::right;
}

int applyAnswers(PracticeSession& session, std::istream& in)
{
    int errors = 0;
    int lineNumber = 0;
    std::string line;

    while (std::getline(in, line)) {
        ++lineNumber;
        size_t first = line.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) continue;
        if (line[first] == '#' || line[first] == '*') continue;

        std::istringstream iss(line);
        std::string rowId;
        std::string metric;
        iss >> rowId >> metric;
        std::string rest;
        std::getline(iss, rest);

        MetricKey key;
        if (metric.empty() || !parseMetricKey(metric, key)) {
            std::cerr << "Line " << lineNumber << ": Unknown metric '" << metric
                      << "'" << std::endl;
            ++errors;
            continue;
        }
        const WorksheetCell* cell = session.worksheet().cell(rowId, key);
        if (cell == nullptr) {
            std::cerr << "Line " << lineNumber << ": Unknown row '" << rowId
                      << "'" << std::endl;
            ++errors;
            continue;
        }
        if (cell->given) {
            std::cerr << "Warning: Line " << lineNumber << ": " << rowId << " "
                      << metricSymbol(key) << " is given and cannot be edited"
                      << std::endl;
            continue;
        }
        session.edit(rowId, key, rest);
    }
    return errors;
}

// Recompute the totals derivation the way the solver does, for the log.
static void logDerivations(std::ostream& diag, const PracticeProblem& problem,
                           const SolveResult& result)
{
    PartialWireMetrics drive =
        mergeMetrics(problem.totalsGivens, problem.source.solverInputs());
    drive.erase(MetricKey::Resistance);
    drive.set(MetricKey::Resistance, result.equivalentResistance);
    SolvedWireMetrics solved = solveWireMetrics(drive);
    for (const auto& entry : solved.derived)
        diag << "  derived " << metricSymbol(entry.first) << ": "
             << entry.second.formula << "\n";
}

static void writeDiagnostics(std::ostream& diag, const PracticeProblem& problem,
                             const SolveAttempt& attempt,
                             const std::vector<ValidationIssue>& issues,
                             bool verbose)
{
    diag << "--- Problem '" << problem.id << "' (" << problem.topology << ", "
         << problem.difficulty << ") ---\n";
    if (!attempt.ok()) {
        diag << "solve: failed (" << attempt.error().kind << ": "
             << attempt.error().message << ")\n";
    } else {
        const SolveResult& result = attempt.data();
        diag << "solve: ok\n";
        diag << "equivalent resistance: " << result.equivalentResistance
             << "\n";
        if (verbose) {
            diag << "totals: " << result.totals << "\n";
            logDerivations(diag, problem, result);
            for (const auto& entry : result.components)
                diag << "  " << entry.first << ": " << entry.second << "\n";
            NodalCheckReport report = crossCheckSolution(problem, result);
            diag << "nodal: solved=" << report.solved
                 << " nodes=" << report.nodeCount
                 << " maxCurrentDev=" << report.maxCurrentDeviation
                 << " maxVoltageDev=" << report.maxVoltageDeviation
                 << " residual=" << report.residual << "\n";
        }
    }
    for (const auto& issue : issues)
        diag << issue.severity << ": " << issue.message << "\n";
}

static void printAudit(std::ostream& os, const PracticeProblem& problem,
                       const SolveAttempt& attempt)
{
    if (!attempt.ok()) {
        os << "Audit: not solved\n";
        return;
    }
    NodalCheckReport report = crossCheckSolution(problem, attempt.data());
    if (!report.solved) {
        os << "Audit: nodal check failed: " << report.message << "\n";
        return;
    }
    os << "Audit: " << report.nodeCount << " nodes, source current "
       << formatMetricValue(report.sourceCurrent, MetricKey::Current)
       << ", max deviation I " << report.maxCurrentDeviation << " E "
       << report.maxVoltageDeviation << ", residual " << report.residual
       << (report.consistent() ? " (consistent)" : " (INCONSISTENT)") << "\n";
}

static void printSteps(std::ostream& os, const std::vector<SolutionStep>& steps)
{
    os << "Solution Steps:\n";
    for (size_t i = 0; i < steps.size(); ++i) {
        os << "  " << (i + 1) << ". " << steps[i].title << "\n";
        std::istringstream lines(steps[i].detail);
        std::string line;
        while (std::getline(lines, line)) os << "       " << line << "\n";
        if (!steps[i].formula.empty())
            os << "       [" << steps[i].formula << "]\n";
    }
}

int runPractice(const std::vector<std::string>& files,
                const TutorOptions& options)
{
    if (files.empty()) {
        std::cerr << "Error: No problem catalog given" << std::endl;
        return 1;
    }

    ProblemParser parser;
    int parseErrors = 0;
    for (const auto& file : files) parseErrors += parser.parse(file);
    if (parseErrors > 0) {
        std::cerr << "Error: " << parseErrors
                  << " error(s) while reading problem catalogs" << std::endl;
    }
    if (parser.problems.empty()) {
        std::cerr << "Error: No usable problems loaded" << std::endl;
        return 1;
    }

    std::ofstream diag(options.diagFile);
    if (!diag) {
        std::cerr << "Warning: Could not open " << options.diagFile
                  << " for writing. Diagnostics will not be saved."
                  << std::endl;
    }

    // One solve per problem; the audit and the log share it.
    std::vector<SolveAttempt> attempts;
    std::vector<std::vector<ValidationIssue>> audit;
    for (const auto& problem : parser.problems) {
        attempts.push_back(trySolvePracticeProblem(problem));
        audit.push_back(validateSolved(problem, attempts.back()));
        if (diag)
            writeDiagnostics(diag, problem, attempts.back(), audit.back(),
                             options.diagVerbose);
    }

    if (options.problemId.empty()) {
        std::cout << "Loaded " << parser.problems.size() << " problem(s):\n";
        for (size_t i = 0; i < parser.problems.size(); ++i) {
            const PracticeProblem& problem = parser.problems[i];
            std::cout << "  " << std::left << std::setw(28) << problem.id
                      << std::setw(12) << problem.topology << std::setw(10)
                      << problem.difficulty << std::right << problem.title;
            if (hasErrors(audit[i]))
                std::cout << "  [unavailable: " << firstError(audit[i]) << "]";
            std::cout << "\n";
            if (options.audit) printAudit(std::cout, problem, attempts[i]);
        }
        return parseErrors > 0 ? 1 : 0;
    }

    const PracticeProblem* problem = parser.findProblem(options.problemId);
    if (problem == nullptr) {
        std::cerr << "Error: Unknown problem '" << options.problemId << "'"
                  << std::endl;
        return 1;
    }

    const std::vector<ValidationIssue>& issues =
        audit[static_cast<size_t>(problem - parser.problems.data())];
    for (const auto& issue : issues) {
        if (issue.severity == IssueSeverity::Warning)
            std::cerr << "Warning: [" << problem->id << "] " << issue.message
                      << std::endl;
    }
    if (hasErrors(issues)) {
        std::cout << "Problem '" << problem->id
                  << "' is unavailable: " << firstError(issues) << std::endl;
        return 1;
    }

    PracticeSession session(options.grading());
    session.selectProblem(*problem);

    std::cout << problem->title << "\n";
    if (!problem->prompt.empty()) std::cout << problem->prompt << "\n";
    if (!problem->targetQuestion.empty())
        std::cout << problem->targetQuestion << "\n";
    std::cout << "\n";

    int answerErrors = 0;
    if (!options.answersFile.empty()) {
        if (options.answersFile == "-") {
            answerErrors = applyAnswers(session, std::cin);
        } else {
            std::ifstream answers(options.answersFile);
            if (!answers) {
                std::cerr << "Error: Answer script '" << options.answersFile
                          << "' could not be opened" << std::endl;
                return 1;
            }
            answerErrors = applyAnswers(session, answers);
        }
    }

    printWireTable(std::cout, session.worksheet());
    const Worksheet& sheet = session.worksheet();
    if (session.complete()) {
        std::cout << "\nWorksheet complete.\n";
    } else {
        std::cout << "\n"
                  << sheet.countStatus(CellStatus::Correct) << " correct, "
                  << sheet.countStatus(CellStatus::Incorrect) << " incorrect, "
                  << sheet.countStatus(CellStatus::Invalid) << " invalid, "
                  << sheet.countStatus(CellStatus::Blank) << " blank.\n";
    }

    std::optional<double> target = session.revealTarget(options.revealAll);
    if (target) {
        std::cout << "Answer: " << problem->targetMetric.rowId << " "
                  << metricSymbol(problem->targetMetric.key) << " = "
                  << formatMetricValue(*target, problem->targetMetric.key)
                  << "\n";
    }

    if (options.showSteps) printSteps(std::cout, session.solutionSteps());
    if (options.audit) printAudit(std::cout, *problem, session.attempt());

    return answerErrors > 0 ? 1 : 0;
}
