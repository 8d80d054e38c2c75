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
 * @file main.cpp
 *
 * @brief Command-line driver for the W.I.R.E. practice tutor.
 */

#include "main.hpp"

#include <getopt.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "PracticeSession.hpp"
#include "TutorOptions.hpp"

#ifndef WIRE_TUTOR_PROBLEMS_DIR
#define WIRE_TUTOR_PROBLEMS_DIR "problems"
#endif

static void printHelp(const char *prog)
{
    std::cout << "Usage: " << prog << " [options] [catalog.prb ...]\n";
    std::cout << "Options:\n";
    std::cout << "  --problem <id>            Work on one problem (default: "
                 "list all)\n";
    std::cout << "  --answers <file|->        Answer script, one 'row metric "
                 "value' per line\n";
    std::cout << "  --steps                   Print the worked solution\n";
    std::cout << "  --reveal                  Print the target answer even if "
                 "incomplete\n";
    std::cout << "  --audit                   Print the nodal cross-check "
                 "report\n";
    std::cout << "  --rel-tol <double>        Relative answer tolerance "
                 "(default 0.01)\n";
    std::cout << "  --abs-tol <double>        Absolute tolerance near zero "
                 "(default 0.001)\n";
    std::cout << "  --near-zero <double>      Near-zero threshold (default "
                 "0.0001)\n";
    std::cout << "  --diag-file <file>        Diagnostics output file (default "
                 "wire_tutor.log)\n";
    std::cout << "  --diag-verbose            Verbose diagnostics\n";
    std::cout << "  --help                    Show this help message\n";
}

static bool parseDouble(const char *text, const std::string &name,
                        double &out)
{
    bool valid = false;
    try {
        size_t idx = 0;
        out = std::stod(text, &idx);
        valid = (idx == std::string(text).size());
    } catch (const std::invalid_argument &) {
        valid = false;
    } catch (const std::out_of_range &) {
        valid = false;
    }
    if (!valid)
        std::cerr << "Error: Invalid value '" << text << "' for --" << name
                  << std::endl;
    return valid;
}

int main(int argc, char *argv[])
{
    TutorOptions options;

    static struct option long_options[] = {
        {"problem", required_argument, 0, 0},
        {"answers", required_argument, 0, 0},
        {"steps", no_argument, 0, 0},
        {"reveal", no_argument, 0, 0},
        {"audit", no_argument, 0, 0},
        {"rel-tol", required_argument, 0, 0},
        {"abs-tol", required_argument, 0, 0},
        {"near-zero", required_argument, 0, 0},
        {"diag-file", required_argument, 0, 0},
        {"diag-verbose", no_argument, 0, 0},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}};

    int option_index = 0;
    int c;
    while ((c = getopt_long(argc, argv, "h", long_options, &option_index)) !=
           -1) {
        if (c == 'h') {
            printHelp(argv[0]);
            return 0;
        } else if (c == 0) {
            std::string name = long_options[option_index].name;
            bool ok = true;
            if (name == "problem")
                options.problemId = std::string(optarg);
            else if (name == "answers")
                options.answersFile = std::string(optarg);
            else if (name == "steps")
                options.showSteps = true;
            else if (name == "reveal")
                options.revealAll = true;
            else if (name == "audit")
                options.audit = true;
            else if (name == "rel-tol")
                ok = parseDouble(optarg, name, options.relTol);
            else if (name == "abs-tol")
                ok = parseDouble(optarg, name, options.absTol);
            else if (name == "near-zero")
                ok = parseDouble(optarg, name, options.nearZero);
            else if (name == "diag-file")
                options.diagFile = std::string(optarg);
            else if (name == "diag-verbose")
                options.diagVerbose = true;
            if (!ok) return 1;
        } else {
            printHelp(argv[0]);
            return 1;
        }
    }

    // Remaining non-option args: catalog files
    std::vector<std::string> files;
    for (int i = optind; i < argc; ++i) files.push_back(argv[i]);
    if (files.empty())
        files.push_back(std::string(WIRE_TUTOR_PROBLEMS_DIR) + "/practice.prb");

    try {
        options.validate();
    } catch (const std::invalid_argument &ex) {
        std::cerr << "Invalid tutor option: " << ex.what() << std::endl;
        return 1;
    }

    return runPractice(files, options);
}
