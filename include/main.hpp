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
 * @file main.hpp
 * @brief Declarations and documentation for the program entry point.
 *
 * The `wire_tutor` driver (implemented in src/main.cpp) parses command-line
 * options into `TutorOptions`, validates them and dispatches to
 * `runPractice()` with the catalog files named on the command line.
 *
 * Primary responsibilities of the top-level driver:
 *  - Parse long and short CLI options (see TutorOptions for available flags)
 *  - Validate options and report errors to stderr
 *  - Collect the `.prb` catalog paths; when none is given the bundled
 *    catalog directory's `practice.prb` is used
 *  - Call `runPractice` and return its exit code
 *
 * Implementation notes:
 *  - `main.cpp` provides a small internal helper `printHelp(const char*)`
 *    to print usage information. That helper is implementation-local and not
 *    exposed via this header.
 *
 * Example usage:
 *   ./wire_tutor problems/practice.prb
 *   ./wire_tutor --problem series-square-01 --answers answers.txt --steps \
 *       problems/practice.prb
 *
 * See also:
 *  - TutorOptions (include/TutorOptions.hpp) for CLI-configurable options
 *  - runPractice (include/PracticeSession.hpp) which the driver invokes
 */

#pragma once

// This header intentionally does not expose additional symbols. It exists to
// provide a stable place for file-level documentation about the program entry
// point and to be included by the implementation file (src/main.cpp).
