#include <gtest/gtest.h>

#include "TutorOptions.hpp"

#include <limits>
#include <stdexcept>

/*
 * tutor_options_test.cpp
 *
 * Unit tests for TutorOptions::validate() and TutorOptions::grading().
 */

TEST(TutorOptions, DefaultsAreValid)
{
  TutorOptions options;
  EXPECT_NO_THROW(options.validate());

  GradingTolerance t = options.grading();
  EXPECT_DOUBLE_EQ(t.relative, 0.01);
  EXPECT_DOUBLE_EQ(t.absolute, 1e-3);
  EXPECT_DOUBLE_EQ(t.nearZero, 1e-4);
}

TEST(TutorOptions, RejectsBadTolerances)
{
  TutorOptions options;
  options.relTol = 1.0;
  EXPECT_THROW(options.validate(), std::invalid_argument);

  options = TutorOptions();
  options.absTol = -1e-3;
  EXPECT_THROW(options.validate(), std::invalid_argument);

  options = TutorOptions();
  options.nearZero = std::numeric_limits<double>::infinity();
  EXPECT_THROW(options.validate(), std::invalid_argument);
}

TEST(TutorOptions, AnswersNeedAProblem)
{
  TutorOptions options;
  options.answersFile = "answers.txt";
  EXPECT_THROW(options.validate(), std::invalid_argument);

  options.problemId = "series-square-01";
  EXPECT_NO_THROW(options.validate());

  options.diagFile.clear();
  EXPECT_THROW(options.validate(), std::invalid_argument);
}

TEST(TutorOptions, GradingCarriesOverrides)
{
  TutorOptions options;
  options.relTol = 0.05;
  options.absTol = 0.01;
  EXPECT_TRUE(withinTolerance(10.0, 10.4, options.grading()));
  EXPECT_FALSE(withinTolerance(10.0, 10.4));
}
