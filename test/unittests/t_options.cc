/**
 * This file is part of filechunker.
 */

#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <string>

#include "options.h"
#include "util/posix.h"

using namespace std;  // NOLINT

class T_Options : public ::testing::Test {
 protected:
  virtual void SetUp() {
    FILE *temp_file = CreateTempFile("./filechunker_ut_options", 0600, "w",
                                     &config_file_);
    ASSERT_TRUE(temp_file != NULL);
    FILE *temp_file_2 = CreateTempFile("./filechunker_ut_options2", 0600, "w",
                                       &config_file_2_);
    ASSERT_TRUE(temp_file_2 != NULL);

    fprintf(temp_file,
            "FILECHUNKER_CHUNKS=8\n"
            "FILECHUNKER_DELIMITER=\\n\n"
            "IdontHaveAnEqual\n"
            "I=have=twoEquals\n"
            "XYZABC = and spaces\n"
            "value=\n"
            "export A=B\n"
            "=only equal sign\n"
            " =equal sign with space\n"
            "KEY WITH SPACE=x\n"
            "\n"
            "#\n"
            "# FILECHUNKER_WORKERS=yes\n"
            "D=E # not a comment\n"
            "F=\"G\"\n"
            "H='I' \n"
            "Q=\"\n"
            "FILECHUNKER_VERBOSE=on\r\n"
            "LAST=no newline");
    ASSERT_EQ(0, fclose(temp_file));
    fprintf(temp_file_2, "FILECHUNKER_CHUNKS=16\n");
    ASSERT_EQ(0, fclose(temp_file_2));
  }

  virtual void TearDown() {
    unlink(config_file_.c_str());
    unlink(config_file_2_.c_str());
    unsetenv("FILECHUNKER_UT_OPTION");
    unsetenv("FILECHUNKER_UT_EMPTY");
    unsetenv("NOT_FILECHUNKER_UT_OPTION");
  }

  SimpleOptionsParser options_;
  string config_file_;
  string config_file_2_;
};


TEST_F(T_Options, ParsePath) {
  string container;
  ASSERT_TRUE(options_.TryParsePath(config_file_));

  EXPECT_TRUE(options_.GetValue("FILECHUNKER_CHUNKS", &container));
  EXPECT_EQ("8", container);
  EXPECT_TRUE(options_.GetValue("FILECHUNKER_DELIMITER", &container));
  EXPECT_EQ("\\n", container);
  EXPECT_TRUE(options_.GetValue("I", &container));
  EXPECT_EQ("have=twoEquals", container);
  EXPECT_TRUE(options_.GetValue("XYZABC", &container));
  EXPECT_EQ("and spaces", container);
  EXPECT_TRUE(options_.GetValue("value", &container));
  EXPECT_EQ("", container);
  EXPECT_TRUE(options_.GetValue("A", &container));
  EXPECT_EQ("B", container);
  EXPECT_TRUE(options_.GetValue("D", &container));
  EXPECT_EQ("E # not a comment", container);
  EXPECT_TRUE(options_.GetValue("F", &container));
  EXPECT_EQ("G", container);
  EXPECT_TRUE(options_.GetValue("H", &container));
  EXPECT_EQ("I", container);
  EXPECT_TRUE(options_.GetValue("Q", &container));
  EXPECT_EQ("\"", container);
  EXPECT_TRUE(options_.GetValue("FILECHUNKER_VERBOSE", &container));
  EXPECT_EQ("on", container);
  EXPECT_TRUE(options_.GetValue("LAST", &container));
  EXPECT_EQ("no newline", container);

  EXPECT_FALSE(options_.GetValue("IdontHaveAnEqual", &container));
  EXPECT_FALSE(options_.GetValue("FILECHUNKER_WORKERS", &container));
  EXPECT_FALSE(options_.GetValue("KEY WITH SPACE", &container));
  EXPECT_FALSE(options_.GetValue("", &container));
  options_.SetValue("UNDEFINED", "x");
  EXPECT_FALSE(options_.GetValue("UNDEFINED_TOO", &container));
  EXPECT_EQ("", container);

  // Twelve assignments plus the injected value, one line each
  const string dump = options_.Dump();
  unsigned num_lines = 0;
  for (unsigned i = 0; i < dump.length(); ++i) {
    if (dump[i] == '\n')
      num_lines++;
  }
  EXPECT_EQ(13U, num_lines);
  EXPECT_NE(string::npos,
            dump.find("FILECHUNKER_CHUNKS=8    # from " + config_file_ + "\n"));
}


TEST_F(T_Options, ParseMissingPath) {
  EXPECT_FALSE(options_.TryParsePath("./no_such_config"));
  EXPECT_EQ("", options_.Dump());
}


TEST_F(T_Options, LaterSourcesOverwrite) {
  string container;
  ASSERT_TRUE(options_.TryParsePath(config_file_));
  ASSERT_TRUE(options_.TryParsePath(config_file_2_));
  EXPECT_TRUE(options_.GetValue("FILECHUNKER_CHUNKS", &container));
  EXPECT_EQ("16", container);
  EXPECT_NE(string::npos, options_.Dump().find(
    "FILECHUNKER_CHUNKS=16    # from " + config_file_2_ + "\n"));

  options_.SetValue("FILECHUNKER_CHUNKS", "3");
  EXPECT_TRUE(options_.GetValue("FILECHUNKER_CHUNKS", &container));
  EXPECT_EQ("3", container);
  EXPECT_NE(string::npos, options_.Dump().find(
    "FILECHUNKER_CHUNKS=3    # from @INTERNAL@\n"));
}


TEST_F(T_Options, ParseEnvironment) {
  string container;
  ASSERT_EQ(0, setenv("FILECHUNKER_UT_OPTION", "a=b", 1));
  ASSERT_EQ(0, setenv("FILECHUNKER_UT_EMPTY", "", 1));
  ASSERT_EQ(0, setenv("NOT_FILECHUNKER_UT_OPTION", "x", 1));
  options_.ParseEnvironment("FILECHUNKER_UT_");

  EXPECT_TRUE(options_.GetValue("FILECHUNKER_UT_OPTION", &container));
  EXPECT_EQ("a=b", container);
  EXPECT_TRUE(options_.GetValue("FILECHUNKER_UT_EMPTY", &container));
  EXPECT_EQ("", container);
  EXPECT_FALSE(options_.GetValue("NOT_FILECHUNKER_UT_OPTION", &container));
  EXPECT_NE(string::npos, options_.Dump().find(
    "FILECHUNKER_UT_OPTION=a=b    # from environment\n"));
}


TEST_F(T_Options, Dump) {
  options_.SetValue("B", "2");
  options_.SetValue("A", "1");
  EXPECT_EQ("A=1    # from @INTERNAL@\nB=2    # from @INTERNAL@\n",
            options_.Dump());
}


TEST_F(T_Options, IsOn) {
  EXPECT_TRUE(options_.IsOn("yes"));
  EXPECT_TRUE(options_.IsOn("YES"));
  EXPECT_TRUE(options_.IsOn("On"));
  EXPECT_TRUE(options_.IsOn("1"));
  EXPECT_TRUE(options_.IsOn("true"));
  EXPECT_FALSE(options_.IsOn("no"));
  EXPECT_FALSE(options_.IsOn("0"));
  EXPECT_FALSE(options_.IsOn(""));
  EXPECT_FALSE(options_.IsOn("yess"));
}
