/**
 * This file is part of filechunker.
 */

#ifndef TEST_UNITTESTS_ENV_H_
#define TEST_UNITTESTS_ENV_H_

#include <gtest/gtest.h>

#include <string>

/**
 * Creates a sandbox directory in /tmp and changes into it, so that unit tests
 * can create their files relative to the working directory.
 *
 * Death tests re-spawn the test binary.  Such a child process finds the
 * sandbox of its parent in the environment and re-uses it instead of creating
 * (and leaking) a new one.
 */
class FileChunkerEnvironment : public ::testing::Environment {
 public:
  FileChunkerEnvironment(const int argc, char **argv);

  virtual void SetUp();
  virtual void TearDown();

 protected:
  static bool IsDeathTestExecution(const int argc, char **argv);

 private:
  static const char *kSandboxEnvVariable;

  void ChangeDirectoryToSandbox() const;
  void CreateSandbox();
  void AdoptSandboxFromParent();
  void RemoveSandbox();

  const bool   is_death_test_execution_;
  std::string  sandbox_;
};

#endif  // TEST_UNITTESTS_ENV_H_
