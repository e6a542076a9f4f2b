/**
 * This file is part of filechunker.
 */

#include "env.h"

#include <unistd.h>

#include <cassert>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

#include "util/posix.h"

const char *FileChunkerEnvironment::kSandboxEnvVariable =
  "FILECHUNKER_UT_SANDBOX";


FileChunkerEnvironment::FileChunkerEnvironment(const int argc, char **argv)
  : is_death_test_execution_(IsDeathTestExecution(argc, argv))
{ }


bool FileChunkerEnvironment::IsDeathTestExecution(const int argc,
                                                  char **argv)
{
  const char *death_test_flag = "--gtest_internal_run_death_test";
  for (int i = 0; i < argc; ++i) {
    if (strncmp(argv[i], death_test_flag, strlen(death_test_flag)) == 0)
      return true;
  }
  return false;
}


void FileChunkerEnvironment::SetUp() {
  assert(sandbox_.empty());
  if (!is_death_test_execution_) {
    CreateSandbox();
  } else {
    AdoptSandboxFromParent();
  }
  ChangeDirectoryToSandbox();
}


void FileChunkerEnvironment::TearDown() {
  if (!is_death_test_execution_)
    RemoveSandbox();
}


void FileChunkerEnvironment::CreateSandbox() {
  const std::string sandbox = CreateTempDir("/tmp/filechunker_ut_sandbox");
  if (sandbox.empty()) {
    std::cerr << "Unittest Setup: Failed to create sandbox directory in /tmp "
              << "(errno: " << errno << ")." << std::endl;
    abort();
  }
  sandbox_ = sandbox;

  if (setenv(kSandboxEnvVariable, sandbox_.c_str(), 1) != 0) {
    std::cerr << "Unittest Setup: Failed to export sandbox path "
              << "(errno: " << errno << ")." << std::endl;
    abort();
  }
}


void FileChunkerEnvironment::AdoptSandboxFromParent() {
  const char *sandbox = getenv(kSandboxEnvVariable);
  if ((sandbox == NULL) || !DirectoryExists(sandbox)) {
    std::cerr << "Unittest Setup: Failed to find the sandbox of the parent "
              << "process in '" << kSandboxEnvVariable << "'" << std::endl;
    abort();
  }
  sandbox_ = sandbox;
}


void FileChunkerEnvironment::RemoveSandbox() {
  assert(!sandbox_.empty());
  unsetenv(kSandboxEnvVariable);
  // Leave the directory before removing it
  if (chdir("/tmp") != 0) {
    std::cerr << "Unittest Teardown: Failed to leave the sandbox "
              << "(errno: " << errno << ")." << std::endl;
  }
  RemoveTree(sandbox_);
  sandbox_ = "";
}


void FileChunkerEnvironment::ChangeDirectoryToSandbox() const {
  if (chdir(sandbox_.c_str()) != 0) {
    std::cerr << "Unittest Setup: Failed to chdir() into sandbox directory "
              << "'" << sandbox_ << "' (errno: " << errno << ")."
              << std::endl;
    abort();
  }
}
