#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <thread>
#include <chrono>
#include <filesystem>

#include <gtest/gtest.h>

// A fresh directory under /tmp for each test
class TempDirTest : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  std::filesystem::path tmp_dir;
};

// Writes a file with mode 0755
std::filesystem::path WriteExecutable(const std::filesystem::path& path, const std::string& content);

// Polls pred every millisecond; returns false on timeout
template <class Pred> bool WaitFor(Pred&& pred, int timeout_ms = 5000) {
  for (int i = 0; i < timeout_ms; i++) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return pred();
}

#endif // TEST_UTILS_H_
