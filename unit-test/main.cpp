#include <glog/logging.h>
#include <filesystem>
#include "common/utils.hpp"
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    // every test run works in a scratch directory of its own
    codegrade::TEMP_DIR = std::filesystem::temp_directory_path() / ("codegrade-test-" + codegrade::generate_uuid());
    std::filesystem::create_directories(codegrade::TEMP_DIR);
  }
  virtual void TearDown() {
    std::error_code ec;
    std::filesystem::remove_all(codegrade::TEMP_DIR, ec);
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
