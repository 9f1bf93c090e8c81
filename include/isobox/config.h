#ifndef INCLUDE_ISOBOX_CONFIG_H_
#define INCLUDE_ISOBOX_CONFIG_H_

#include <string>
#include <cstdint>
#include <filesystem>

#include "isolate.h"

struct ManagerConfig {
  size_t boxes;
  int first_box_id;
  int64_t acquire_timeout; // us; 0 = wait forever
  int64_t watchdog_margin; // us
  // host-wide caps in bytes; 0 = none
  int64_t max_memory;
  int64_t max_output;

  ManagerConfig() :
      boxes(1), first_box_id(0),
      acquire_timeout(0),
      watchdog_margin(1'000'000),
      max_memory(2048L * 1024 * 1024),
      max_output(64L * 1024 * 1024) {}
};

#define ENUM_SANDBOX_TYPE_ \
  X(ISOLATE, "isolate") \
  X(LOCAL, "local")
enum class SandboxType {
#define X(name, str) name,
  ENUM_SANDBOX_TYPE_
#undef X
};

struct Config {
  ManagerConfig manager;
  SandboxType sandbox;
  IsolateOptions isolate;
  std::filesystem::path box_root; // LocalSandbox

  Config() : sandbox(SandboxType::ISOLATE), box_root("/tmp/isobox_box") {}
};

// Reads an INI file; keys missing from the file keep their current value in config
bool ParseConfig(const std::filesystem::path&, Config* config);

#endif  // INCLUDE_ISOBOX_CONFIG_H_
