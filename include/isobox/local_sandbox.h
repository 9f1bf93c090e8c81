#ifndef INCLUDE_ISOBOX_LOCAL_SANDBOX_H_
#define INCLUDE_ISOBOX_LOCAL_SANDBOX_H_

#include <filesystem>

#include "sandbox.h"

// Runs programs directly on the host under rlimits, one directory per box.
// No filesystem, user or network isolation is provided. Memory is the polled
// resident set of the program itself, and the process limit is per user
// (RLIMIT_NPROC). Processes left in the program's process group are killed
// once it exits; ones that start their own session escape.
class LocalSandbox : public Sandbox {
  std::filesystem::path box_root_;
 public:
  explicit LocalSandbox(const std::filesystem::path& box_root) : box_root_(box_root) {}

  bool Init(int box_id, std::filesystem::path* box_dir, std::string* error_msg) override;
  std::unique_ptr<SandboxProcess> Launch(const RunOptions& options, std::string* error_msg) override;
  bool Cleanup(int box_id, std::string* error_msg) override;

  std::filesystem::path BoxDir(int box_id) const;
};

#endif  // INCLUDE_ISOBOX_LOCAL_SANDBOX_H_
