#ifndef INCLUDE_ISOBOX_ISOLATE_H_
#define INCLUDE_ISOBOX_ISOLATE_H_

#include <string>
#include <vector>
#include <filesystem>

#include "sandbox.h"

struct IsolateOptions {
  std::filesystem::path isolate_path; // resolved through PATH if not absolute
  std::filesystem::path meta_root; // meta files are written here, outside of the boxes
  bool use_cgroups; // memory is limited by --cg-mem, otherwise by address space
  std::string env_path; // PATH inside the box

  IsolateOptions() :
      isolate_path("isolate"),
      meta_root("/tmp/isobox_meta"),
      use_cgroups(true),
      env_path("/usr/local/bin:/usr/bin:/bin") {}
};

class IsolateSandbox : public Sandbox {
  IsolateOptions opt_;
 public:
  explicit IsolateSandbox(const IsolateOptions& opt) : opt_(opt) {}

  bool Init(int box_id, std::filesystem::path* box_dir, std::string* error_msg) override;
  std::unique_ptr<SandboxProcess> Launch(const RunOptions& options, std::string* error_msg) override;
  bool Cleanup(int box_id, std::string* error_msg) override;

  std::filesystem::path MetaFile(int box_id) const;
  // full command line of isolate --run
  std::vector<std::string> RunCommand(const RunOptions& options) const;
};

// Parses isolate's meta file content (key:value lines) into stats.
// Returns false on malformed content.
bool ParseIsolateMeta(const std::string& content, RunStats* stats);

#endif  // INCLUDE_ISOBOX_ISOLATE_H_
