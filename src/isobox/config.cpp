#include <isobox/config.h>

#include <fstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <isobox/utils.h>

bool ParseConfig(const std::filesystem::path& conf_path, Config* config) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;

  ManagerConfig& mgr = config->manager;
  long boxes = ini[""]["boxes"] | (long)mgr.boxes;
  mgr.first_box_id = ini[""]["first_box_id"] | mgr.first_box_id;
  mgr.acquire_timeout = (ini[""]["acquire_timeout_ms"] | (mgr.acquire_timeout / 1000)) * 1000;
  mgr.watchdog_margin = (ini[""]["watchdog_margin_ms"] | (mgr.watchdog_margin / 1000)) * 1000;
  mgr.max_memory = (ini[""]["max_memory_mb"] | (mgr.max_memory >> 20)) << 20;
  mgr.max_output = (ini[""]["max_output_mb"] | (mgr.max_output >> 20)) << 20;

  std::string sandbox = ini[""]["sandbox"] | "";
  if (sandbox.size() && !GetSandboxType(sandbox, &config->sandbox)) {
    spdlog::error("Unknown sandbox type {}", sandbox);
    return false;
  }
  std::string isolate_path = ini[""]["isolate_path"] | "";
  std::string meta_root = ini[""]["meta_root"] | "";
  std::string box_root = ini[""]["box_root"] | "";
  if (isolate_path.size()) config->isolate.isolate_path = isolate_path;
  if (meta_root.size()) config->isolate.meta_root = meta_root;
  if (box_root.size()) config->box_root = box_root;
  config->isolate.use_cgroups = ini[""]["use_cgroups"] | config->isolate.use_cgroups;

  if (boxes <= 0 || mgr.first_box_id < 0 || mgr.acquire_timeout < 0 ||
      mgr.watchdog_margin < 0 || mgr.watchdog_margin > kMaxTimeLimit ||
      mgr.max_memory < 0 || mgr.max_output < 0) {
    spdlog::error("Invalid values in configuration file {}", conf_path.c_str());
    return false;
  }
  mgr.boxes = boxes;
  return true;
}
