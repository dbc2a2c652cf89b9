#include "config.hpp"
#include <filesystem>
#include <set>
#include <stdexcept>

namespace osmpbf_reader {

namespace fs = std::filesystem;

// Parse report mode from string
ReportMode parse_report_mode(const std::string &mode_str) {
  if (mode_str == "summary") {
    return ReportMode::Summary;
  } else if (mode_str == "blobs") {
    return ReportMode::Blobs;
  } else {
    throw std::runtime_error("Invalid scan.report: '" + mode_str +
                             "'. Valid values: summary, blobs");
  }
}

// Reject keys outside the allowed set (prevents silently ignored config)
static void check_known_keys(const YAML::Node &section,
                             const std::string &section_name,
                             const std::set<std::string> &allowed) {
  for (const auto &kv : section) {
    const std::string key = kv.first.as<std::string>();
    if (allowed.find(key) == allowed.end()) {
      throw std::runtime_error("[CONFIG] Unknown key '" + section_name + "." +
                               key + "'");
    }
  }
}

static ScanConfig parse_scan_section(const YAML::Node &node) {
  ScanConfig scan;

  if (!node.IsMap()) {
    throw std::runtime_error("[CONFIG] 'scan' section must be a map");
  }
  check_known_keys(node, "scan",
                   {"report", "max_blobs", "passes", "require_header_first"});

  if (node["report"]) {
    try {
      scan.report = parse_report_mode(node["report"].as<std::string>());
    } catch (const std::exception &e) {
      throw std::runtime_error("[CONFIG] " + std::string(e.what()));
    }
  }

  if (node["max_blobs"]) {
    long long max_blobs = 0;
    try {
      max_blobs = node["max_blobs"].as<long long>();
    } catch (const YAML::Exception &) {
      throw std::runtime_error("[CONFIG] scan.max_blobs must be an integer");
    }
    if (max_blobs <= 0) {
      throw std::runtime_error("[CONFIG] scan.max_blobs must be > 0");
    }
    scan.max_blobs = static_cast<size_t>(max_blobs);
  }

  if (node["passes"]) {
    try {
      scan.passes = node["passes"].as<int>();
    } catch (const YAML::Exception &) {
      throw std::runtime_error("[CONFIG] scan.passes must be an integer");
    }
    if (scan.passes < 1 || scan.passes > kMaxScanPasses) {
      throw std::runtime_error("[CONFIG] scan.passes must be in range [1, " +
                               std::to_string(kMaxScanPasses) + "]");
    }
  }

  if (node["require_header_first"]) {
    try {
      scan.require_header_first = node["require_header_first"].as<bool>();
    } catch (const YAML::Exception &) {
      throw std::runtime_error(
          "[CONFIG] scan.require_header_first must be a boolean");
    }
  }

  return scan;
}

ReaderConfig parse_config(const YAML::Node &yaml, const std::string &base_dir) {
  if (!yaml.IsMap()) {
    throw std::runtime_error("[CONFIG] Top level must be a map");
  }
  check_known_keys(yaml, "config", {"inputs", "scan", "logging"});

  ReaderConfig config;

  // Parse inputs - REQUIRED
  if (!yaml["inputs"]) {
    throw std::runtime_error("[CONFIG] Missing required 'inputs' section");
  }
  if (!yaml["inputs"].IsSequence() || yaml["inputs"].size() == 0) {
    throw std::runtime_error("[CONFIG] 'inputs' must be a non-empty sequence");
  }

  for (std::size_t i = 0; i < yaml["inputs"].size(); ++i) {
    const auto &input_node = yaml["inputs"][i];
    if (!input_node.IsScalar()) {
      throw std::runtime_error("[CONFIG] Invalid inputs[" + std::to_string(i) +
                               "]: entry must be a path");
    }

    fs::path input = input_node.as<std::string>();
    if (input.empty()) {
      throw std::runtime_error("[CONFIG] Invalid inputs[" + std::to_string(i) +
                               "]: path is empty");
    }
    if (input.is_relative() && !base_dir.empty()) {
      input = fs::path(base_dir) / input;
    }
    config.inputs.push_back(input.lexically_normal().string());
  }

  if (yaml["scan"]) {
    config.scan = parse_scan_section(yaml["scan"]);
  }

  if (yaml["logging"]) {
    if (!yaml["logging"].IsMap()) {
      throw std::runtime_error("[CONFIG] 'logging' section must be a map");
    }
    check_known_keys(yaml["logging"], "logging", {"verbose"});
    if (yaml["logging"]["verbose"]) {
      try {
        config.verbose = yaml["logging"]["verbose"].as<bool>();
      } catch (const YAML::Exception &) {
        throw std::runtime_error("[CONFIG] logging.verbose must be a boolean");
      }
    }
  }

  return config;
}

ReaderConfig load_config(const std::string &path) {
  YAML::Node yaml;

  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to load config file '" + path +
                             "': " + e.what());
  }

  const fs::path absolute = fs::absolute(path);
  ReaderConfig config = parse_config(yaml, absolute.parent_path().string());
  config.config_file_path = absolute.string();
  return config;
}

} // namespace osmpbf_reader
