#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace osmpbf_reader {

// What osmpbf-scan prints per input file
enum class ReportMode {
  Summary, // One line of counts per file
  Blobs    // One line per blob, then the summary
};

// Scan section
struct ScanConfig {
  ReportMode report = ReportMode::Summary;
  std::optional<size_t> max_blobs; // Per pass, unlimited if unset
  int passes = 1;
  bool require_header_first = false;
};

// Complete scanner configuration
struct ReaderConfig {
  std::string config_file_path; // Path to config file (for relative resolution)
  std::vector<std::string> inputs; // Resolved input paths
  ScanConfig scan;
  bool verbose = false;
};

constexpr int kMaxScanPasses = 16;

// Load scanner configuration from YAML file
// Throws std::runtime_error if file cannot be read, parsed, or validated
ReaderConfig load_config(const std::string &path);

// Parse configuration from an already loaded YAML document.
// Relative inputs resolve against base_dir.
// Throws std::runtime_error if the document is invalid
ReaderConfig parse_config(const YAML::Node &yaml, const std::string &base_dir);

// Parse report mode from string
// Throws std::runtime_error if mode is invalid
ReportMode parse_report_mode(const std::string &mode_str);

} // namespace osmpbf_reader
