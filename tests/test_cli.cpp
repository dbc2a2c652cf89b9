#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "core/cli.hpp"
#include "test_util.hpp"

using osmpbf_cli::CliArgs;
using osmpbf_cli::kExitOk;
using osmpbf_cli::kExitReadError;
using osmpbf_cli::kExitUsage;
using osmpbf_cli::parse_args;
using osmpbf_cli::run;
using osmpbf_cli::UsageError;
using osmpbf_reader::ReportMode;
using test_util::record;
using test_util::TempFile;

namespace fs = std::filesystem;

namespace {

struct RunResult {
  int code;
  std::string out;
  std::string err;
};

RunResult run_cli(const std::vector<std::string> &args) {
  std::ostringstream out;
  std::ostringstream err;
  const int code = run(args, out, err);
  return RunResult{code, out.str(), err.str()};
}

std::string two_blob_file() {
  return record("OSMHeader", test_util::raw_blob({1, 2})) +
         record("OSMData", test_util::zlib_blob({3, 4, 5}, 9));
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(CliArgsTest, ParsesScanFlags) {
  const CliArgs args = parse_args({"--blobs", "--verbose", "--max-blobs", "5",
                                   "--passes", "3", "--require-header-first",
                                   "a.osm.pbf", "b.osm.pbf"});
  EXPECT_FALSE(args.config_path.has_value());
  EXPECT_EQ(args.config.inputs, (std::vector<std::string>{"a.osm.pbf", "b.osm.pbf"}));
  EXPECT_EQ(args.config.scan.report, ReportMode::Blobs);
  EXPECT_TRUE(args.config.verbose);
  ASSERT_TRUE(args.config.scan.max_blobs.has_value());
  EXPECT_EQ(*args.config.scan.max_blobs, 5u);
  EXPECT_EQ(args.config.scan.passes, 3);
  EXPECT_TRUE(args.config.scan.require_header_first);
}

TEST(CliArgsTest, ConfigAlone) {
  const CliArgs args = parse_args({"--config", "scan.yaml"});
  ASSERT_TRUE(args.config_path.has_value());
  EXPECT_EQ(*args.config_path, "scan.yaml");
}

TEST(CliArgsTest, MissingValues) {
  for (const std::string flag : {"--config", "--max-blobs", "--passes"}) {
    try {
      parse_args({"a.osm.pbf", flag});
      FAIL() << "expected UsageError for " << flag;
    } catch (const UsageError &e) {
      EXPECT_EQ(std::string(e.what()), "missing value for " + flag);
    }
  }
}

TEST(CliArgsTest, RejectsInvalidValues) {
  EXPECT_THROW(parse_args({"--passes", "0", "a"}), UsageError);
  EXPECT_THROW(parse_args({"--passes", "17", "a"}), UsageError);
  EXPECT_THROW(parse_args({"--passes", "two", "a"}), UsageError);
  EXPECT_THROW(parse_args({"--max-blobs", "0", "a"}), UsageError);
  EXPECT_THROW(parse_args({"--max-blobs", "5x", "a"}), UsageError);
  EXPECT_THROW(parse_args({"--frobnicate", "a"}), UsageError);
  EXPECT_THROW(parse_args({}), UsageError);
}

TEST(CliArgsTest, ConfigExcludesOtherInputsAndFlags) {
  EXPECT_THROW(parse_args({"--config", "scan.yaml", "a.osm.pbf"}), UsageError);

  for (const std::vector<std::string> &extra :
       std::vector<std::vector<std::string>>{{"--blobs"},
                                             {"--verbose"},
                                             {"--require-header-first"},
                                             {"--max-blobs", "5"},
                                             {"--passes", "2"}}) {
    std::vector<std::string> args = {"--config", "scan.yaml"};
    args.insert(args.end(), extra.begin(), extra.end());
    try {
      parse_args(args);
      FAIL() << "expected UsageError for " << extra.front();
    } catch (const UsageError &e) {
      EXPECT_EQ(std::string(e.what()),
                extra.front() + " cannot be combined with --config");
    }
  }
}

TEST(CliRunTest, UsageErrorsExitOne) {
  RunResult r = run_cli({"--frobnicate", "a.osm.pbf"});
  EXPECT_EQ(r.code, kExitUsage);
  EXPECT_TRUE(contains(r.err, "unknown option: --frobnicate")) << r.err;
  EXPECT_TRUE(contains(r.err, "Usage:"));
  EXPECT_TRUE(r.out.empty());

  r = run_cli({"--passes", "99", "a.osm.pbf"});
  EXPECT_EQ(r.code, kExitUsage);

  r = run_cli({"--config", "scan.yaml", "a.osm.pbf"});
  EXPECT_EQ(r.code, kExitUsage);
  EXPECT_TRUE(contains(r.err, "cannot be combined with --config")) << r.err;

  r = run_cli({"--config"});
  EXPECT_EQ(r.code, kExitUsage);
  EXPECT_TRUE(contains(r.err, "missing value for --config")) << r.err;
}

TEST(CliRunTest, BadConfigFileExitsOne) {
  const RunResult r = run_cli({"--config", test_util::temp_path(".yaml")});
  EXPECT_EQ(r.code, kExitUsage);
  EXPECT_TRUE(contains(r.err, "Failed to load config file")) << r.err;
}

TEST(CliRunTest, SummaryLineExitsZero) {
  TempFile file(two_blob_file());
  const RunResult r = run_cli({file.path()});

  EXPECT_EQ(r.code, kExitOk) << r.err;
  EXPECT_TRUE(contains(r.out, file.path() + ": blobs=2 header=1 primitive=1 "
                                            "raw=1 zlib=1 payload_bytes=5"))
      << r.out;
  EXPECT_TRUE(contains(r.out, "passes=1"));
  EXPECT_FALSE(contains(r.out, "#0"));
}

TEST(CliRunTest, BlobsListing) {
  TempFile file(two_blob_file());
  const RunResult r = run_cli({"--blobs", file.path()});

  EXPECT_EQ(r.code, kExitOk) << r.err;
  EXPECT_TRUE(contains(r.out, file.path() + ":\n")) << r.out;
  EXPECT_TRUE(contains(r.out, "  #0 header codec=raw bytes=2\n")) << r.out;
  EXPECT_TRUE(contains(r.out, "  #1 primitive codec=zlib bytes=3 raw_size=9\n"))
      << r.out;
}

TEST(CliRunTest, MalformedFileExitsTwo) {
  TempFile good(two_blob_file());
  TempFile bad(record("OSMHeader", test_util::raw_blob({1})) +
               record("OSMIndex", test_util::raw_blob({2})));
  const RunResult r = run_cli({bad.path(), good.path()});

  EXPECT_EQ(r.code, kExitReadError);
  EXPECT_TRUE(contains(r.err, bad.path() + ": UnknownBlobType")) << r.err;
  // Remaining inputs are still scanned.
  EXPECT_TRUE(contains(r.out, good.path() + ": blobs=2")) << r.out;
}

TEST(CliRunTest, MissingFileExitsTwo) {
  const std::string missing = test_util::temp_path(".osm.pbf");
  const RunResult r = run_cli({missing});
  EXPECT_EQ(r.code, kExitReadError);
  EXPECT_TRUE(contains(r.err, "FileOpenError")) << r.err;
}

TEST(CliRunTest, HeaderFirstViolationExitsTwo) {
  TempFile file(record("OSMData", test_util::raw_blob({1})));
  const RunResult r = run_cli({"--require-header-first", file.path()});
  EXPECT_EQ(r.code, kExitReadError);
  EXPECT_TRUE(contains(r.err, "first blob is not an OSMHeader blob")) << r.err;
}

TEST(CliRunTest, RunsFromConfigFile) {
  TempFile file(two_blob_file());
  const fs::path cfg = test_util::temp_path(".yaml");
  {
    std::ofstream out(cfg);
    out << "inputs: [" << file.path() << "]\n"
        << "scan: {report: blobs, passes: 2}\n";
  }

  const RunResult r = run_cli({"--config", cfg.string()});
  fs::remove(cfg);

  EXPECT_EQ(r.code, kExitOk) << r.err;
  EXPECT_TRUE(contains(r.err, "loading configuration from")) << r.err;
  EXPECT_TRUE(contains(r.out, "  #1 primitive codec=zlib")) << r.out;
  EXPECT_TRUE(contains(r.out, "passes=2")) << r.out;
}
