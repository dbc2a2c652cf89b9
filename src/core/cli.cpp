#include "cli.hpp"

#include <exception>

#include "blob/blob.hpp"
#include "blob/pbf_file.hpp"
#include "scanner.hpp"

namespace osmpbf_cli {

static void log_err(std::ostream &err, const std::string &msg) {
  err << "osmpbf-scan: " << msg << "\n";
}

static void print_usage(std::ostream &err) {
  log_err(err, "Usage: osmpbf-scan --config <path/to/config.yaml>");
  log_err(err, "       osmpbf-scan [--blobs] [--verbose] [--max-blobs N] "
               "[--passes N] [--require-header-first] <file.osm.pbf>...");
}

static void print_blob(std::ostream &out, size_t index,
                       const osmpbf_reader::Blob &blob) {
  out << "  #" << index << " " << osmpbf_reader::blob_kind_name(blob.kind())
      << " codec=" << osmpbf_reader::compression_name(blob.compression())
      << " bytes=" << blob.payload().size();
  if (blob.raw_size()) {
    out << " raw_size=" << *blob.raw_size();
  }
  out << "\n";
}

static void print_summary(std::ostream &out, const std::string &path,
                          const osmpbf_reader::ScanSummary &summary) {
  out << path << ": blobs=" << summary.total_blobs()
      << " header=" << summary.header_blobs
      << " primitive=" << summary.primitive_blobs
      << " raw=" << summary.raw_blobs << " zlib=" << summary.zlib_blobs
      << " payload_bytes=" << summary.payload_bytes
      << " file_bytes=" << summary.file_bytes
      << " passes=" << summary.passes << "\n";
}

// Value following a flag; throws if the flag is last.
static const std::string &flag_value(const std::vector<std::string> &args,
                                     size_t &i) {
  if (i + 1 >= args.size()) {
    throw UsageError("missing value for " + args[i]);
  }
  return args[++i];
}

static long long parse_integer(const std::string &flag,
                               const std::string &value) {
  size_t consumed = 0;
  long long n = 0;
  try {
    n = std::stoll(value, &consumed);
  } catch (const std::exception &) {
    throw UsageError("invalid value for " + flag + ": '" + value + "'");
  }
  if (consumed != value.size()) {
    throw UsageError("invalid value for " + flag + ": '" + value + "'");
  }
  return n;
}

CliArgs parse_args(const std::vector<std::string> &args) {
  CliArgs parsed;
  std::optional<std::string> scan_flag; // First scan flag seen

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];

    if (arg == "--config") {
      parsed.config_path = flag_value(args, i);
    } else if (arg == "--blobs") {
      parsed.config.scan.report = osmpbf_reader::ReportMode::Blobs;
      scan_flag = scan_flag.value_or(arg);
    } else if (arg == "--verbose") {
      parsed.config.verbose = true;
      scan_flag = scan_flag.value_or(arg);
    } else if (arg == "--require-header-first") {
      parsed.config.scan.require_header_first = true;
      scan_flag = scan_flag.value_or(arg);
    } else if (arg == "--max-blobs") {
      const long long n = parse_integer(arg, flag_value(args, i));
      if (n <= 0) {
        throw UsageError("--max-blobs must be > 0");
      }
      parsed.config.scan.max_blobs = static_cast<size_t>(n);
      scan_flag = scan_flag.value_or(arg);
    } else if (arg == "--passes") {
      const long long n = parse_integer(arg, flag_value(args, i));
      if (n < 1 || n > osmpbf_reader::kMaxScanPasses) {
        throw UsageError("--passes must be in range [1, " +
                         std::to_string(osmpbf_reader::kMaxScanPasses) + "]");
      }
      parsed.config.scan.passes = static_cast<int>(n);
      scan_flag = scan_flag.value_or(arg);
    } else if (!arg.empty() && arg[0] == '-') {
      throw UsageError("unknown option: " + arg);
    } else {
      parsed.config.inputs.push_back(arg);
    }
  }

  // Everything --config covers comes from the file (prevents silently
  // ignored flags)
  if (parsed.config_path) {
    if (!parsed.config.inputs.empty()) {
      throw UsageError("input files cannot be combined with --config");
    }
    if (scan_flag) {
      throw UsageError(*scan_flag + " cannot be combined with --config");
    }
  } else if (parsed.config.inputs.empty()) {
    throw UsageError("no input files");
  }

  return parsed;
}

int run(const std::vector<std::string> &args, std::ostream &out,
        std::ostream &err) {
  CliArgs parsed;
  try {
    parsed = parse_args(args);
  } catch (const UsageError &e) {
    log_err(err, "FATAL: " + std::string(e.what()));
    print_usage(err);
    return kExitUsage;
  }

  osmpbf_reader::ReaderConfig config = parsed.config;
  if (parsed.config_path) {
    try {
      log_err(err, "loading configuration from: " + *parsed.config_path);
      config = osmpbf_reader::load_config(*parsed.config_path);
    } catch (const std::exception &e) {
      log_err(err, "FATAL: " + std::string(e.what()));
      return kExitUsage;
    }
  }

  osmpbf_reader::ScanOptions options;
  options.max_blobs = config.scan.max_blobs;
  options.passes = config.scan.passes;
  options.require_header_first = config.scan.require_header_first;
  options.verbose = config.verbose;

  osmpbf_reader::BlobCallback on_blob;
  if (config.scan.report == osmpbf_reader::ReportMode::Blobs) {
    on_blob = [&out](size_t index, const osmpbf_reader::Blob &blob) {
      print_blob(out, index, blob);
    };
  }

  int exit_code = kExitOk;
  for (const auto &input : config.inputs) {
    try {
      osmpbf_reader::PbfFile file = osmpbf_reader::PbfFile::open(input);
      if (on_blob) {
        out << input << ":\n";
      }
      const osmpbf_reader::ScanSummary summary =
          osmpbf_reader::scan_file(file, options, on_blob);
      print_summary(out, input, summary);
    } catch (const std::runtime_error &e) {
      // ReaderError included
      log_err(err, input + ": " + e.what());
      exit_code = kExitReadError;
    }
  }

  return exit_code;
}

} // namespace osmpbf_cli
