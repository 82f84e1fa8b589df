#include <cxxopts.hpp>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

#include "base/Logging.hpp"
#include "base/Status.hpp"
#include "block/Block.hpp"
#include "block/BlockLocation.hpp"
#include "cloud/S3.hpp"
#include "label/Label.hpp"
#include "querier/BlockDumper.hpp"
#include "writer/IndexJSONWriter.hpp"
#include "writer/Writer.hpp"

using cxxopts::OptionException;
using namespace tsdump;

namespace {

class Flags {
 public:
  std::string block;
  std::string format;
  std::string output;
  std::string external_labels;
  std::string aws_profile;
  std::string aws_region;
  std::string log_level;
  bool dump_index;
  querier::DumpOptions dump;

  Flags() : dump_index(false) {}
};

// 0 parsed, 1 usage error, 2 help printed.
int parse(int argc, char *argv[], Flags *flags) {
  try {
    cxxopts::Options options(argv[0],
                             " - dump samples of a Prometheus TSDB block");
    options.add_options()("block", "Path or s3://bucket/prefix of the block",
                          cxxopts::value<std::string>())(
        "label-key", "Label name to select series by",
        cxxopts::value<std::string>()->default_value(""))(
        "label-value", "Comma separated label values",
        cxxopts::value<std::string>()->default_value(""))(
        "external-labels", "Labels added to dumped series, in JSON",
        cxxopts::value<std::string>()->default_value("{}"))(
        "metric-name", "Only dump series of this metric (__name__)",
        cxxopts::value<std::string>()->default_value(""))(
        "min-timestamp", "Min timestamp of dumped samples, unix msec",
        cxxopts::value<int64_t>()->default_value("0"))(
        "max-timestamp", "Max timestamp of dumped samples, unix msec",
        cxxopts::value<int64_t>()->default_value(
            std::to_string(std::numeric_limits<int64_t>::max())))(
        "format", "Output format: victoriametrics or csv",
        cxxopts::value<std::string>()->default_value("victoriametrics"))(
        "dump-index", "Dump index information in JSON and exit")(
        "aws-profile", "AWS profile used to access S3",
        cxxopts::value<std::string>()->default_value(""))(
        "aws-region", "AWS region of the bucket",
        cxxopts::value<std::string>()->default_value(""))(
        "output", "File to write output to instead of stdout",
        cxxopts::value<std::string>()->default_value(""))(
        "log-level", "trace, debug, info, warn or error",
        cxxopts::value<std::string>()->default_value("info"))("h,help",
                                                             "Print help");

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      std::cout << options.help({""}) << std::endl;
      return 2;
    }
    if (!result.count("block")) {
      std::cerr << "--block argument is required" << std::endl
                << options.help({""}) << std::endl;
      return 1;
    }

    flags->block = result["block"].as<std::string>();
    flags->format = result["format"].as<std::string>();
    flags->output = result["output"].as<std::string>();
    flags->external_labels = result["external-labels"].as<std::string>();
    flags->aws_profile = result["aws-profile"].as<std::string>();
    flags->aws_region = result["aws-region"].as<std::string>();
    flags->log_level = result["log-level"].as<std::string>();
    flags->dump_index = result.count("dump-index") > 0;
    flags->dump.label_key = result["label-key"].as<std::string>();
    flags->dump.label_values =
        label::split_label_values(result["label-value"].as<std::string>());
    flags->dump.metric_name = result["metric-name"].as<std::string>();
    flags->dump.min_timestamp = result["min-timestamp"].as<int64_t>();
    flags->dump.max_timestamp = result["max-timestamp"].as<int64_t>();
  } catch (const OptionException &e) {
    std::cerr << "error parsing options: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}

base::Status dump(const Flags &flags, const block::BlockLocation &loc,
                  cloud::ObjectStore *store, std::ostream *out) {
  std::unique_ptr<block::Block> b;
  base::Status s = block::Block::Open(loc, store, &b);
  if (!s.ok()) return s;

  querier::BlockDumper dumper(b->index(), b->chunks(), flags.dump);
  if (flags.dump_index) {
    writer::IndexJSONWriter w(out);
    s = dumper.dump_index(&w);
  } else {
    std::unique_ptr<writer::SampleSink> sink;
    s = writer::new_writer(flags.format, out, &sink);
    if (s.ok()) s = dumper.dump_samples(sink.get());
  }
  b->close();
  if (!s.ok()) return s;

  out->flush();
  if (!*out) return base::Status::IOError("flush output");
  return base::Status::OK();
}

base::Status run(const Flags &flags) {
  base::Logger::LogLevel level;
  if (!base::Logger::parseLogLevel(flags.log_level, &level))
    return base::Status::InvalidArgument("invalid log level", flags.log_level);
  base::Logger::setLogLevel(level);

  // Everything the user gave is checked before any I/O.
  block::BlockLocation loc;
  base::Status s = block::BlockLocation::Parse(flags.block, &loc);
  if (!s.ok()) return s;
  Flags f(flags);
  s = label::lbs_from_json(flags.external_labels, &f.dump.external_labels);
  if (!s.ok()) return s.Wrap("decode external labels");
  if (!flags.dump_index) {
    std::unique_ptr<writer::SampleSink> probe;
    s = writer::new_writer(flags.format, &std::cout, &probe);
    if (!s.ok()) return s;
  }

  std::ofstream file;
  std::ostream *out = &std::cout;
  if (!flags.output.empty()) {
    file.open(flags.output, std::ios::out | std::ios::trunc);
    if (!file) return base::Status::IOError("create output", flags.output);
    out = &file;
  }

  if (!loc.is_remote()) return dump(f, loc, nullptr, out);

  cloud::S3Options options;
  options.region = flags.aws_region;
  options.probe_bucket = loc.bucket;
  options.credentials.InitializeProfile(flags.aws_profile);
  base::Status result;
  {
    cloud::S3Wrapper store(options);
    result = store.status();
    if (result.ok()) result = dump(f, loc, &store, out);
  }
  cloud::S3Wrapper::Shutdown();
  return result;
}

}  // namespace

int main(int argc, char *argv[]) {
  Flags flags;
  int r = parse(argc, argv, &flags);
  if (r == 2) return 0;
  if (r != 0) return 1;

  base::Status s = run(flags);
  if (!s.ok()) {
    LOG_ERROR << "error: " << s;
    return 1;
  }
  return 0;
}
