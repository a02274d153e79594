#include "gvpreview/config/configuration.hpp"
#include "gvpreview/core/errors.hpp"
#include "gvpreview/io/image_io.hpp"
#include "gvpreview/pipeline/composite_builder.hpp"

#include <CLI/CLI.hpp>

#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace {

namespace config = gvpreview::config;
namespace io = gvpreview::io;
namespace pipeline = gvpreview::pipeline;

std::atomic<bool> g_stop_requested{false};

extern "C" void handle_sigint(int) { g_stop_requested.store(true); }

struct CliOptions {
  std::string config_path;
  std::string dims;
  std::string resize;
  std::string order;
  std::string format;
  std::string output;
  std::string input;
  std::string events_file;
  std::string save_config;
  bool verbose = false;
};

config::Config resolve_config(const CLI::App &app, const CliOptions &cli) {
  config::Config cfg;
  if (!cli.config_path.empty()) {
    cfg = config::Config::load(cli.config_path);
  }

  // Command line wins over the config file.
  if (app.count("--dims"))
    cfg.layout.dims = cli.dims;
  if (app.count("--resize"))
    cfg.layout.resize = cli.resize;
  if (app.count("--order"))
    cfg.layout.order = cli.order;
  if (app.count("--format"))
    cfg.input.format = cli.format;
  if (app.count("--output"))
    cfg.output.path = cli.output;
  if (app.count("input"))
    cfg.input.path = cli.input;
  if (app.count("--events"))
    cfg.logging.events_file = cli.events_file;
  if (cli.verbose)
    cfg.logging.verbose = true;

  cfg.validate();
  return cfg;
}

int run_command(const config::Config &cfg) {
  std::unique_ptr<std::ofstream> events;
  if (!cfg.logging.events_file.empty()) {
    events = std::make_unique<std::ofstream>(cfg.logging.events_file, std::ios::app);
    if (!*events) {
      std::cerr << "Error: cannot open event log " << cfg.logging.events_file << std::endl;
      return 1;
    }
  }

  pipeline::CompositeBuilder builder(pipeline::CompositeOptions::from_config(cfg), std::cout,
                                     std::cerr, events.get());

  io::FileRasterSink sink(cfg.output.path);
  const pipeline::RunSummary summary = builder.run(cfg.input.path, sink, &g_stop_requested);

  if (!summary.output_written) {
    std::cerr << "Error: no output written: " << summary.output_error << std::endl;
    return 1;
  }
  if (!summary.setup_error.empty()) {
    std::cerr << "Error: " << summary.setup_error << std::endl;
    return 1;
  }
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"gvpreview: assemble camera images into a composite preview"};

  CliOptions cli;
  app.add_option("-d,--dims", cli.dims,
                 "Dimension of super-image, in units of sub-images, ROWSxCOLS");
  app.add_option("-s,--resize", cli.resize, "Size of each sub-image, ROWSxCOLS")
      ->default_str("200x300");
  app.add_option("-O,--order", cli.order,
                 "Order in which images are taken (cols or rows, left or right)")
      ->check(CLI::IsMember({"colsright", "colsleft", "rowsdown", "rowsup"},
                            CLI::ignore_case))
      ->default_str("colsright");
  app.add_option("-f,--format", cli.format, "File format of input images")
      ->default_str("jpg");
  app.add_flag("-v,--verbose", cli.verbose, "Use verbose output");
  app.add_option("-o,--output", cli.output, "Output image");
  app.add_option("-c,--config", cli.config_path, "YAML config file")
      ->check(CLI::ExistingFile);
  app.add_option("--events", cli.events_file, "Append JSON-lines run events to this file");
  app.add_option("--save-config", cli.save_config,
                 "Write the effective configuration as YAML and exit");
  app.add_option("input", cli.input, "Input tarfile or directory of sub-images");

  CLI11_PARSE(app, argc, argv);

  config::Config cfg;
  try {
    cfg = resolve_config(app, cli);
  } catch (const gvpreview::ConfigError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  if (!cli.save_config.empty()) {
    try {
      cfg.save(cli.save_config);
    } catch (const gvpreview::IOError &e) {
      std::cerr << "Error: " << e.what() << std::endl;
      return 1;
    }
    return 0;
  }

  std::signal(SIGINT, handle_sigint);

  try {
    return run_command(cfg);
  } catch (const gvpreview::GvPreviewError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
