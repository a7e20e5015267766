#include "options.hpp"

#include <CLI/CLI.hpp>
#include <optional>

namespace fs = std::filesystem;

namespace xpto::filectx {

std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, server_options& opts) {
  CLI::App app{"Serve a directory's text files as resources over stdio"};

  app.add_option(
      "--root",
      opts.root,
      "Root directory to serve files from (default: current directory)")
    ->check(CLI::ExistingDirectory);
  app.add_option(
      "--max-file-size",
      opts.max_file_size,
      "Maximum file size to read in bytes")
    ->capture_default_str();
  app.add_option(
      "--max-files",
      opts.max_files,
      "Maximum number of files listed per scan")
    ->capture_default_str();
  app.add_option(
      "--mime-types",
      opts.mime_types_file,
      "Extra mime.types table (default: /etc/mime.types when present)")
    ->check(CLI::ExistingFile);
  app.add_option(
      "--log-file",
      opts.log_file,
      "Also append log lines to this file");
  app.add_option(
      "-d, --debug",
      loglevel,
      "Debug log level (3=INFO)")
    ->check(CLI::Range(0, 5))
    ->capture_default_str();

  try {
    app.parse(static_cast<int>(args.size()), args.data());
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  return std::nullopt;
}

}  // namespace xpto::filectx
