#include "xml_copier.hpp"

#include <xso/output_config.hpp>
#include <xso/output_factory.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;
static constexpr int exit_write = 4;

// Flags left unset fall back to the --config file, then to the defaults.
struct cli_options {
  std::string input_file;
  std::string output_file;
  std::string config_file;
  std::optional<std::size_t> indent;
  std::optional<bool> xml_declaration;
  std::optional<std::string> encoding;
  std::optional<bool> standalone;
  std::optional<bool> summary;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: xso [options] <input.xml>\n"
     << "\n"
     << "Re-serialize an XML document through the streaming writer.\n"
     << "\n"
     << "Options:\n"
     << "  -o <file>            Output file (default: standard output)\n"
     << "  --indent <n>         Indent nested markup by n spaces per level\n"
     << "  --no-declaration     Omit the XML declaration\n"
     << "  --encoding <name>    Encoding named in the XML declaration\n"
     << "  --standalone yes|no  Standalone flag of the XML declaration\n"
     << "  --summary            Insert a comment with element, attribute and\n"
     << "                       text counts as the first child of the root\n"
     << "  --config <file>      JSON configuration file\n"
     << "  -h, --help           Show this help message\n"
     << "  --version            Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "xso " << XSO_VERSION << "\n";
}

static std::string
require_value(int argc, char* argv[], int& i, const std::string& arg) {
  if (i + 1 >= argc) {
    std::cerr << "xso: " << arg << " requires an argument\n";
    std::exit(exit_usage);
  }
  return argv[++i];
}

static bool
parse_yes_no(const std::string& value, const std::string& arg) {
  if (value == "yes") return true;
  if (value == "no") return false;
  std::cerr << "xso: " << arg << " must be yes or no\n";
  std::exit(exit_usage);
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "-o") {
      opts.output_file = require_value(argc, argv, i, arg);
      continue;
    }

    if (arg == "--indent") {
      std::string value = require_value(argc, argv, i, arg);
      try {
        std::size_t used = 0;
        int n = std::stoi(value, &used);
        if (used != value.size() || n < 0 ||
            static_cast<std::size_t>(n) > xso::max_space_indent_width) {
          throw std::invalid_argument(value);
        }
        opts.indent = static_cast<std::size_t>(n);
      } catch (const std::exception&) {
        std::cerr << "xso: --indent requires a number from 0 to "
                  << xso::max_space_indent_width << "\n";
        std::exit(exit_usage);
      }
      continue;
    }

    if (arg == "--no-declaration") {
      opts.xml_declaration = false;
      continue;
    }

    if (arg == "--encoding") {
      opts.encoding = require_value(argc, argv, i, arg);
      continue;
    }

    if (arg == "--standalone") {
      opts.standalone = parse_yes_no(require_value(argc, argv, i, arg), arg);
      continue;
    }

    if (arg == "--summary") {
      opts.summary = true;
      continue;
    }

    if (arg == "--config") {
      opts.config_file = require_value(argc, argv, i, arg);
      continue;
    }

    if (arg[0] == '-') {
      std::cerr << "xso: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    if (!opts.input_file.empty()) {
      std::cerr << "xso: only one input file may be given\n";
      std::exit(exit_usage);
    }
    opts.input_file = arg;
  }

  return opts;
}

static nlohmann::json
load_config(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "xso: cannot open file: " << path << "\n";
    std::exit(exit_io);
  }
  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "xso: error parsing config " << path << ": " << e.what()
              << "\n";
    std::exit(exit_parse);
  }
}

// Command-line flags win over the configuration file.
static void
apply_config(cli_options& opts, const nlohmann::json& config) {
  if (!opts.indent && config.contains("indent")) {
    const auto& indent = config["indent"];
    if (!indent.is_number_unsigned() ||
        indent.get<std::size_t>() > xso::max_space_indent_width) {
      throw std::invalid_argument("indent must be a number from 0 to " +
                                  std::to_string(xso::max_space_indent_width));
    }
    opts.indent = indent.get<std::size_t>();
  }
  if (!opts.xml_declaration && config.contains("xml-declaration")) {
    opts.xml_declaration = config["xml-declaration"].get<bool>();
  }
  if (!opts.encoding && config.contains("encoding")) {
    opts.encoding = config["encoding"].get<std::string>();
  }
  if (!opts.standalone && config.contains("standalone")) {
    opts.standalone = config["standalone"].get<bool>();
  }
  if (!opts.summary && config.contains("summary")) {
    opts.summary = config["summary"].get<bool>();
  }
}

static xso::output_config
make_output_config(const cli_options& opts, const nlohmann::json& config) {
  xso::output_config out;
  out.xml_declaration = opts.xml_declaration.value_or(true);
  if (opts.encoding) out.encoding = *opts.encoding;
  out.standalone = opts.standalone;
  out.prefix_base = config.value("prefix-base", out.prefix_base);
  if (opts.indent && *opts.indent > 0) {
    out = xso::with_space_indentation(std::move(out), *opts.indent);
  }
  return out;
}

static int
copy_document(std::istream& in, std::ostream& out, const cli_options& opts,
              const xso::output_config& config) {
  xso::output_factory factory(config);
  auto doc = factory.create_output_document(out);

  xso_cli::copy_options copy_opts;
  copy_opts.strip_whitespace = !config.indent.empty();
  copy_opts.summary = opts.summary.value_or(false);

  try {
    xso_cli::xml_copier copier(doc, copy_opts);
    std::vector<char> buffer(64 * 1024);
    while (in) {
      in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      auto n = static_cast<std::size_t>(in.gcount());
      if (n > 0) copier.feed(std::string_view(buffer.data(), n));
    }
    if (in.bad()) {
      std::cerr << "xso: error reading " << opts.input_file << "\n";
      return exit_io;
    }
    copier.finish();
  } catch (const xso_cli::parse_error& e) {
    std::cerr << "xso: error parsing " << opts.input_file << ": " << e.what()
              << "\n";
    return exit_parse;
  } catch (const std::exception& e) {
    std::cerr << "xso: write error: " << e.what() << "\n";
    return exit_write;
  }

  out << "\n";
  out.flush();
  if (!out) {
    std::cerr << "xso: write error\n";
    return exit_io;
  }
  return exit_success;
}

static int
run(cli_options opts) {
  nlohmann::json config = nlohmann::json::object();
  if (!opts.config_file.empty()) {
    config = load_config(opts.config_file);
    if (!config.is_object()) {
      std::cerr << "xso: invalid config " << opts.config_file
                << ": expected a JSON object\n";
      return exit_parse;
    }
    try {
      apply_config(opts, config);
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "xso: invalid config " << opts.config_file << ": "
                << e.what() << "\n";
      return exit_parse;
    } catch (const std::invalid_argument& e) {
      std::cerr << "xso: invalid config " << opts.config_file << ": "
                << e.what() << "\n";
      return exit_parse;
    }
  }

  xso::output_config output_config;
  try {
    output_config = make_output_config(opts, config);
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "xso: invalid config " << opts.config_file << ": "
              << e.what() << "\n";
    return exit_parse;
  } catch (const std::invalid_argument& e) {
    std::cerr << "xso: invalid config " << opts.config_file << ": "
              << e.what() << "\n";
    return exit_parse;
  }

  std::ifstream in(opts.input_file, std::ios::binary);
  if (!in) {
    std::cerr << "xso: cannot open file: " << opts.input_file << "\n";
    return exit_io;
  }

  if (opts.output_file.empty()) {
    return copy_document(in, std::cout, opts, output_config);
  }

  std::ofstream out(opts.output_file, std::ios::binary);
  if (!out) {
    std::cerr << "xso: cannot write file: " << opts.output_file << "\n";
    return exit_io;
  }
  return copy_document(in, out, opts, output_config);
}

int
main(int argc, char* argv[]) {
  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.input_file.empty()) {
    std::cerr << "xso: no input file\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(std::move(opts));
}
