#include "batchq/cli/commands.hpp"

#include <cstdlib>
#include <print>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* prog) {
  std::println("batchq - batch stock-analysis task queue");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  serve      Run the scheduler and worker pool until signalled");
  std::println("  run        Submit one batch, process it and print the result");
  std::println("  status     Show stored batches and tasks");
  std::println("  validate   Check a config file");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (YAML)");
  std::println("  -d, --daemon          Run as daemon (serve)");
  std::println("  --log-file <file>     Log file (serve)");
  std::println("  --pid-file <file>     Write the process id here (serve)");
  std::println("  -u, --user <id>       Owner of the batch (run, status)");
  std::println("  -s, --symbols <list>  Comma-separated symbols (run)");
  std::println("  -p, --priority <p>    low|normal|high|urgent or 0-3 (run)");
  std::println("  --params <json>       Analysis parameters object (run)");
  std::println("  --timeout <sec>       Give up waiting after sec (run)");
  std::println("  --db <file>           Database file (status)");
  std::println("  --batch <id>          Show one batch and its tasks (status)");
  std::println("  --task <id>           Show one task (status)");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} serve -c batchq.yaml", prog);
  std::println("  {} run -c batchq.yaml -u alice -s AAPL,MSFT -p high", prog);
  std::println("  {} status --db batchq.db --batch <id>", prog);
}

void print_version() {
  std::println("batchq v0.1.0");
}

struct Options {
  std::string command;
  std::string config_file;
  std::string log_file;
  std::string pid_file;
  std::string user_id;
  std::string symbols;
  std::string priority{"normal"};
  std::string params;
  std::string db_file{"batchq.db"};
  std::string batch_id;
  std::string task_id;
  int timeout_sec{300};
  bool daemon{false};
};

auto split_symbols(std::string_view list) -> std::vector<std::string> {
  std::vector<std::string> out;
  while (!list.empty()) {
    auto pos = list.find(',');
    auto item = list.substr(0, pos);
    if (!item.empty()) {
      out.emplace_back(item);
    }
    if (pos == std::string_view::npos) {
      break;
    }
    list.remove_prefix(pos + 1);
  }
  return out;
}

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> std::string {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = require_value(i, argc, argv, arg);
    } else if (arg == "-d" || arg == "--daemon") {
      opts.daemon = true;
    } else if (arg == "--log-file") {
      opts.log_file = require_value(i, argc, argv, arg);
    } else if (arg == "--pid-file") {
      opts.pid_file = require_value(i, argc, argv, arg);
    } else if (arg == "-u" || arg == "--user") {
      opts.user_id = require_value(i, argc, argv, arg);
    } else if (arg == "-s" || arg == "--symbols") {
      opts.symbols = require_value(i, argc, argv, arg);
    } else if (arg == "-p" || arg == "--priority") {
      opts.priority = require_value(i, argc, argv, arg);
    } else if (arg == "--params") {
      opts.params = require_value(i, argc, argv, arg);
    } else if (arg == "--timeout") {
      auto value = require_value(i, argc, argv, arg);
      try {
        opts.timeout_sec = std::stoi(value);
      } catch (const std::exception&) {
        std::println(stderr, "Error: --timeout expects seconds, got '{}'",
                     value);
        std::exit(1);
      }
    } else if (arg == "--db") {
      opts.db_file = require_value(i, argc, argv, arg);
    } else if (arg == "--batch") {
      opts.batch_id = require_value(i, argc, argv, arg);
    } else if (arg == "--task") {
      opts.task_id = require_value(i, argc, argv, arg);
    } else if (opts.command.empty() && !arg.starts_with('-')) {
      opts.command = arg;
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

auto require_config(const Options& opts) -> bool {
  if (opts.config_file.empty()) {
    std::println(stderr, "Error: {} requires -c <file>", opts.command);
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  if (opts.command == "serve") {
    if (!require_config(opts)) {
      return 1;
    }
    batchq::cli::ServeOptions serve{.config_file = opts.config_file,
                                    .daemon = opts.daemon};
    if (!opts.log_file.empty()) {
      serve.log_file = opts.log_file;
    }
    if (!opts.pid_file.empty()) {
      serve.pid_file = opts.pid_file;
    }
    return batchq::cli::cmd_serve(serve);
  }

  if (opts.command == "run") {
    auto symbols = split_symbols(opts.symbols);
    if (opts.user_id.empty() || symbols.empty()) {
      std::println(stderr, "Error: run requires --user and --symbols");
      return 1;
    }
    return batchq::cli::cmd_run({
        .config_file = opts.config_file,
        .user_id = opts.user_id,
        .symbols = std::move(symbols),
        .priority = opts.priority,
        .params = opts.params,
        .timeout_sec = opts.timeout_sec,
    });
  }

  if (opts.command == "status") {
    return batchq::cli::cmd_status({
        .db_file = opts.db_file,
        .batch_id = opts.batch_id,
        .task_id = opts.task_id,
        .user_id = opts.user_id,
    });
  }

  if (opts.command == "validate") {
    if (!require_config(opts)) {
      return 1;
    }
    return batchq::cli::cmd_validate({.config_file = opts.config_file});
  }

  if (opts.command.empty()) {
    print_usage(argv[0]);
  } else {
    std::println(stderr, "Unknown command: {}", opts.command);
  }
  return 1;
}
