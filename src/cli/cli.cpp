#include "cli/cli.hpp"
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <boost/log/trivial.hpp>
#include "store/local_record_store.hpp"
#include "transfer/catalog_lister.hpp"
#include "transfer/extent_splitter.hpp"
#include "transfer/transfer_orchestrator.hpp"

namespace distore {
namespace cli {

namespace {

constexpr int PROGRESS_BAR_WIDTH = 40;

// Command words split into positionals, valued options and switches
struct ParsedArgs {
  std::vector<std::string> positional;
  std::map<std::string, std::string> options;
  std::set<std::string> switches;

  std::optional<std::string> option(const std::string& name) const {
    auto it = options.find(name);
    return it == options.end() ? std::nullopt : std::optional<std::string>(it->second);
  }
  bool has(const std::string& name) const { return switches.count(name) != 0; }
};

// Accepts "-o value", "--output value" and "--output=value". aliases maps
// every spelling to a canonical name, names in switch_names take no value.
ParsedArgs parse_args(const std::vector<std::string>& args,
                      const std::map<std::string, std::string>& aliases,
                      const std::set<std::string>& switch_names = {}) {
  ParsedArgs parsed;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg.size() < 2 || arg[0] != '-') {
      parsed.positional.push_back(arg);
      continue;
    }

    std::string flag = arg;
    std::optional<std::string> inline_value;
    std::size_t equals = arg.find('=');
    if (equals != std::string::npos) {
      flag = arg.substr(0, equals);
      inline_value = arg.substr(equals + 1);
    }

    auto alias = aliases.find(flag);
    if (alias == aliases.end()) {
      throw std::invalid_argument("Unknown argument: " + flag);
    }
    const std::string& name = alias->second;

    if (switch_names.count(name) != 0) {
      parsed.switches.insert(name);
    } else if (inline_value) {
      parsed.options[name] = *inline_value;
    } else if (i + 1 < args.size()) {
      parsed.options[name] = args[++i];
    } else {
      throw std::invalid_argument("Missing value for " + flag);
    }
  }
  return parsed;
}

const std::map<std::string, std::string> TARGET_ALIASES = {
  {"-c", "container"}, {"--container", "container"},
  {"-s", "store"}, {"--store", "store"}
};

std::map<std::string, std::string> with_target(std::map<std::string, std::string> aliases) {
  aliases.insert(TARGET_ALIASES.begin(), TARGET_ALIASES.end());
  return aliases;
}

std::uint64_t parse_number(const std::string& text, const std::string& what) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument("Invalid " + what + ": " + text);
  }
  try {
    return std::stoull(text);
  } catch (const std::out_of_range&) {
    throw std::invalid_argument("Invalid " + what + ": " + text);
  }
}

std::filesystem::path env_directory(const char* variable) {
  const char* value = std::getenv(variable);
  return value && *value ? std::filesystem::path(value) : std::filesystem::path();
}

} // namespace

std::string human_bytes(std::uint64_t bytes) {
  static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
    value /= 1024.0;
    ++unit;
  }

  std::ostringstream out;
  if (unit == 0) {
    out << bytes << " B";
  } else {
    out << std::fixed << std::setprecision(2) << value << " " << units[unit];
  }
  return out.str();
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(config::Config& config, const std::string& version, std::ostream& out)
  : running_(false)
  , config_(config)
  , version_(version)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized, version " << version_;
}


//==============================================
// STARTUP
//==============================================

int CLI::execute(const std::vector<std::string>& words) {
  if (words.empty()) {
    handle_help_command();
    return 1;
  }
  std::vector<std::string> args(words.begin() + 1, words.end());
  return process_command(words.front(), args);
}

void CLI::run(std::istream& in) {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "distore> " << std::flush;

  while (running_ && std::getline(in, line)) {
    std::istringstream iss(line);
    std::vector<std::string> words;
    std::string word;
    while (iss >> word) {
      words.push_back(word);
    }

    if (words.empty()) {
      // Nothing typed
    } else if (words.front() == "quit" || words.front() == "exit") {
      running_ = false;
      continue;
    } else if (words.front() == "shell") {
      out_ << "Already in the shell" << std::endl;
    } else {
      execute(words);
    }

    if (running_) {
      out_ << "distore> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// LOCATIONS
//==============================================

std::filesystem::path CLI::cache_directory() {
  std::filesystem::path base = env_directory("XDG_CACHE_HOME");
  if (base.empty()) {
    std::filesystem::path home = env_directory("HOME");
    base = home.empty() ? std::filesystem::temp_directory_path() : home / ".cache";
  }
  return base / "distore";
}


//==============================================
// COMMAND PROCESSING
//==============================================

int CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  try {
    if (command == "config") {
      return handle_config_command(args);
    } else if (command == "disassemble") {
      return handle_disassemble_command(args);
    } else if (command == "assemble") {
      return handle_assemble_command(args);
    } else if (command == "upload") {
      return handle_upload_command(args);
    } else if (command == "download") {
      return handle_download_command(args);
    } else if (command == "list") {
      return handle_list_command(args);
    } else if (command == "delete") {
      return handle_delete_command(args);
    } else if (command == "version") {
      out_ << "distore " << version_ << std::endl;
      return 0;
    } else if (command == "help") {
      handle_help_command();
      return 0;
    }
  } catch (const std::exception& e) {
    return log_and_display_error("Error in " + command, e.what());
  }

  out_ << "Unknown command: " << command << " (try 'help')" << std::endl;
  return 1;
}

int CLI::handle_config_command(const std::vector<std::string>& args) {
  ParsedArgs parsed = parse_args(args, {{"-g", "global"}, {"--global", "global"}}, {"global"});
  const bool global = parsed.has("global");
  const std::string scope = std::filesystem::current_path().string();

  if (parsed.positional.empty()) {
    for (const auto& key : config::Config::known_keys()) {
      auto value = global ? config_.global_value(key) : config_.resolve(key, scope);
      out_ << key << ": " << (value ? *value : "<not set>") << std::endl;
    }
    return 0;
  }

  if (parsed.positional.size() != 2) {
    out_ << "Usage: config [-g] [<key> <value>]" << std::endl;
    return 1;
  }

  const std::string& key = parsed.positional[0];
  const std::string& value = parsed.positional[1];
  config_.set(key, value, global ? std::nullopt : std::optional<std::string>(scope));
  out_ << "Set \"" << key << ": " << value << "\"" << (global ? " globally" : " for " + scope) << std::endl;
  return 0;
}

int CLI::handle_disassemble_command(const std::vector<std::string>& args) {
  ParsedArgs parsed = parse_args(args, {
    {"-o", "output"}, {"--output-directory", "output"}, {"--extent-size", "extent-size"}
  });
  if (parsed.positional.size() != 1) {
    out_ << "Usage: disassemble <file> [-o <directory>] [--extent-size <bytes>]" << std::endl;
    return 1;
  }

  const std::filesystem::path file = parsed.positional[0];
  const std::filesystem::path output = parsed.option("output").value_or(".");
  std::size_t extent_size = transfer::ExtentSplitter::DEFAULT_EXTENT_SIZE;
  if (auto size = parsed.option("extent-size")) {
    extent_size = static_cast<std::size_t>(parse_number(*size, "extent size"));
  }

  return run_transfer([file, output, extent_size](transfer::ProgressChannel& channel) {
    transfer::ExtentSplitter splitter(extent_size);
    auto extents = splitter.split(file, output, [&channel](double fraction) {
      transfer::TransferEvent event;
      event.progress = {transfer::Phase::DISASSEMBLING, "Disassembling", fraction};
      channel.produce(event);
    });
    return "Disassembled " + file.filename().string() + " into " + std::to_string(extents.size()) + " parts";
  });
}

int CLI::handle_assemble_command(const std::vector<std::string>& args) {
  ParsedArgs parsed = parse_args(args, {{"-p", "parts"}, {"--parts", "parts"}, {"-o", "output"}, {"--output", "output"}});
  if (parsed.positional.size() != 1) {
    out_ << "Usage: assemble <file name> [-p <parts directory>] [-o <output>]" << std::endl;
    return 1;
  }

  const std::string name = parsed.positional[0];
  const std::filesystem::path parts = parsed.option("parts").value_or(".");
  const std::filesystem::path output = parsed.option("output")
      ? std::filesystem::path(*parsed.option("output")) : parts / name;

  return run_transfer([name, parts, output](transfer::ProgressChannel& channel) {
    transfer::ExtentSplitter splitter;
    std::uint64_t bytes = splitter.assemble(name, parts, output, [&channel](double fraction) {
      transfer::TransferEvent event;
      event.progress = {transfer::Phase::ASSEMBLING, "Assembling", fraction};
      channel.produce(event);
    });
    return "Assembled " + human_bytes(bytes) + " into " + output.string();
  });
}

int CLI::handle_upload_command(const std::vector<std::string>& args) {
  ParsedArgs parsed = parse_args(args, with_target({
    {"--forward-edit", "forward-edit"}, {"--extent-size", "extent-size"}
  }), {"forward-edit"});
  if (parsed.positional.size() != 1) {
    out_ << "Usage: upload <file> [-c <container>] [-s <store>] [--forward-edit] [--extent-size <bytes>]" << std::endl;
    return 1;
  }

  const std::filesystem::path file = parsed.positional[0];
  const Target target = resolve_target(parsed.option("container"), parsed.option("store"));

  transfer::TransferOptions options;
  options.scratch_dir = cache_directory();
  if (parsed.has("forward-edit")) {
    options.link_mode = transfer::LinkMode::FORWARD_EDIT;
  }
  if (auto size = parsed.option("extent-size")) {
    options.extent_size = static_cast<std::size_t>(parse_number(*size, "extent size"));
  }

  return run_transfer([file, target, options](transfer::ProgressChannel& channel) {
    store::LocalRecordStore store(target.store_path);
    transfer::TransferOrchestrator orchestrator(store, target.container, channel, options);
    auto links = orchestrator.upload(file);
    return "Uploaded " + file.filename().string() + " in " + std::to_string(links.size())
        + " records to container " + target.container + ". Record id: " + std::to_string(links.front().id);
  });
}

int CLI::handle_download_command(const std::vector<std::string>& args) {
  ParsedArgs parsed = parse_args(args, with_target({{"-o", "output"}, {"--output", "output"}}));
  if (parsed.positional.size() != 1) {
    out_ << "Usage: download <record id> [-o <output>] [-c <container>] [-s <store>]" << std::endl;
    return 1;
  }

  const store::RecordId id = parse_number(parsed.positional[0], "record id");
  const Target target = resolve_target(parsed.option("container"), parsed.option("store"));
  std::optional<std::filesystem::path> output;
  if (auto value = parsed.option("output")) {
    output = *value;
  }

  return run_transfer([id, target, output](transfer::ProgressChannel& channel) {
    store::LocalRecordStore store(target.store_path);
    transfer::TransferOrchestrator orchestrator(store, target.container, channel);
    auto result = orchestrator.download(id, output);
    return "Downloaded " + result.output.string() + " (" + human_bytes(result.bytes_written) + ")";
  });
}

int CLI::handle_list_command(const std::vector<std::string>& args) {
  ParsedArgs parsed = parse_args(args, TARGET_ALIASES);
  if (!parsed.positional.empty()) {
    out_ << "Usage: list [-c <container>] [-s <store>]" << std::endl;
    return 1;
  }

  const Target target = resolve_target(parsed.option("container"), parsed.option("store"));
  store::LocalRecordStore store(target.store_path);
  transfer::CatalogLister lister(store, target.container);

  for (const auto& entry : lister.list()) {
    out_ << "ID: " << entry.id << "\n"
         << "    Name: " << *entry.record.name << "\n"
         << "    Size: " << (entry.record.total_size ? human_bytes(*entry.record.total_size) : "unknown")
         << std::endl;
  }
  return 0;
}

int CLI::handle_delete_command(const std::vector<std::string>& args) {
  ParsedArgs parsed = parse_args(args, TARGET_ALIASES);
  if (parsed.positional.size() != 1) {
    out_ << "Usage: delete <record id> [-c <container>] [-s <store>]" << std::endl;
    return 1;
  }

  const store::RecordId id = parse_number(parsed.positional[0], "record id");
  const Target target = resolve_target(parsed.option("container"), parsed.option("store"));

  return run_transfer([id, target](transfer::ProgressChannel& channel) {
    store::LocalRecordStore store(target.store_path);
    transfer::TransferOrchestrator orchestrator(store, target.container, channel);
    std::size_t removed = orchestrator.remove(id);
    return "Deleted record " + std::to_string(id) + " and its chain (" + std::to_string(removed) + " records)";
  });
}

void CLI::handle_help_command() {
  out_ << "Usage: distore [--config-directory <dir>] [--verbose] <command>" << std::endl;
  out_ << "Available commands:" << std::endl;
  out_ << "  config [-g] [<key> <value>]        Print or set config values (keys: container, store)" << std::endl;
  out_ << "  disassemble <file> [-o <dir>]      Split <file> into '.part' files" << std::endl;
  out_ << "  assemble <name> [-p <dir>] [-o <file>]  Join '.part' files back into <name>" << std::endl;
  out_ << "  upload <file> [-c] [-s]            Store <file> as a record chain" << std::endl;
  out_ << "  download <id> [-o <file>] [-c] [-s]  Rebuild the file whose chain starts at <id>" << std::endl;
  out_ << "  list [-c] [-s]                     List files stored in the container" << std::endl;
  out_ << "  delete <id> [-c] [-s]              Delete the chain starting at <id>" << std::endl;
  out_ << "  shell                              Interactive mode" << std::endl;
  out_ << "  version                            Print the version" << std::endl;
  out_ << "  help                               Display this help message" << std::endl << std::endl;
}

int CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
  return 1;
}


//==============================================
// TRANSFER SUPPORT
//==============================================

CLI::Target CLI::resolve_target(const std::optional<std::string>& container,
                                const std::optional<std::string>& store_path) const {
  const std::string scope = std::filesystem::current_path().string();

  Target target;
  auto resolved_container = container ? container : config_.resolve(config::Config::CONTAINER_KEY, scope);
  if (!resolved_container) {
    throw config::ConfigError("No container set, use -c or 'config container <id>'");
  }
  target.container = *resolved_container;

  auto resolved_store = store_path ? store_path : config_.resolve(config::Config::STORE_KEY, scope);
  if (!resolved_store) {
    throw config::ConfigError("No store set, use -s or 'config store <directory>'");
  }
  target.store_path = *resolved_store;

  BOOST_LOG_TRIVIAL(debug) << "Target container " << target.container << " in store " << target.store_path.string();
  return target;
}

int CLI::run_transfer(transfer::TransferTask::Operation operation) {
  transfer::ProgressChannel channel;
  transfer::TransferTask task(channel, std::move(operation));
  active_phase_.reset();

  int exit_code = 0;
  bool done = false;
  transfer::TransferEvent event;

  while (!done) {
    if (!channel.consume(event)) {
      // Small sleep to prevent busy waiting
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      continue;
    }

    switch (event.type) {
      case transfer::EventType::PROGRESS:
        render_progress(event.progress);
        break;
      case transfer::EventType::FINISHED:
        finish_progress_line();
        out_ << event.message << std::endl;
        done = true;
        break;
      case transfer::EventType::FAILED:
        finish_progress_line();
        exit_code = log_and_display_error("Transfer failed", event.message);
        done = true;
        break;
    }
  }

  task.join();
  return exit_code;
}

void CLI::render_progress(const transfer::TransferProgress& progress) {
  if (active_phase_ && *active_phase_ != progress.phase) {
    finish_progress_line();
  }
  active_phase_ = progress.phase;

  const int filled = static_cast<int>(progress.fraction * PROGRESS_BAR_WIDTH);
  std::string bar(static_cast<std::size_t>(filled), '#');
  if (filled < PROGRESS_BAR_WIDTH) {
    bar += '>';
    bar += std::string(static_cast<std::size_t>(PROGRESS_BAR_WIDTH - filled - 1), '-');
  }

  out_ << "\r" << std::setw(15) << progress.label << " [" << bar << "] "
       << std::setw(3) << static_cast<int>(progress.fraction * 100) << "%" << std::flush;
}

void CLI::finish_progress_line() {
  if (active_phase_) {
    out_ << std::endl;
    active_phase_.reset();
  }
}

} // namespace cli
} // namespace distore
