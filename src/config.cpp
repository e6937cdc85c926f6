#include <tether/config.hpp>
#include <tether/version.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace tether {

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "tether " << Version() << "\n"
            << "Usage: " << argv0 << " [options] <command> [args...]\n"
            << "\nCommands:\n"
            << "  put <type> <json-fields> [identity]  Save a record, print its identity\n"
            << "  get <identity>                       Print a stored record\n"
            << "  del <identity>                       Delete a record\n"
            << "  query <type> [limit]                 List records of a type\n"
            << "  count <type>                         Count records of a type\n"
            << "\nOptions:\n"
            << "  --config, -c <path>         Path to YAML config file\n"
            << "  --db-path <path>            Database path (required)\n"
            << "  --cache-ttl <seconds>       Record cache TTL, 0 = never expire (default: 30)\n"
            << "  --cache-max-entries <n>     Record cache bound, 0 = unbounded (default: 0)\n"
            << "  --identity-strategy <name>  store, client or key_field (default: store)\n"
            << "  --key-field <name>          Field used by the key_field strategy\n"
            << "  --log-level <level>         Log level: trace, debug, info, warn, error\n"
            << "  --help, -h                  Show this help\n"
            << "\nExamples:\n"
            << "  " << argv0 << " --db-path /data/tether put Person '{\"name\":\"Ada\"}'\n"
            << "  " << argv0 << " --config /etc/tether/tether.yaml query Person 10\n";
}

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

bool ParseBool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

uint64_t ParseUnsigned(const std::string& key, const std::string& value) {
  if (value.empty()) throw std::runtime_error("Missing value for " + key);
  try {
    size_t used = 0;
    unsigned long long n = std::stoull(value, &used);
    if (used != value.size() || value[0] == '-') throw std::invalid_argument(value);
    return n;
  } catch (const std::logic_error&) {
    throw std::runtime_error("Invalid value for " + key + ": " + value);
  }
}

std::string NextArg(int argc, char** argv, int* i, const std::string& flag,
                    const char* what) {
  if (++*i >= argc) {
    throw std::runtime_error(flag + " requires " + what);
  }
  return argv[*i];
}

}  // namespace

bool ParseIdentityStrategy(const std::string& name, IdentityStrategy* out) {
  if (name == "store") {
    *out = IdentityStrategy::kStoreGenerated;
  } else if (name == "client") {
    *out = IdentityStrategy::kClientGenerated;
  } else if (name == "key_field") {
    *out = IdentityStrategy::kKeyField;
  } else {
    return false;
  }
  return true;
}

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  std::string current_section;
  std::string line;

  while (std::getline(file, line)) {
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      throw std::runtime_error("Malformed config line: " + line);
    }

    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty()) {
      current_section = key;
      continue;
    }

    // Remove quotes from value if present
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    const std::string qualified =
        current_section.empty() ? key : current_section + "." + key;

    if (current_section == "store") {
      if (key == "path") {
        config.store.path = value;
      } else if (key == "block_cache_bytes") {
        config.store.block_cache_bytes = ParseUnsigned(qualified, value);
      } else if (key == "bloom_bits_per_key") {
        config.store.bloom_bits_per_key = static_cast<int>(ParseUnsigned(qualified, value));
      } else if (key == "lock_timeout_ms") {
        config.store.lock_timeout_ms = static_cast<int>(ParseUnsigned(qualified, value));
      } else if (key == "max_retries") {
        config.store.max_retries = static_cast<int>(ParseUnsigned(qualified, value));
      } else if (key == "actor") {
        config.store.actor = value;
      }
    } else if (current_section == "cache") {
      if (key == "ttl_seconds") {
        config.cache.ttl_seconds = ParseUnsigned(qualified, value);
      } else if (key == "max_entries") {
        config.cache.max_entries = ParseUnsigned(qualified, value);
      }
    } else if (current_section == "identity") {
      if (key == "strategy") {
        config.identity.strategy = value;
      } else if (key == "key_field") {
        config.identity.key_field = value;
      }
    } else if (current_section == "logging") {
      if (key == "level") {
        config.logging.level = value;
      }
    } else if (current_section.empty()) {
      // Top-level keys
      if (key == "db_path") {
        config.store.path = value;
      } else if (key == "log_level") {
        config.logging.level = value;
      } else if (key == "verbose") {
        if (ParseBool(value)) config.logging.level = "debug";
      }
    }
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  std::string config_file;
  std::optional<std::string> db_path;
  std::optional<uint64_t> cache_ttl;
  std::optional<size_t> cache_max_entries;
  std::optional<std::string> strategy;
  std::optional<std::string> key_field;
  std::optional<std::string> log_level;
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (!args.empty()) {
      // Everything after the command belongs to it.
      args.push_back(arg);
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      std::exit(0);
    } else if (arg == "--config" || arg == "-c") {
      config_file = NextArg(argc, argv, &i, arg, "a path argument");
    } else if (arg == "--db-path") {
      db_path = NextArg(argc, argv, &i, arg, "a path");
    } else if (arg == "--cache-ttl") {
      cache_ttl = ParseUnsigned(arg, NextArg(argc, argv, &i, arg, "a number of seconds"));
    } else if (arg == "--cache-max-entries") {
      cache_max_entries = ParseUnsigned(arg, NextArg(argc, argv, &i, arg, "a number"));
    } else if (arg == "--identity-strategy") {
      strategy = NextArg(argc, argv, &i, arg, "a strategy name");
    } else if (arg == "--key-field") {
      key_field = NextArg(argc, argv, &i, arg, "a field name");
    } else if (arg == "--log-level") {
      log_level = NextArg(argc, argv, &i, arg, "a level");
    } else if (!arg.empty() && arg[0] == '-') {
      throw std::runtime_error("Unknown option: " + arg);
    } else {
      args.push_back(arg);
    }
  }

  // File first, then CLI args override it
  Config config = config_file.empty() ? Config{} : LoadFromFile(config_file);
  if (db_path) config.store.path = *db_path;
  if (cache_ttl) config.cache.ttl_seconds = *cache_ttl;
  if (cache_max_entries) config.cache.max_entries = *cache_max_entries;
  if (strategy) config.identity.strategy = *strategy;
  if (key_field) config.identity.key_field = *key_field;
  if (log_level) config.logging.level = *log_level;
  config.args = std::move(args);

  return config;
}

void Config::Validate() const {
  if (store.path.empty()) {
    throw std::runtime_error("store.path is required (use --db-path or config file)");
  }

  if (store.max_retries <= 0) {
    throw std::runtime_error("store.max_retries must be positive");
  }

  IdentityStrategy parsed;
  if (!ParseIdentityStrategy(identity.strategy, &parsed)) {
    throw std::runtime_error("Invalid identity.strategy: " + identity.strategy +
                             " (must be store, client, or key_field)");
  }
  if (parsed == IdentityStrategy::kKeyField && identity.key_field.empty()) {
    throw std::runtime_error("identity.key_field is required for the key_field strategy");
  }

  // Validate log level
  if (logging.level != "trace" && logging.level != "debug" && logging.level != "info" &&
      logging.level != "warn" && logging.level != "error") {
    throw std::runtime_error("Invalid log_level: " + logging.level +
                             " (must be trace, debug, info, warn, or error)");
  }
}

Options Config::ToOptions() const {
  Options opt;
  if (!ParseIdentityStrategy(identity.strategy, &opt.identity_strategy)) {
    throw std::runtime_error("Invalid identity.strategy: " + identity.strategy);
  }
  opt.identity_key_field = identity.key_field;
  opt.cache_ttl_seconds = cache.ttl_seconds;
  opt.cache_max_entries = cache.max_entries;
  opt.log_level = logging.level;
  return opt;
}

RocksStoreOptions Config::ToStoreOptions() const {
  RocksStoreOptions opt;
  opt.block_cache_bytes = store.block_cache_bytes;
  opt.bloom_bits_per_key = store.bloom_bits_per_key;
  opt.lock_timeout_ms = store.lock_timeout_ms;
  opt.max_retries = store.max_retries;
  opt.actor = store.actor;
  return opt;
}

}  // namespace tether
