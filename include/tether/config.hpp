#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <tether/options.hpp>
#include <tether/rocks_store.hpp>

namespace tether {

/**
 * Backing store settings.
 */
struct StoreConfig {
  std::string path;
  size_t block_cache_bytes = 64ull * 1024ull * 1024ull;
  int bloom_bits_per_key = 10;
  int lock_timeout_ms = 2000;
  int max_retries = 16;
  std::string actor = "tether";
};

/**
 * Record cache settings.
 */
struct CacheConfig {
  uint64_t ttl_seconds = 30;
  size_t max_entries = 0;
};

/**
 * Identity assignment: store, client or key_field.
 */
struct IdentityConfig {
  std::string strategy = "store";
  std::string key_field;
};

struct LoggingConfig {
  std::string level = "warn";
};

/**
 * Complete tool configuration.
 */
struct Config {
  StoreConfig store;
  CacheConfig cache;
  IdentityConfig identity;
  LoggingConfig logging;

  // Positional arguments left after option parsing (the command and its operands).
  std::vector<std::string> args;

  /**
   * Load configuration from a YAML file.
   * @throws std::runtime_error if file cannot be read or parsed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse configuration from command-line arguments. Options given on the
   * command line override the ones read from --config.
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;

  Options ToOptions() const;
  RocksStoreOptions ToStoreOptions() const;
};

/** Parse a strategy name (store, client, key_field). */
bool ParseIdentityStrategy(const std::string& name, IdentityStrategy* out);

}  // namespace tether
