#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <tether/clock.hpp>
#include <tether/model.hpp>
#include <tether/observability.hpp>

namespace tether {

/** Where the identity of a record being created comes from. */
enum class IdentityStrategy {
  kStoreGenerated,   // the store assigns one on first save
  kClientGenerated,  // a random 128-bit hex identity generated locally
  kCustomGenerator,  // Options::identity_generator
  kKeyField,         // the value of Options::identity_key_field
};

/**
 * What a save does with a reference to an object that has no cached record
 * when the parent has no identity yet and no cycle leads back to it.
 */
enum class UnresolvedReferencePolicy {
  kDefer,  // patch the edge in after the parent is created
  kSkip,   // leave the field unwritten and log a warning
};

/**
 * Options for a tether Engine.
 *
 * Store-specific knobs live in the backend's own options
 * (RocksStoreOptions, MemoryStoreOptions).
 */
struct Options {
  // ---------------------------------------------------------------------------
  // Identity assignment
  // ---------------------------------------------------------------------------
  IdentityStrategy identity_strategy = IdentityStrategy::kStoreGenerated;

  // Required for kCustomGenerator. Returning an empty string fails the save.
  std::function<std::string(const Model&)> identity_generator;

  // Required for kKeyField. Must name a string or int field of the type.
  std::string identity_key_field;

  // ---------------------------------------------------------------------------
  // Record cache
  // ---------------------------------------------------------------------------

  // Cached records older than this are refetched. 0 = never expire.
  uint64_t cache_ttl_seconds = 30;

  // Advisory size bound, oldest entries are evicted past it. 0 = unbounded.
  size_t cache_max_entries = 0;

  // ---------------------------------------------------------------------------
  // Save and load behavior
  // ---------------------------------------------------------------------------
  UnresolvedReferencePolicy unresolved_references = UnresolvedReferencePolicy::kDefer;

  // Reject a freshly fetched record whose cached reference subgraph
  // contains a cycle (CircularReferenceRejected).
  bool reject_cyclic_fetches = true;

  // Concurrent saves of the same object or identity build it once.
  bool deduplicate_concurrent_saves = true;

  // debug | info | warn | error
  std::string log_level = "warn";

  // Observability hooks (optional)
  //
  // If set, saves, loads and the cache emit counters/histograms and open
  // spans (tether.Save, tether.Load, tether.LoadPage).
  std::shared_ptr<MetricsSink> metrics;
  std::shared_ptr<Tracer> tracer;

  // Clock for TTL and latency measurement. RealClock when unset.
  const Clock* clock = nullptr;
};

}  // namespace tether
