#pragma once

#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <tether/status.hpp>

namespace tether {

/**
 * Registry of saves in progress, keyed by identity (or by graph node for
 * objects that have none yet).
 *
 * Gives at-most-once builds across concurrent calls: the first call to
 * claim a key builds it, later calls from other sessions wait and share
 * its outcome. A session is one top-level save call.
 */
class InFlightSaves {
 public:
  enum class Claim {
    kOwner,      // caller must build the key and Release() it
    kReentrant,  // caller's own session already holds the key; build and Release()
    kJoined,     // another session built it; `outcome` holds its result
    kWaitCycle,  // waiting would deadlock a cycle of sessions; build without a claim
  };

  struct Outcome {
    Status status;
    std::string identity;
  };

  Claim Acquire(const std::string& key, uint64_t session, Outcome* outcome);

  /**
   * Make the claim held under `key` also answer for `alias`. Used when a
   * node claimed by graph position receives its identity mid-build. No-op
   * when `alias` is already claimed.
   */
  void Alias(const std::string& key, const std::string& alias, uint64_t session);

  /** Publish the outcome of an owned or re-entrant claim. */
  void Release(const std::string& key, uint64_t session, const Outcome& outcome);

  uint64_t NewSession();

  size_t InFlight() const;

  /** Sessions currently blocked in Acquire(). */
  size_t Waiting() const;

 private:
  struct Entry {
    uint64_t owner = 0;
    int depth = 0;
    bool done = false;
    Outcome outcome;
    std::vector<std::string> keys;  // every registry key naming this entry
  };

  bool WouldDeadlockLocked(uint64_t waiter, uint64_t owner) const;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  uint64_t next_session_ = 1;
  std::map<std::string, std::shared_ptr<Entry>> entries_;
  size_t claims_ = 0;
  std::map<uint64_t, uint64_t> waiting_for_;  // session -> session it waits on
};

}  // namespace tether
