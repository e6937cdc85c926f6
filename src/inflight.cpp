#include <tether/inflight.hpp>

namespace tether {

uint64_t InFlightSaves::NewSession() {
  std::lock_guard<std::mutex> lock(mu_);
  return next_session_++;
}

size_t InFlightSaves::InFlight() const {
  std::lock_guard<std::mutex> lock(mu_);
  return claims_;
}

size_t InFlightSaves::Waiting() const {
  std::lock_guard<std::mutex> lock(mu_);
  return waiting_for_.size();
}

bool InFlightSaves::WouldDeadlockLocked(uint64_t waiter, uint64_t owner) const {
  // Follow the chain of sessions `owner` is (transitively) waiting on.
  uint64_t current = owner;
  for (size_t hops = 0; hops <= waiting_for_.size(); ++hops) {
    if (current == waiter) return true;
    auto it = waiting_for_.find(current);
    if (it == waiting_for_.end()) return false;
    current = it->second;
  }
  return true;
}

InFlightSaves::Claim InFlightSaves::Acquire(const std::string& key, uint64_t session,
                                            Outcome* outcome) {
  std::unique_lock<std::mutex> lock(mu_);

  auto it = entries_.find(key);
  if (it == entries_.end()) {
    auto entry = std::make_shared<Entry>();
    entry->owner = session;
    entry->depth = 1;
    entry->keys.push_back(key);
    entries_.emplace(key, std::move(entry));
    ++claims_;
    return Claim::kOwner;
  }

  std::shared_ptr<Entry> entry = it->second;
  if (entry->owner == session) {
    ++entry->depth;
    return Claim::kReentrant;
  }

  if (WouldDeadlockLocked(session, entry->owner)) return Claim::kWaitCycle;

  waiting_for_[session] = entry->owner;
  cv_.wait(lock, [&entry] { return entry->done; });
  waiting_for_.erase(session);

  if (outcome) *outcome = entry->outcome;
  return Claim::kJoined;
}

void InFlightSaves::Alias(const std::string& key, const std::string& alias,
                          uint64_t session) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end() || it->second->owner != session) return;
  if (entries_.count(alias)) return;

  it->second->keys.push_back(alias);
  entries_.emplace(alias, it->second);
}

void InFlightSaves::Release(const std::string& key, uint64_t session,
                            const Outcome& outcome) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end() || it->second->owner != session) return;

  std::shared_ptr<Entry> entry = it->second;
  if (--entry->depth > 0) return;

  entry->done = true;
  entry->outcome = outcome;
  for (const auto& k : entry->keys) entries_.erase(k);
  --claims_;
  cv_.notify_all();
}

}  // namespace tether
