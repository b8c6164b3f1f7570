#pragma once

#include "attempt_history.hpp"
#include "bandit_selector.hpp"
#include "memory_scheduler.hpp"
#include "session_window.hpp"
#include "types.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace hero {

// Everything the core keeps for one user.
struct UserState {
  ProfileSet profiles{};
  MemorySet memory{};
  SessionWindow window;
  AttemptHistory history;
};

// Raised by a StateStore whose backend cannot be reached. The core never
// retries; callers may.
class StoreUnavailable : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
  bool retryable() const noexcept { return true; }
};

// External persistence collaborator keyed by user id.
class StateStore {
public:
  virtual ~StateStore() = default;

  // std::nullopt means "no prior state"; the core then starts from default priors.
  virtual std::optional<UserState> load(const std::string& user_id) = 0;

  virtual void save(const std::string& user_id, const UserState& state) = 0;
};

std::shared_ptr<StateStore> make_memory_store();

} // namespace hero
