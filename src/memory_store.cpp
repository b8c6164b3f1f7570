#include "hero/state_store.hpp"

#include <mutex>
#include <unordered_map>

namespace hero {
namespace {

class MemoryStateStore : public StateStore {
public:
  std::optional<UserState> load(const std::string& user_id) override {
    std::scoped_lock guard(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void save(const std::string& user_id, const UserState& state) override {
    std::scoped_lock guard(mutex_);
    users_.insert_or_assign(user_id, state);
  }

private:
  std::mutex mutex_;
  std::unordered_map<std::string, UserState> users_;
};

} // namespace

std::shared_ptr<StateStore> make_memory_store() {
  return std::make_shared<MemoryStateStore>();
}

} // namespace hero
