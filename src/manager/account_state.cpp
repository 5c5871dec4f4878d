#include "manager/account_state.hpp"

#include <algorithm>
#include <mutex>

namespace modvault::manager {

const char* UpgradePhaseToString(UpgradePhase phase) {
  switch (phase) {
    case UpgradePhase::kIdle:
      return "idle";
    case UpgradePhase::kUpgrading:
      return "upgrading";
  }
  return "unknown";
}

AccountSummary AccountBook::Summary(const primitives::Address& account) const {
  std::shared_lock lock(mutex_);
  AccountSummary summary;
  const auto it = accounts_.find(account);
  if (it != accounts_.end()) {
    summary.current_version = it->second.current_version;
    summary.locked = it->second.locked;
    summary.phase = it->second.phase;
  }
  const auto pending = pending_.find(account);
  if (pending != pending_.end()) {
    summary.previous_version = pending->second.previous.current_version;
  }
  return summary;
}

std::optional<AccountState> AccountBook::Get(const primitives::Address& account) const {
  std::shared_lock lock(mutex_);
  const auto it = accounts_.find(account);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool AccountBook::WasInitialized(const primitives::Address& account,
                                 const primitives::Address& module) const {
  std::shared_lock lock(mutex_);
  const auto it = accounts_.find(account);
  return it != accounts_.end() && it->second.initialized_modules.count(module) != 0;
}

bool AccountBook::SetLocked(const primitives::Address& account, bool locked) {
  std::unique_lock lock(mutex_);
  const auto it = accounts_.find(account);
  if (it == accounts_.end()) {
    return false;
  }
  it->second.locked = locked;
  return true;
}

std::size_t AccountBook::size() const {
  std::shared_lock lock(mutex_);
  return accounts_.size();
}

bool AccountBook::BeginUpgrade(const primitives::Address& account, VersionId expected_version,
                               VersionId to_version, Rejection* rejection) {
  std::unique_lock lock(mutex_);
  const auto existing = accounts_.find(account);
  const bool created = existing == accounts_.end();
  if (!created && existing->second.phase == UpgradePhase::kUpgrading) {
    return Reject(rejection, RejectReason::kUpgradeInProgress, account);
  }
  const VersionId current = created ? kNoVersion : existing->second.current_version;
  if (current != expected_version) {
    return Reject(rejection, RejectReason::kUpgradeInProgress, account,
                  "account version changed concurrently");
  }
  auto& state = accounts_[account];
  pending_[account] = PendingUpgrade{state, created};
  state.current_version = to_version;
  state.phase = UpgradePhase::kUpgrading;
  return true;
}

void AccountBook::CommitUpgrade(const primitives::Address& account,
                                const std::vector<primitives::Address>& initialized) {
  std::unique_lock lock(mutex_);
  auto& state = accounts_[account];
  state.initialized_modules.insert(initialized.begin(), initialized.end());
  state.phase = UpgradePhase::kIdle;
  pending_.erase(account);
}

void AccountBook::AbortUpgrade(const primitives::Address& account) {
  std::unique_lock lock(mutex_);
  const auto it = pending_.find(account);
  if (it == pending_.end()) {
    return;
  }
  if (it->second.created) {
    accounts_.erase(account);
  } else {
    AccountState& state = accounts_[account];
    state = std::move(it->second.previous);
    state.phase = UpgradePhase::kIdle;
  }
  pending_.erase(it);
}

std::vector<std::pair<primitives::Address, AccountState>> AccountBook::Export() const {
  std::vector<std::pair<primitives::Address, AccountState>> out;
  {
    std::shared_lock lock(mutex_);
    out.reserve(accounts_.size());
    for (const auto& [account, state] : accounts_) {
      out.emplace_back(account, state);
    }
  }
  std::sort(out.begin(), out.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });
  return out;
}

void AccountBook::Restore(const primitives::Address& account, AccountState state) {
  std::unique_lock lock(mutex_);
  state.phase = UpgradePhase::kIdle;
  accounts_[account] = std::move(state);
}

}  // namespace modvault::manager
