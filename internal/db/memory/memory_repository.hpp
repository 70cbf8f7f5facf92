#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace turnstile::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertAccount(Transaction&, const model::AccountRecord&) override;
  std::optional<model::AccountRecord> GetAccount(Transaction&, const std::string&) override;
  std::optional<model::AccountRecord> GetAccountByEmail(Transaction&, const std::string&) override;
  std::vector<model::AccountRecord> ListAccounts(Transaction&) override;

  Result InsertReferralCode(Transaction&, const model::ReferralCodeRecord&) override;
  std::optional<model::ReferralCodeRecord> GetReferralCode(Transaction&, const std::string&) override;
  Result RedeemReferralCode(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::AccountRecord> accounts;
    std::unordered_map<std::string, std::string> account_id_by_email;
    std::unordered_map<std::string, model::ReferralCodeRecord> referral_codes;
  };

  // Published snapshots are immutable; transactions share them until they write.
  std::mutex mutex_;
  std::shared_ptr<const State> committed_;
  uint64_t committed_version_ = 0;
};

}
