#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/account_record.hpp"
#include "internal/db/model/referral_code_record.hpp"

namespace turnstile::db {

/*
  Repository abstraction.

  This is the synchronous lookup capability guards call to check external
  facts ("email already registered", "referral code exists"). Guards only
  read; hosts write from post-commit hooks.

  GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A transaction that is never committed leaves no trace
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Accounts
  // ---------------------------------------------------------------------

  // Email uniqueness is case-insensitive.
  virtual Result InsertAccount(Transaction&, const model::AccountRecord&) = 0;

  virtual std::optional<model::AccountRecord> GetAccount(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::AccountRecord> GetAccountByEmail(Transaction&, const std::string& email) = 0;

  virtual std::vector<model::AccountRecord> ListAccounts(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Referral codes
  // ---------------------------------------------------------------------

  virtual Result InsertReferralCode(Transaction&, const model::ReferralCodeRecord&) = 0;

  virtual std::optional<model::ReferralCodeRecord> GetReferralCode(Transaction&, const std::string& code) = 0;

  // Increments the use counter; Conflict once max_uses is reached.
  virtual Result RedeemReferralCode(Transaction&, const std::string& code) = 0;
};

} // namespace turnstile::db
