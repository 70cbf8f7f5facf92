#include "memory_repository.hpp"

#include <algorithm>
#include <cctype>

#include "memory_tx.hpp"

namespace turnstile::db::memory {

namespace {

std::string EmailKey(const std::string& email) {
  std::string key = email;
  std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return key;
}

} // namespace

MemoryRepository::MemoryRepository() : committed_(std::make_shared<const State>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------
// Accounts
// ------------------------------------------------------------

Result MemoryRepository::InsertAccount(Transaction& t, const model::AccountRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "account id is empty");
  if (s.accounts.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "account id " + r.id);

  const auto email_key = EmailKey(r.email);
  if (s.account_id_by_email.contains(email_key)) return Result::Err(ErrorCode::AlreadyExists, "email " + r.email);

  s.accounts[r.id]                = r;
  s.account_id_by_email[email_key] = r.id;
  return Result::Ok();
}

std::optional<model::AccountRecord> MemoryRepository::GetAccount(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.accounts.find(id);
  if (it == s.accounts.end()) return std::nullopt;
  return it->second;
}

std::optional<model::AccountRecord> MemoryRepository::GetAccountByEmail(Transaction& t, const std::string& email) {
  const auto& s      = TX(t).View();
  auto        by_key = s.account_id_by_email.find(EmailKey(email));
  if (by_key == s.account_id_by_email.end()) return std::nullopt;

  auto it = s.accounts.find(by_key->second);
  if (it == s.accounts.end()) return std::nullopt;
  return it->second;
}

std::vector<model::AccountRecord> MemoryRepository::ListAccounts(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::AccountRecord> records;
  records.reserve(s.accounts.size());
  for (const auto& [_, record] : s.accounts) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.created_at_ms < b.created_at_ms || (a.created_at_ms == b.created_at_ms && a.id < b.id); });
  return records;
}

// ------------------------------------------------------------
// Referral codes
// ------------------------------------------------------------

Result MemoryRepository::InsertReferralCode(Transaction& t, const model::ReferralCodeRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.code.empty()) return Result::Err(ErrorCode::ConstraintViolation, "referral code is empty");
  if (s.referral_codes.contains(r.code)) return Result::Err(ErrorCode::AlreadyExists, "referral code " + r.code);
  s.referral_codes[r.code] = r;
  return Result::Ok();
}

std::optional<model::ReferralCodeRecord> MemoryRepository::GetReferralCode(Transaction& t, const std::string& code) {
  const auto& s  = TX(t).View();
  auto        it = s.referral_codes.find(code);
  if (it == s.referral_codes.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::RedeemReferralCode(Transaction& t, const std::string& code) {
  auto& s  = TX(t).Mutable();
  auto  it = s.referral_codes.find(code);
  if (it == s.referral_codes.end()) return Result::Err(ErrorCode::NotFound, "referral code " + code);
  if (!it->second.IsUsable()) return Result::Err(ErrorCode::Conflict, "referral code " + code + " has no uses left");
  it->second.uses++;
  return Result::Ok();
}

} // namespace turnstile::db::memory
