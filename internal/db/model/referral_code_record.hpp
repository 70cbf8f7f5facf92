#pragma once

#include <cstdint>
#include <string>

namespace turnstile::db::model {

/*
  Referral code row.

  A code is usable while max_uses == 0 (unlimited) or uses < max_uses.
*/

struct ReferralCodeRecord {
  std::string code;
  std::string owner_account_id;

  uint32_t max_uses = 0;
  uint32_t uses     = 0;

  bool IsUsable() const {
    return max_uses == 0 || uses < max_uses;
  }
};

}
