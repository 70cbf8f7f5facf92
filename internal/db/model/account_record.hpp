#pragma once

#include <cstdint>
#include <string>

namespace turnstile::db::model {

struct AccountRecord {
  std::string id;
  std::string email;

  // Empty when the account registered without a referral.
  std::string referral_code;

  uint64_t created_at_ms = 0;
};

}
