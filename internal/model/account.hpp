#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace tempo::model {

/*
  Credential record for one account. `email` is the natural key;
  `last_used_at` is stamped on every save and drives the usage tracker.
*/
struct Account {
  std::optional<int64_t> id;

  std::string device_id;
  std::string name;
  std::string email;
  std::string access_token;
  std::string refresh_token;

  std::optional<util::TimePoint> last_used_at;
};

} // namespace tempo::model
