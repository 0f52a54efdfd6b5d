#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tempo::db::model {

struct AccountRecord {
  int64_t id = 0;

  std::string device_id;
  std::string name;
  std::string email;  // unique
  std::string access_token;
  std::string refresh_token;

  std::optional<int64_t> last_used_at_us;
};

} // namespace tempo::db::model
