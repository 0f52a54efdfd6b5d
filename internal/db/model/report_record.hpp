#pragma once

#include <cstdint>
#include <string>

namespace tempo::db::model {

struct ReportRecord {
  int64_t id = 0;

  std::string email;
  double      spent_time = 0;
  double      call_time  = 0;
  int64_t     date_us    = 0;
  bool        wfh        = false;
};

} // namespace tempo::db::model
