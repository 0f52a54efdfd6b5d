#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace tempo::model {

// Daily activity report. One report per (email, UTC day).
struct Report {
  std::optional<int64_t> id;

  std::string     email;
  double          spent_time = 0;  // seconds
  double          call_time  = 0;  // seconds
  util::TimePoint date{};
  bool            wfh = false;

  double ActiveTime() const {
    return spent_time + call_time;
  }
};

} // namespace tempo::model
