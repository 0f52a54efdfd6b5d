#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/model/report.hpp"

namespace tempo::records {

/*
  Daily reports keyed by (email, UTC day of `date`).

  Save() deletes whatever is stored for that key and inserts the new
  report in one transaction.
*/
class ReportStore {
 public:
  explicit ReportStore(std::shared_ptr<db::Repository> repository);

  model::Report Save(const model::Report& report);

  // Report for the UTC day containing `day`.
  std::optional<model::Report> Get(const std::string& email, util::TimePoint day);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace tempo::records
