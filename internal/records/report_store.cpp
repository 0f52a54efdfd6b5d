#include "report_store.hpp"

#include <chrono>

#include "internal/core/db_errors.hpp"
#include "internal/util/errors.hpp"

namespace tempo::records {

namespace {

db::ReportWindow DayWindow(util::TimePoint day) {
  const auto start = util::StartOfDayUtc(day);
  return db::ReportWindow{
      .from_us = util::ToUnixMicros(start),
      .to_us   = util::ToUnixMicros(start + std::chrono::hours(24)),
  };
}

model::Report FromRecord(const db::model::ReportRecord& record) {
  model::Report report;
  report.id         = record.id;
  report.email      = record.email;
  report.spent_time = record.spent_time;
  report.call_time  = record.call_time;
  report.date       = util::FromUnixMicros(record.date_us);
  report.wfh        = record.wfh;
  return report;
}

} // namespace

ReportStore::ReportStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

model::Report ReportStore::Save(const model::Report& report) {
  if (report.email.empty()) throw util::ValidationError("report email must not be empty");
  if (report.spent_time < 0 || report.call_time < 0) throw util::ValidationError("report times must not be negative");

  db::model::ReportRecord record;
  record.email      = report.email;
  record.spent_time = report.spent_time;
  record.call_time  = report.call_time;
  record.date_us    = util::ToUnixMicros(report.date);
  record.wfh        = report.wfh;

  const auto context = "save report " + report.email + " " + util::FormatIso8601(util::StartOfDayUtc(report.date));
  core::WithBackend(context, [&] {
    auto tx = repository_->Begin();
    core::ThrowIfDbError(repository_->DeleteReports(*tx, report.email, DayWindow(report.date)), context);
    core::ThrowIfDbError(repository_->InsertReport(*tx, record), context);
    tx->Commit();
  });

  return FromRecord(record);
}

std::optional<model::Report> ReportStore::Get(const std::string& email, util::TimePoint day) {
  auto record = core::WithBackend("get report " + email, [&] {
    auto tx = repository_->BeginRead();
    return repository_->GetReport(*tx, email, DayWindow(day));
  });
  if (!record.has_value()) return std::nullopt;
  return FromRecord(*record);
}

} // namespace tempo::records
