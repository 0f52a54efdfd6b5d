#include "account_store.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tempo::records {

namespace {

db::model::AccountRecord ToRecord(const model::Account& account) {
  db::model::AccountRecord record;
  record.device_id     = account.device_id;
  record.name          = account.name;
  record.email         = account.email;
  record.access_token  = account.access_token;
  record.refresh_token = account.refresh_token;
  if (account.last_used_at.has_value()) record.last_used_at_us = util::ToUnixMicros(*account.last_used_at);
  return record;
}

model::Account FromRecord(const db::model::AccountRecord& record) {
  model::Account account;
  account.id            = record.id;
  account.device_id     = record.device_id;
  account.name          = record.name;
  account.email         = record.email;
  account.access_token  = record.access_token;
  account.refresh_token = record.refresh_token;
  if (record.last_used_at_us.has_value()) account.last_used_at = util::FromUnixMicros(*record.last_used_at_us);
  return account;
}

std::vector<model::Account> FromRecords(const std::vector<db::model::AccountRecord>& records) {
  std::vector<model::Account> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(FromRecord(record));
  }
  return out;
}

} // namespace

AccountStore::AccountStore(std::shared_ptr<db::Repository> repository, util::NowFn now)
    : repository_(std::move(repository)), now_(std::move(now)) {
}

model::Account AccountStore::Save(const model::Account& account) {
  if (account.email.empty()) throw util::ValidationError("account email must not be empty");

  auto record            = ToRecord(account);
  record.last_used_at_us = util::ToUnixMicros(now_ ? now_() : util::Now());

  core::WithBackend("save account " + account.email, [&] {
    auto tx = repository_->Begin();
    core::ThrowIfDbError(repository_->DeleteAccountsByEmail(*tx, account.email), "save account " + account.email);
    core::ThrowIfDbError(repository_->InsertAccount(*tx, record), "save account " + account.email);
    tx->Commit();
  });

  TEMPO_LOG_DEBUG("account saved", {observability::StringField("email", account.email)});
  return FromRecord(record);
}

std::optional<model::Account> AccountStore::Get(const std::string& email) {
  auto record = core::WithBackend("get account " + email, [&] {
    auto tx = repository_->BeginRead();
    return repository_->GetAccountByEmail(*tx, email);
  });
  if (!record.has_value()) return std::nullopt;
  return FromRecord(*record);
}

std::vector<model::Account> AccountStore::ListAll() {
  return FromRecords(core::WithBackend("list accounts", [&] {
    auto tx = repository_->BeginRead();
    return repository_->ListAccounts(*tx, std::nullopt);
  }));
}

std::vector<model::Account> AccountStore::ListActiveSince(util::TimePoint threshold) {
  return FromRecords(core::WithBackend("list active accounts", [&] {
    auto tx = repository_->BeginRead();
    return repository_->ListAccounts(*tx, util::ToUnixMicros(threshold));
  }));
}

} // namespace tempo::records
