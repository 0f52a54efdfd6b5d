#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/account.hpp"
#include "internal/util/time.hpp"

namespace tempo::records {

/*
  Credential store and usage tracker over the accounts table.

  `email` is the natural key. Save() is a full replace: the old record is
  deleted and the new one inserted in the same transaction, so nothing of
  the previous values survives.
*/
class AccountStore {
 public:
  // `now` stamps last_used_at on every save; util::Now when empty.
  AccountStore(std::shared_ptr<db::Repository> repository, util::NowFn now = {});

  // Returns the stored record with its id and last_used_at filled in.
  model::Account Save(const model::Account& account);

  std::optional<model::Account> Get(const std::string& email);

  std::vector<model::Account> ListAll();

  // Accounts with last_used_at >= threshold.
  std::vector<model::Account> ListActiveSince(util::TimePoint threshold);

 private:
  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
};

} // namespace tempo::records
