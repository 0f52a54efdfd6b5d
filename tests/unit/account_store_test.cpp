#include "internal/records/account_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using tempo::db::memory::MemoryRepository;
using tempo::model::Account;
using tempo::records::AccountStore;
using tempo::util::ParseIso8601;
using tempo::util::TimePoint;

Account MakeAccount(const std::string& email, const std::string& token) {
  Account account;
  account.device_id     = "device-1";
  account.name          = "Ana";
  account.email         = email;
  account.access_token  = token;
  account.refresh_token = token + "-refresh";
  return account;
}

void TestSavingTwiceKeepsOneRecordWithLatestValues() {
  auto         now = std::make_shared<TimePoint>(ParseIso8601("2024-03-01T08:00:00Z"));
  AccountStore store(std::make_shared<MemoryRepository>(), [now] { return *now; });

  store.Save(MakeAccount("ana@example.com", "first"));

  *now += std::chrono::hours(1);
  auto second    = MakeAccount("ana@example.com", "second");
  second.name    = "Ana B.";
  auto persisted = store.Save(second);
  assert(persisted.id.has_value());

  auto all = store.ListAll();
  assert(all.size() == 1);
  assert(all[0].access_token == "second");
  assert(all[0].refresh_token == "second-refresh");
  assert(all[0].name == "Ana B.");
  assert(all[0].last_used_at == ParseIso8601("2024-03-01T09:00:00Z"));

  auto read = store.Get("ana@example.com");
  assert(read.has_value());
  assert(read->id == persisted.id);
}

void TestListActiveSinceFiltersOnLastUse() {
  auto         now = std::make_shared<TimePoint>(ParseIso8601("2024-03-01T08:00:00Z"));
  AccountStore store(std::make_shared<MemoryRepository>(), [now] { return *now; });

  store.Save(MakeAccount("old@example.com", "a"));
  *now = ParseIso8601("2024-03-05T08:00:00Z");
  store.Save(MakeAccount("recent@example.com", "b"));

  auto active = store.ListActiveSince(ParseIso8601("2024-03-04"));
  assert(active.size() == 1);
  assert(active[0].email == "recent@example.com");

  assert(store.ListActiveSince(ParseIso8601("2024-02-01")).size() == 2);
  assert(store.ListActiveSince(ParseIso8601("2024-04-01")).empty());
}

void TestMissingAndInvalid() {
  AccountStore store(std::make_shared<MemoryRepository>());
  assert(!store.Get("nobody@example.com").has_value());

  bool threw = false;
  try {
    store.Save(MakeAccount("", "x"));
  } catch (const tempo::util::ValidationError&) {
    threw = true;
  }
  assert(threw && "an account without email must be rejected.");
  assert(store.ListAll().empty());
}

} // namespace

int main() {
  TestSavingTwiceKeepsOneRecordWithLatestValues();
  TestListActiveSinceFiltersOnLastUse();
  TestMissingAndInvalid();

  std::cout << "tempo_store_unit_account_store: pass\n";
  return 0;
}
