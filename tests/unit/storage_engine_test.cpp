#include "internal/core/storage_engine.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using tempo::core::StorageEngine;
using tempo::core::StorageEngineOptions;
using tempo::core::TimeRange;
using tempo::db::memory::MemoryRepository;
using tempo::model::Event;
using tempo::util::ParseIso8601;

Event MakeEvent(const std::string& at, int64_t duration_s) {
  Event e;
  e.timestamp = ParseIso8601(at);
  e.duration  = std::chrono::seconds(duration_s);
  (*e.data.mutable_fields())["status"].set_string_value("not-afk");
  return e;
}

void TestBucketLifecycleRemovesEvents() {
  StorageEngine engine(std::make_shared<MemoryRepository>(), StorageEngineOptions{});
  assert(engine.BackendName() == "memory");

  engine.CreateBucket("afk", "afkstatus", "watcher-afk", "host", ParseIso8601("2024-03-01"));
  engine.InsertOne("afk", MakeEvent("2024-03-01T10:00:00Z", 60));
  engine.InsertOne("afk", MakeEvent("2024-03-01T11:00:00Z", 60));
  assert(engine.GetEventCount("afk") == 2);
  assert(engine.Buckets().contains("afk"));

  engine.DeleteBucket("afk");
  assert(!engine.Buckets().contains("afk"));

  bool threw = false;
  try {
    (void)engine.GetMetadata("afk");
  } catch (const tempo::util::BucketNotFound&) {
    threw = true;
  }
  assert(threw);

  // recreating the id starts from an empty bucket
  engine.CreateBucket("afk", "afkstatus", "watcher-afk", "host", ParseIso8601("2024-03-02"));
  assert(engine.GetEventCount("afk") == 0);
  assert(engine.GetMetadata("afk").created == ParseIso8601("2024-03-02"));
}

void TestEventOperationsThroughFacade() {
  StorageEngine engine(std::make_shared<MemoryRepository>(), StorageEngineOptions{});
  engine.CreateBucket("window", "currentwindow", "watcher-window", "host", ParseIso8601("2024-03-01"));

  auto first = engine.InsertOne("window", MakeEvent("2024-03-01T10:00:00Z", 30));
  engine.InsertMany("window", {tempo::model::PendingEvent{.event = MakeEvent("2024-03-01T10:01:00Z", 30)}});

  auto heartbeat = engine.ReplaceLast("window", MakeEvent("2024-03-01T10:01:00Z", 90));
  assert(engine.GetEventCount("window") == 2);
  assert(engine.GetEvent("window", *heartbeat.id)->duration == std::chrono::seconds(90));

  engine.Replace("window", *first.id, MakeEvent("2024-03-01T10:00:00Z", 45));

  auto clipped = engine.GetEvents("window", -1,
                                  TimeRange{.start = ParseIso8601("2024-03-01T10:00:15Z"), .end = ParseIso8601("2024-03-01T10:02:00Z")});
  assert(clipped.size() == 2);
  assert(clipped[1].id == first.id);
  assert(clipped[1].duration == std::chrono::seconds(30));

  auto last = engine.GetLastEventOnDay("window", ParseIso8601("2024-03-01T23:00:00Z"));
  assert(last.has_value() && last->id == heartbeat.id);

  assert(engine.DeleteEvent("window", *first.id));
  assert(engine.GetEventCount("window") == 1);
}

void TestAuxiliaryStoresShareBackend() {
  auto          repo = std::make_shared<MemoryRepository>();
  StorageEngine engine(repo, StorageEngineOptions{.now = [] { return ParseIso8601("2024-03-01T08:00:00Z"); }});

  auto saved = engine.Accounts().Save(tempo::model::Account{.email = "ana@example.com", .access_token = "t1"});
  assert(saved.last_used_at == ParseIso8601("2024-03-01T08:00:00Z"));

  engine.Reports().Save(tempo::model::Report{.email = "ana@example.com", .spent_time = 3600, .date = ParseIso8601("2024-03-01T17:00:00Z")});

  // a second engine over the same repository sees the records
  StorageEngine other(repo, StorageEngineOptions{});
  assert(other.Accounts().Get("ana@example.com")->access_token == "t1");
  assert(other.Reports().Get("ana@example.com", ParseIso8601("2024-03-01"))->ActiveTime() == 3600);
}

} // namespace

int main() {
  TestBucketLifecycleRemovesEvents();
  TestEventOperationsThroughFacade();
  TestAuxiliaryStoresShareBackend();

  std::cout << "tempo_store_unit_storage_engine: pass\n";
  return 0;
}
