#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/storage_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

#if TEMPO_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_tx.hpp"
#endif

namespace {

using tempo::db::DbError;
using tempo::db::ErrorCode;
using tempo::db::EventQuery;
using tempo::db::Repository;
using tempo::db::model::AccountRecord;
using tempo::db::model::BucketRecord;
using tempo::db::model::EventRecord;
using tempo::db::model::ReportRecord;
using tempo::runtime::config::RuntimeConfig;

constexpr int64_t kSecond = 1'000'000;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  RuntimeConfig                                     config;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_writers = true;
  std::function<void(const RuntimeConfig&)>         backend_checks;
};

BucketRecord MakeBucket(const std::string& id) {
  return BucketRecord{.id = id, .name = id, .type = "test", .client = "parity", .hostname = "localhost", .created_us = 1'700'000'000 * kSecond};
}

EventRecord MakeEvent(int64_t bucket_key, int64_t start_s, int64_t duration_s, const std::string& data = R"({"app":"editor"})") {
  return EventRecord{.bucket_key = bucket_key, .timestamp_us = start_s * kSecond, .duration_us = duration_s * kSecond, .data = data};
}

int64_t SeedBucket(Repository& repo, const std::string& id) {
  auto         tx     = repo.Begin();
  BucketRecord bucket = MakeBucket(id);
  assert(repo.InsertBucket(*tx, bucket));
  assert(bucket.key > 0);
  tx->Commit();
  return bucket.key;
}

void VerifyBucketLifecycle(Repository& repo, const std::string& id) {
  const auto key = SeedBucket(repo, id);

  {
    auto tx   = repo.BeginRead();
    auto read = repo.GetBucket(*tx, id);
    assert(read.has_value());
    assert(read->key == key);
    assert(read->hostname == "localhost");
    assert(read->created_us == 1'700'000'000 * kSecond);

    bool listed = false;
    for (const auto& bucket : repo.ListBuckets(*tx)) {
      listed = listed || bucket.id == id;
    }
    assert(listed);
  }

  {
    // failing statement last: postgres aborts the rest of the transaction
    auto         tx        = repo.Begin();
    BucketRecord duplicate = MakeBucket(id);
    auto         result    = repo.InsertBucket(*tx, duplicate);
    assert(!result);
    assert(result.code == ErrorCode::AlreadyExists || result.code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }

  {
    auto tx    = repo.Begin();
    auto event = MakeEvent(key, 100, 1);
    assert(repo.InsertEvent(*tx, event));
    assert(repo.DeleteBucketEvents(*tx, key));
    assert(repo.DeleteBucket(*tx, key));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(!repo.GetBucket(*tx, id).has_value());
    assert(repo.DeleteBucket(*tx, key).code == ErrorCode::NotFound);
    tx->Rollback();
  }
}

void VerifyEventReadWrite(Repository& repo, const std::string& id) {
  const auto key = SeedBucket(repo, id);

  auto tx    = repo.Begin();
  auto event = MakeEvent(key, 100, 10, R"({"app":"browser","title":"docs"})");
  assert(repo.InsertEvent(*tx, event));
  assert(event.id > 0);

  auto read = repo.GetEvent(*tx, key, event.id);
  assert(read.has_value());
  assert(read->timestamp_us == 100 * kSecond);
  assert(read->duration_us == 10 * kSecond);
  assert(tempo::model::SameContent(
      tempo::model::Event{.data = tempo::model::DataFromJson(read->data)},
      tempo::model::Event{.data = tempo::model::DataFromJson(R"({"title":"docs","app":"browser"})")}));

  auto updated         = *read;
  updated.timestamp_us = 150 * kSecond;
  updated.duration_us  = 20 * kSecond;
  updated.data         = R"({"app":"terminal"})";
  assert(repo.UpdateEvent(*tx, updated));
  assert(repo.GetEvent(*tx, key, event.id)->duration_us == 20 * kSecond);

  auto missing = updated;
  missing.id   = event.id + 10'000;
  assert(repo.UpdateEvent(*tx, missing).code == ErrorCode::NotFound);

  assert(repo.DeleteEvent(*tx, key, event.id));
  assert(repo.DeleteEvent(*tx, key, event.id).code == ErrorCode::NotFound);
  assert(!repo.GetEvent(*tx, key, event.id).has_value());
  tx->Commit();
}

void VerifyQueryParity(Repository& repo, const std::string& id) {
  const auto key = SeedBucket(repo, id);

  auto tx = repo.Begin();
  auto e1 = MakeEvent(key, 100, 10);
  auto e2 = MakeEvent(key, 200, 5);
  auto e3 = MakeEvent(key, 200, 1);
  assert(repo.InsertEvent(*tx, e1));
  assert(repo.InsertEvent(*tx, e2));
  assert(repo.InsertEvent(*tx, e3));
  tx->Commit();

  auto read = repo.BeginRead();

  auto all = repo.ListEvents(*read, EventQuery{.bucket_key = key});
  assert(all.size() == 3);
  assert(all[0].id == e3.id);
  assert(all[1].id == e2.id);
  assert(all[2].id == e1.id);

  auto window = repo.ListEvents(*read, EventQuery{.bucket_key = key, .start_us = 150 * kSecond, .end_us = 250 * kSecond});
  assert(window.size() == 2);
  assert(repo.CountEvents(*read, EventQuery{.bucket_key = key, .start_us = 150 * kSecond, .end_us = 250 * kSecond}) == 2);

  // boundaries are inclusive on both sides
  auto touching = repo.ListEvents(*read, EventQuery{.bucket_key = key, .start_us = 110 * kSecond, .end_us = 110 * kSecond});
  assert(touching.size() == 1);
  assert(touching[0].id == e1.id);

  auto limited = repo.ListEvents(*read, EventQuery{.bucket_key = key, .limit = 1});
  assert(limited.size() == 1);
  assert(limited[0].id == e3.id);
  assert(repo.CountEvents(*read, EventQuery{.bucket_key = key, .limit = 1}) == 3);

  auto since = repo.ListEvents(*read, EventQuery{.bucket_key = key, .min_timestamp_us = 150 * kSecond});
  assert(since.size() == 2);

  auto last = repo.GetLastEvent(*read, key);
  assert(last.has_value());
  assert(last->id == e3.id);
}

void VerifyBulkInsert(Repository& repo, const std::string& id) {
  const auto key = SeedBucket(repo, id);

  std::vector<EventRecord> rows;
  for (int64_t i = 0; i < 100; ++i) {
    rows.push_back(MakeEvent(key, i, 1, R"({"n":)" + std::to_string(i) + "}"));
  }

  auto tx = repo.Begin();
  assert(repo.InsertEvents(*tx, rows));
  assert(repo.InsertEvents(*tx, {}));
  tx->Commit();

  auto read = repo.BeginRead();
  assert(repo.CountEvents(*read, EventQuery{.bucket_key = key}) == 100);
  auto newest = repo.GetLastEvent(*read, key);
  assert(newest->timestamp_us == 99 * kSecond);
  assert(tempo::model::DataFromJson(newest->data).fields().at("n").number_value() == 99);
}

void VerifyMissingBucketKey(Repository& repo) {
  auto tx    = repo.Begin();
  auto event = MakeEvent(987'654'321, 1, 1);
  assert(repo.InsertEvent(*tx, event).code == ErrorCode::NotFound);
  tx->Rollback();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto         tx     = repo.Begin();
    BucketRecord bucket = MakeBucket(id);
    assert(repo.InsertBucket(*tx, bucket));
    tx->Rollback();
  }
  {
    // destructor rolls back
    auto         tx     = repo.Begin();
    BucketRecord bucket = MakeBucket(id);
    assert(repo.InsertBucket(*tx, bucket));
  }

  auto tx = repo.BeginRead();
  assert(!repo.GetBucket(*tx, id).has_value());
}

void VerifyReadOnlyRejectsWrites(Repository& repo, const std::string& id) {
  auto         tx     = repo.BeginRead();
  BucketRecord bucket = MakeBucket(id);

  bool threw = false;
  try {
    (void)repo.InsertBucket(*tx, bucket);
  } catch (const DbError& e) {
    threw = e.code() == ErrorCode::Unsupported;
  }
  assert(threw && "writes through a read transaction must be refused.");
}

void VerifyWriterContention(Repository& repo, const std::string& id, bool supports_parallel_writers) {
  const auto key = SeedBucket(repo, id);
  auto       seed = MakeEvent(key, 100, 1);
  {
    auto tx = repo.Begin();
    assert(repo.InsertEvent(*tx, seed));
    tx->Commit();
  }

  auto tx1 = repo.Begin();
  if (!supports_parallel_writers) {
    // the competing writer must come from another thread
    bool        threw = false;
    std::thread competitor([&repo, &threw] {
      try {
        auto tx2 = repo.Begin();
        (void)tx2;
      } catch (const DbError& e) {
        threw = e.code() == ErrorCode::Busy;
      }
    });
    competitor.join();
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();
  auto r1  = repo.GetEvent(*tx1, key, seed.id);
  auto r2  = repo.GetEvent(*tx2, key, seed.id);
  assert(r1.has_value() && r2.has_value());

  r1->duration_us = 2 * kSecond;
  r2->duration_us = 3 * kSecond;
  assert(repo.UpdateEvent(*tx1, *r1));
  tx1->Commit();
  assert(repo.UpdateEvent(*tx2, *r2));
  tx2->Commit();

  auto verify = repo.BeginRead();
  assert(repo.GetEvent(*verify, key, seed.id)->duration_us == 3 * kSecond);
}

void VerifyReadersDoNotBlockWriters(Repository& repo, const std::string& id) {
  const auto key  = SeedBucket(repo, id);
  auto       seed = MakeEvent(key, 100, 1);
  {
    auto tx = repo.Begin();
    assert(repo.InsertEvent(*tx, seed));
    tx->Commit();
  }

  // the reader stays open well past the 200ms busy timeout
  auto reader = repo.BeginRead();
  assert(repo.GetEvent(*reader, key, seed.id).has_value());

  bool        committed = false;
  std::thread writer([&repo, &committed, &seed] {
    auto tx      = repo.Begin();
    auto updated = seed;
    updated.duration_us = 7 * kSecond;
    assert(repo.UpdateEvent(*tx, updated));
    tx->Commit();
    committed = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(400));
  writer.join();
  assert(committed && "an open read transaction must not hold writers off.");

  assert(repo.CountEvents(*reader, EventQuery{.bucket_key = key}) == 1);
  reader->Commit();

  auto verify = repo.BeginRead();
  assert(repo.GetEvent(*verify, key, seed.id)->duration_us == 7 * kSecond);
}

void VerifyAccountsAndReports(Repository& repo, const std::string& email) {
  {
    auto          tx = repo.Begin();
    AccountRecord account{.device_id = "d1", .name = "Ana", .email = email, .access_token = "t1", .refresh_token = "r1", .last_used_at_us = 100};
    assert(repo.InsertAccount(*tx, account));
    assert(account.id > 0);

    AccountRecord duplicate = account;
    assert(repo.InsertAccount(*tx, duplicate).code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }

  {
    auto          tx = repo.Begin();
    AccountRecord account{.device_id = "d1", .name = "Ana", .email = email, .access_token = "t1", .refresh_token = "r1", .last_used_at_us = 100};
    assert(repo.InsertAccount(*tx, account));
    assert(repo.DeleteAccountsByEmail(*tx, email));
    account.access_token    = "t2";
    account.last_used_at_us = 500;
    assert(repo.InsertAccount(*tx, account));

    ReportRecord report{.email = email, .spent_time = 10, .call_time = 5, .date_us = 86'400 * kSecond + 3600 * kSecond, .wfh = true};
    assert(repo.InsertReport(*tx, report));
    assert(report.id > 0);
    tx->Commit();
  }

  auto tx   = repo.BeginRead();
  auto read = repo.GetAccountByEmail(*tx, email);
  assert(read.has_value());
  assert(read->access_token == "t2");

  bool active = false;
  for (const auto& account : repo.ListAccounts(*tx, 400)) {
    active = active || account.email == email;
  }
  assert(active);
  for (const auto& account : repo.ListAccounts(*tx, 600)) {
    assert(account.email != email);
  }

  const tempo::db::ReportWindow day{.from_us = 86'400 * kSecond, .to_us = 2 * 86'400 * kSecond};
  auto                          report = repo.GetReport(*tx, email, day);
  assert(report.has_value());
  assert(report->spent_time == 10);
  assert(report->call_time == 5);
  assert(report->wfh);
  assert(!repo.GetReport(*tx, email, tempo::db::ReportWindow{.from_us = 0, .to_us = 86'400 * kSecond}).has_value());
}

void VerifyEngineScenario(const RuntimeConfig& config, const std::string& prefix) {
  auto engine = tempo::factory::BuildEngine(config);
  auto bucket = prefix + "-engine";

  engine->CreateBucket(bucket, "test", "parity", "localhost", tempo::util::FromUnixMicros(0));

  tempo::model::Event e1{.timestamp = tempo::util::FromUnixMicros(100 * kSecond), .duration = std::chrono::seconds(10)};
  tempo::model::Event e2{.timestamp = tempo::util::FromUnixMicros(200 * kSecond), .duration = std::chrono::seconds(5)};
  auto                stored1 = engine->InsertOne(bucket, e1);
  engine->InsertOne(bucket, e2);

  auto clipped = engine->GetEvents(bucket, -1,
                                   tempo::core::TimeRange{.start = tempo::util::FromUnixMicros(105 * kSecond),
                                                          .end   = tempo::util::FromUnixMicros(150 * kSecond)});
  assert(clipped.size() == 1);
  assert(clipped[0].id == stored1.id);
  assert(clipped[0].timestamp == tempo::util::FromUnixMicros(105 * kSecond));
  assert(clipped[0].duration == std::chrono::seconds(5));

  std::vector<tempo::model::EventWrite> writes;
  for (int64_t i = 0; i < 150; ++i) {
    writes.push_back(tempo::model::PendingEvent{.event = {.timestamp = tempo::util::FromUnixMicros((1000 + i) * kSecond)}});
  }
  engine->InsertMany(bucket, writes);
  assert(engine->GetEventCount(bucket) == 152);

  auto last = engine->ReplaceLast(bucket, tempo::model::Event{.timestamp = tempo::util::FromUnixMicros(1149 * kSecond),
                                                              .duration  = std::chrono::seconds(30)});
  assert(engine->GetEventCount(bucket) == 152);
  assert(engine->GetEvent(bucket, *last.id)->duration == std::chrono::seconds(30));

  engine->Accounts().Save(tempo::model::Account{.email = prefix + "@example.com", .access_token = "a"});
  engine->Accounts().Save(tempo::model::Account{.email = prefix + "@example.com", .access_token = "b"});
  assert(engine->Accounts().Get(prefix + "@example.com")->access_token == "b");

  engine->DeleteBucket(bucket);
  bool threw = false;
  try {
    (void)engine->GetEventCount(bucket);
  } catch (const tempo::util::BucketNotFound&) {
    threw = true;
  }
  assert(threw);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  const auto key = SeedBucket(*repo, id);
  {
    auto tx    = repo->Begin();
    auto event = MakeEvent(key, 42, 7, R"({"durable":true})");
    assert(repo->InsertEvent(*tx, event));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx     = repo->BeginRead();
  auto bucket = repo->GetBucket(*tx, id);
  assert(bucket.has_value());
  assert(bucket->key == key);
  auto last = repo->GetLastEvent(*tx, key);
  assert(last.has_value());
  assert(last->duration_us == 7 * kSecond);
  assert(tempo::model::DataFromJson(last->data).fields().at("durable").bool_value());
}

BackendFactory MakeMemoryFactory() {
  RuntimeConfig config;
  config.mutable_database()->mutable_memory()->set_busy_timeout_ms(200);
  return BackendFactory{
      .name                      = "memory",
      .config                    = config,
      .make_repository           = [config]() { return tempo::factory::BuildRepository(config); },
      .supports_restart          = []() { return false; },
      .restart                   = [](std::shared_ptr<Repository>&) {},
      .cleanup                   = []() {},
      .supports_parallel_writers = false,
  };
}

#if TEMPO_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto directory = std::filesystem::temp_directory_path() / ("tempo_store_integration_sqlite_" + std::to_string(NowMs()));

  RuntimeConfig config;
  config.mutable_database()->set_dataset("parity");
  config.mutable_database()->set_testing(true);
  config.mutable_database()->mutable_sqlite()->set_directory(directory.string());
  config.mutable_database()->mutable_sqlite()->set_busy_timeout_ms(200);

  auto make_repo = [config]() { return tempo::factory::BuildRepository(config); };
  return BackendFactory{
      .name                      = "sqlite",
      .config                    = config,
      .make_repository           = make_repo,
      .supports_restart          = []() { return true; },
      .restart                   = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup                   = [directory]() { std::filesystem::remove_all(directory); },
      .supports_parallel_writers = false,
  };
}
#endif

#if TEMPO_DB_POSTGRES
// A pooled connection killed server-side must surface as Unavailable.
void VerifyDeadPooledConnectionIsUnavailable(const RuntimeConfig& config) {
  const auto conninfo = config.database().postgres().connection_uri();
  auto       repo     = tempo::factory::BuildRepository(config);

  int pid = 0;
  {
    auto tx = repo->BeginRead();
    pid     = dynamic_cast<tempo::db::postgres::PgTransaction&>(*tx).Work().query_value<int>("SELECT pg_backend_pid()");
    tx->Commit();
  }

  {
    pqxx::connection admin(conninfo);
    pqxx::work       tx(admin);
    assert(tx.query_value<bool>("SELECT pg_terminate_backend(" + tx.quote(pid) + ")"));
    tx.commit();
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(200));

  bool unavailable = false;
  try {
    auto tx = repo->BeginRead();
    (void)tx;
  } catch (const DbError& e) {
    unavailable = e.code() == ErrorCode::Unavailable;
  }
  assert(unavailable);
}

BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("TEMPO_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("TEMPO_TEST_POSTGRES_URI is not set");
  }

  RuntimeConfig config;
  config.mutable_database()->set_dataset("parity_" + std::to_string(NowMs()));
  config.mutable_database()->set_testing(true);
  config.mutable_database()->mutable_postgres()->set_connection_uri(uri);
  config.mutable_database()->mutable_postgres()->set_max_connections(4);

  auto conninfo  = std::string(uri);
  auto schema    = tempo::factory::PostgresSchemaName(config.database());
  auto make_repo = [config]() { return tempo::factory::BuildRepository(config); };
  return BackendFactory{
      .name                      = "postgres",
      .config                    = config,
      .make_repository           = make_repo,
      .supports_restart          = []() { return true; },
      .restart                   = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                   = [conninfo, schema]() {
        pqxx::connection conn(conninfo);
        pqxx::work       tx(conn);
        tx.exec("DROP SCHEMA IF EXISTS " + tx.quote_name(schema) + " CASCADE");
        tx.commit();
      },
      .supports_parallel_writers = true,
      .backend_checks            = VerifyDeadPooledConnectionIsUnavailable,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  auto repo = backend.make_repository();
  VerifyBucketLifecycle(*repo, backend.name + "-bucket-life");
  VerifyEventReadWrite(*repo, backend.name + "-events");
  VerifyQueryParity(*repo, backend.name + "-query");
  VerifyBulkInsert(*repo, backend.name + "-bulk");
  VerifyMissingBucketKey(*repo);
  VerifyRollbackBehavior(*repo, backend.name + "-rollback");
  VerifyReadOnlyRejectsWrites(*repo, backend.name + "-readonly");
  VerifyWriterContention(*repo, backend.name + "-contention", backend.supports_parallel_writers);
  VerifyReadersDoNotBlockWriters(*repo, backend.name + "-readers");
  VerifyAccountsAndReports(*repo, backend.name + "@example.com");
  repo.reset();

  VerifyEngineScenario(backend.config, backend.name);
  VerifyRestartDurability(backend, backend.name + "-durable");
  if (backend.backend_checks) backend.backend_checks(backend.config);
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
#if TEMPO_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif
#if TEMPO_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "tempo_store_integration_repository_parity: pass\n";
  return 0;
}
