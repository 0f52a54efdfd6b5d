#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace tempo::db::memory {

namespace {

bool Matches(const model::EventRecord& e, const EventQuery& q) {
  if (q.end_us.has_value() && e.timestamp_us > *q.end_us) return false;
  if (q.start_us.has_value() && e.timestamp_us + e.duration_us < *q.start_us) return false;
  if (q.min_timestamp_us.has_value() && e.timestamp_us < *q.min_timestamp_us) return false;
  return true;
}

// timestamp DESC, id DESC
bool NewerFirst(const model::EventRecord& a, const model::EventRecord& b) {
  if (a.timestamp_us != b.timestamp_us) return a.timestamp_us > b.timestamp_us;
  return a.id > b.id;
}

bool InWindow(const model::ReportRecord& r, const std::string& email, const ReportWindow& w) {
  return r.email == email && r.date_us >= w.from_us && r.date_us < w.to_us;
}

} // namespace

MemoryRepository::MemoryRepository(std::chrono::milliseconds busy_timeout) : busy_timeout_(busy_timeout) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, TxMode::ReadWrite);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, TxMode::ReadOnly);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Buckets
// ------------------------------------------------------------------

Result MemoryRepository::InsertBucket(Transaction& t, model::BucketRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.buckets.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "bucket id exists: " + r.id);

  r.key                = s.next_bucket_key++;
  s.buckets[r.id]      = r;
  s.bucket_ids[r.key]  = r.id;
  s.events.try_emplace(r.key);
  return Result::Ok();
}

std::optional<model::BucketRecord> MemoryRepository::GetBucket(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.buckets.find(id);
  if (it == s.buckets.end()) return std::nullopt;
  return it->second;
}

std::vector<model::BucketRecord> MemoryRepository::ListBuckets(Transaction& t) {
  const auto&                      s = TX(t).View();
  std::vector<model::BucketRecord> out;
  out.reserve(s.buckets.size());
  for (const auto& [_, record] : s.buckets) {
    out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.key < b.key; });
  return out;
}

Result MemoryRepository::DeleteBucket(Transaction& t, int64_t bucket_key) {
  auto& s  = TX(t).Mutable();
  auto  it = s.bucket_ids.find(bucket_key);
  if (it == s.bucket_ids.end()) return Result::Err(ErrorCode::NotFound, "bucket key " + std::to_string(bucket_key));

  s.buckets.erase(it->second);
  s.bucket_ids.erase(it);
  s.events.erase(bucket_key);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result MemoryRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.events.find(r.bucket_key);
  if (it == s.events.end()) return Result::Err(ErrorCode::NotFound, "bucket key " + std::to_string(r.bucket_key));

  r.id             = s.next_event_id++;
  it->second[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::InsertEvents(Transaction& t, const std::vector<model::EventRecord>& records) {
  auto& s = TX(t).Mutable();
  for (const auto& r : records) {
    if (!s.events.contains(r.bucket_key)) return Result::Err(ErrorCode::NotFound, "bucket key " + std::to_string(r.bucket_key));
  }
  for (auto r : records) {
    r.id                      = s.next_event_id++;
    s.events[r.bucket_key][r.id] = std::move(r);
  }
  return Result::Ok();
}

std::optional<model::EventRecord> MemoryRepository::GetEvent(Transaction& t, int64_t bucket_key, int64_t event_id) {
  const auto& s      = TX(t).View();
  auto        bucket = s.events.find(bucket_key);
  if (bucket == s.events.end()) return std::nullopt;
  auto it = bucket->second.find(event_id);
  if (it == bucket->second.end()) return std::nullopt;
  return it->second;
}

std::optional<model::EventRecord> MemoryRepository::GetLastEvent(Transaction& t, int64_t bucket_key) {
  const auto& s      = TX(t).View();
  auto        bucket = s.events.find(bucket_key);
  if (bucket == s.events.end() || bucket->second.empty()) return std::nullopt;

  const model::EventRecord* last = nullptr;
  for (const auto& [_, e] : bucket->second) {
    if (last == nullptr || NewerFirst(e, *last)) last = &e;
  }
  return *last;
}

std::vector<model::EventRecord> MemoryRepository::ListEvents(Transaction& t, const EventQuery& query) {
  std::vector<model::EventRecord> out;
  const auto&                     s      = TX(t).View();
  auto                            bucket = s.events.find(query.bucket_key);
  if (bucket == s.events.end()) return out;

  for (const auto& [_, e] : bucket->second) {
    if (Matches(e, query)) out.push_back(e);
  }
  std::sort(out.begin(), out.end(), NewerFirst);
  if (query.limit.has_value() && out.size() > *query.limit) {
    out.resize(static_cast<std::size_t>(*query.limit));
  }
  return out;
}

uint64_t MemoryRepository::CountEvents(Transaction& t, const EventQuery& query) {
  const auto& s      = TX(t).View();
  auto        bucket = s.events.find(query.bucket_key);
  if (bucket == s.events.end()) return 0;

  return static_cast<uint64_t>(
      std::count_if(bucket->second.begin(), bucket->second.end(), [&](const auto& entry) { return Matches(entry.second, query); }));
}

Result MemoryRepository::UpdateEvent(Transaction& t, const model::EventRecord& r) {
  auto& s      = TX(t).Mutable();
  auto  bucket = s.events.find(r.bucket_key);
  if (bucket == s.events.end()) return Result::Err(ErrorCode::NotFound, "bucket key " + std::to_string(r.bucket_key));
  auto it = bucket->second.find(r.id);
  if (it == bucket->second.end()) return Result::Err(ErrorCode::NotFound, "event " + std::to_string(r.id));

  it->second.timestamp_us = r.timestamp_us;
  it->second.duration_us  = r.duration_us;
  it->second.data         = r.data;
  return Result::Ok();
}

Result MemoryRepository::DeleteEvent(Transaction& t, int64_t bucket_key, int64_t event_id) {
  auto& s      = TX(t).Mutable();
  auto  bucket = s.events.find(bucket_key);
  if (bucket == s.events.end() || bucket->second.erase(event_id) == 0) {
    return Result::Err(ErrorCode::NotFound, "event " + std::to_string(event_id));
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteBucketEvents(Transaction& t, int64_t bucket_key) {
  auto& s      = TX(t).Mutable();
  auto  bucket = s.events.find(bucket_key);
  if (bucket != s.events.end()) bucket->second.clear();
  return Result::Ok();
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

Result MemoryRepository::InsertAccount(Transaction& t, model::AccountRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [_, existing] : s.accounts) {
    if (existing.email == r.email) return Result::Err(ErrorCode::ConstraintViolation, "account email exists: " + r.email);
  }
  r.id              = s.next_account_id++;
  s.accounts[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteAccountsByEmail(Transaction& t, const std::string& email) {
  auto& s = TX(t).Mutable();
  std::erase_if(s.accounts, [&](const auto& entry) { return entry.second.email == email; });
  return Result::Ok();
}

std::optional<model::AccountRecord> MemoryRepository::GetAccountByEmail(Transaction& t, const std::string& email) {
  for (const auto& [_, r] : TX(t).View().accounts) {
    if (r.email == email) return r;
  }
  return std::nullopt;
}

std::vector<model::AccountRecord> MemoryRepository::ListAccounts(Transaction& t, std::optional<int64_t> used_since_us) {
  std::vector<model::AccountRecord> out;
  for (const auto& [_, r] : TX(t).View().accounts) {
    if (used_since_us.has_value() && (!r.last_used_at_us.has_value() || *r.last_used_at_us < *used_since_us)) continue;
    out.push_back(r);
  }
  return out;
}

// ------------------------------------------------------------------
// Reports
// ------------------------------------------------------------------

Result MemoryRepository::InsertReport(Transaction& t, model::ReportRecord& r) {
  auto& s         = TX(t).Mutable();
  r.id            = s.next_report_id++;
  s.reports[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteReports(Transaction& t, const std::string& email, const ReportWindow& window) {
  auto& s = TX(t).Mutable();
  std::erase_if(s.reports, [&](const auto& entry) { return InWindow(entry.second, email, window); });
  return Result::Ok();
}

std::optional<model::ReportRecord> MemoryRepository::GetReport(Transaction& t, const std::string& email, const ReportWindow& window) {
  for (const auto& [_, r] : TX(t).View().reports) {
    if (InWindow(r, email, window)) return r;
  }
  return std::nullopt;
}

} // namespace tempo::db::memory
