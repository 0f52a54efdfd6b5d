#include "db_errors.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tempo::core {

namespace {

[[noreturn]] void Throw(db::ErrorCode code, const std::string& message) {
  TEMPO_LOG_WARN("storage operation failed", {observability::StringField("code", db::ToString(code)), observability::StringField("detail", message)});

  switch (code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::ConstraintViolation:
      throw util::AlreadyExists(message);
    case db::ErrorCode::Busy:
    case db::ErrorCode::IOError:
    case db::ErrorCode::Unavailable:
      throw util::BackendUnavailable(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  Throw(result.code, message);
}

void RethrowDbError(const db::DbError& error, const std::string& context) {
  Throw(error.code(), context + ": " + db::ToString(error.code()) + ": " + error.what());
}

} // namespace tempo::core
