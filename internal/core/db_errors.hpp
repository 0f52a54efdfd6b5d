#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace tempo::core {

/*
  Backend failure -> public exception.

    NotFound                         -> util::NotFound
    AlreadyExists / ConstraintViolation -> util::AlreadyExists
    Busy / IOError / Unavailable     -> util::BackendUnavailable
    anything else                    -> std::runtime_error

  `context` names the operation and the bucket/event involved.
*/

void ThrowIfDbError(const db::Result& result, const std::string& context);

[[noreturn]] void RethrowDbError(const db::DbError& error, const std::string& context);

// Runs fn, translating DbError (read paths, transaction begin/commit).
template <typename Fn>
auto WithBackend(const std::string& context, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const db::DbError& e) {
    RethrowDbError(e, context);
  }
}

} // namespace tempo::core
