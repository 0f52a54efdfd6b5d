#pragma once

#include <stdexcept>
#include <string>

namespace tempo::util {

/*
  Central error types.

  Everything the storage engine throws at its callers is one of these
  (or a plain std::runtime_error for unexpected backend failures).
  Messages always name the bucket / event / record key involved.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class BucketNotFound : public NotFound {
 public:
  explicit BucketNotFound(const std::string& bucket_id) : NotFound("bucket not found: " + bucket_id), bucket_id_(bucket_id) {
  }

  const std::string& bucket_id() const {
    return bucket_id_;
  }

 private:
  std::string bucket_id_;
};

class EventNotFound : public NotFound {
 public:
  explicit EventNotFound(const std::string& msg) : NotFound(msg) {
  }
};

class DuplicateBucket : public AlreadyExists {
 public:
  explicit DuplicateBucket(const std::string& bucket_id) : AlreadyExists("bucket already exists: " + bucket_id), bucket_id_(bucket_id) {
  }

  const std::string& bucket_id() const {
    return bucket_id_;
  }

 private:
  std::string bucket_id_;
};

// Connection / timeout / lock-wait failures at the backend transport.
// Never retried internally.
class BackendUnavailable : public std::runtime_error {
 public:
  explicit BackendUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ValidationError : public std::invalid_argument {
 public:
  explicit ValidationError(const std::string& msg) : std::invalid_argument(msg) {
  }
};

} // namespace tempo::util
