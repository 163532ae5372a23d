#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace archive::core {

/*
  Per-record access grants keyed by (record_id, principal).

  Ownership checks are the registry's job; this class only reads and
  writes entries inside the caller's transaction.
*/
class AccessMatrix {
 public:
  explicit AccessMatrix(std::shared_ptr<archive::db::Repository> repository);

  void Grant(archive::db::Transaction& tx, uint64_t record_id, const std::string& principal);
  void Revoke(archive::db::Transaction& tx, uint64_t record_id, const std::string& principal);

  // false when no entry exists
  bool Check(archive::db::Transaction& tx, uint64_t record_id, const std::string& principal) const;

 private:
  std::shared_ptr<archive::db::Repository> repository_;
};

} // namespace archive::core
