#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/api/repository.hpp"

namespace archive::core {

/*
  Monotonic record id source backed by the total_items counter.

  Next() only stages the new value in the caller's transaction; the id is
  consumed when, and only when, that transaction commits.
*/
class SequenceGenerator {
 public:
  explicit SequenceGenerator(std::shared_ptr<archive::db::Repository> repository);

  uint64_t Next(archive::db::Transaction& tx);
  uint64_t Current(archive::db::Transaction& tx) const;

 private:
  std::shared_ptr<archive::db::Repository> repository_;
};

} // namespace archive::core
