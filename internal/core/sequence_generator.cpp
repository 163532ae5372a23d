#include "sequence_generator.hpp"

#include <limits>
#include <stdexcept>

#include "internal/core/db_error.hpp"

namespace archive::core {

SequenceGenerator::SequenceGenerator(std::shared_ptr<archive::db::Repository> repository) : repository_(std::move(repository)) {
}

uint64_t SequenceGenerator::Next(archive::db::Transaction& tx) {
  const auto current = repository_->GetTotalItems(tx);
  if (current == std::numeric_limits<uint64_t>::max()) {
    throw std::overflow_error("record id sequence exhausted");
  }
  const auto next = current + 1;
  ThrowIfDbError(repository_->SetTotalItems(tx, next), "advance sequence");
  return next;
}

uint64_t SequenceGenerator::Current(archive::db::Transaction& tx) const {
  return repository_->GetTotalItems(tx);
}

} // namespace archive::core
