#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>
#include <string>

#include "internal/db/model/media_record.hpp"

namespace archive::validation {

/*
  Field bounds of a media record.

  All predicates are total: they never throw and only report whether the
  value is inside its bound. CheckMetadata() turns them into the ordered
  assertion sequence used by create and update.
*/

inline constexpr std::size_t kMaxNameLength      = 64;
inline constexpr std::size_t kMaxSummaryLength   = 128;
inline constexpr std::size_t kMaxLabelLength     = 32;
inline constexpr std::size_t kMaxLabelCount      = 10;
inline constexpr uint64_t    kMaxByteCount       = 1'000'000'000; // exclusive
inline constexpr std::size_t kMaxPrincipalLength = 128;

bool ValidateName(std::string_view name);
bool ValidateSummary(std::string_view summary);
bool ValidateByteCount(uint64_t byte_count);
bool ValidateLabel(std::string_view label);
bool ValidateLabelSet(const std::vector<std::string>& labels);

// Non-empty, bounded, no whitespace or control characters.
bool ValidatePrincipal(std::string_view principal);

/*
  Checks, in order: name, byte_count, summary, labels.
  Throws the first violated kind (InvalidName, InvalidSize, InvalidName,
  MalformedLabel).
*/
void CheckMetadata(const db::model::MediaMetadata& fields);

} // namespace archive::validation
