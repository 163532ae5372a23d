#include "validator.hpp"

#include <algorithm>
#include <string>

#include "internal/util/errors.hpp"

namespace archive::validation {

namespace {

bool LengthWithin(std::string_view text, std::size_t max_length) {
  return !text.empty() && text.size() <= max_length;
}

bool IsPrincipalChar(char c) {
  const auto u = static_cast<unsigned char>(c);
  return u > 0x20 && u != 0x7f;
}

} // namespace

bool ValidateName(std::string_view name) {
  return LengthWithin(name, kMaxNameLength);
}

bool ValidateSummary(std::string_view summary) {
  return LengthWithin(summary, kMaxSummaryLength);
}

bool ValidateByteCount(uint64_t byte_count) {
  return byte_count > 0 && byte_count < kMaxByteCount;
}

bool ValidateLabel(std::string_view label) {
  return LengthWithin(label, kMaxLabelLength);
}

bool ValidateLabelSet(const std::vector<std::string>& labels) {
  if (labels.empty() || labels.size() > kMaxLabelCount) {
    return false;
  }
  return std::all_of(labels.begin(), labels.end(), [](const std::string& label) { return ValidateLabel(label); });
}

bool ValidatePrincipal(std::string_view principal) {
  return LengthWithin(principal, kMaxPrincipalLength) && std::all_of(principal.begin(), principal.end(), IsPrincipalChar);
}

void CheckMetadata(const db::model::MediaMetadata& fields) {
  if (!ValidateName(fields.name)) {
    throw util::InvalidName("name must be 1.." + std::to_string(kMaxNameLength) + " characters");
  }
  if (!ValidateByteCount(fields.byte_count)) {
    throw util::InvalidSize("byte_count must be in (0, " + std::to_string(kMaxByteCount) + ")");
  }
  if (!ValidateSummary(fields.summary)) {
    throw util::InvalidName("summary must be 1.." + std::to_string(kMaxSummaryLength) + " characters");
  }
  if (!ValidateLabelSet(fields.labels)) {
    throw util::MalformedLabel("labels must hold 1.." + std::to_string(kMaxLabelCount) + " entries of 1.." +
                               std::to_string(kMaxLabelLength) + " characters");
  }
}

} // namespace archive::validation
