#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace archive::db::model {

/*
  Mutable subset of a media record.

  Update replaces exactly these fields; everything else on the record is
  fixed at creation (record_id, created_at) or changed only by transfer
  (owner).
*/
struct MediaMetadata {
  std::string              name;
  uint64_t                 byte_count = 0;
  std::string              summary;
  std::vector<std::string> labels; // ordered, 1..10 entries
};

/*
  Persistent media record row.
*/
struct MediaRecord {
  uint64_t    record_id = 0;
  std::string owner;

  // host height captured at creation
  uint64_t created_at = 0;

  MediaMetadata metadata;
};

// Returns a copy of `existing` whose mutable subset is replaced by `fields`.
inline MediaRecord WithMetadata(const MediaRecord& existing, MediaMetadata fields) {
  MediaRecord updated = existing;
  updated.metadata    = std::move(fields);
  return updated;
}

// Returns a copy of `existing` owned by `new_owner`.
inline MediaRecord WithOwner(const MediaRecord& existing, std::string new_owner) {
  MediaRecord updated = existing;
  updated.owner       = std::move(new_owner);
  return updated;
}

inline bool operator==(const MediaMetadata& a, const MediaMetadata& b) {
  return a.name == b.name && a.byte_count == b.byte_count && a.summary == b.summary && a.labels == b.labels;
}

inline bool operator==(const MediaRecord& a, const MediaRecord& b) {
  return a.record_id == b.record_id && a.owner == b.owner && a.created_at == b.created_at && a.metadata == b.metadata;
}

} // namespace archive::db::model
