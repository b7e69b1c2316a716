#pragma once

#include <aasx_kg/extract/entity.hpp>
#include <aasx_kg/extract/raw_record.hpp>

#include <string>
#include <vector>

namespace aasx_kg {

// Where a raw record came from: the container and the entry inside it.
struct RecordOrigin {
    std::string source_file;
    std::string entry_name;
};

/// Turn one raw record into an Entity. Never fails: absent fields become "",
/// the identity is trimmed, and an empty identity gets a synthetic key of the
/// form "synthetic:<source>#<entry>#<type>#<shortName>#<ordinal>".
[[nodiscard]] Entity NormalizeRecord(const RawRecord& record, const RecordOrigin& origin);

[[nodiscard]] std::vector<Entity> NormalizeRecords(const std::vector<RawRecord>& records,
                                                   const RecordOrigin& origin);

/// The synthetic key used when a record has no identity.
[[nodiscard]] std::string SyntheticKey(const RecordOrigin& origin,
                                       const std::string& short_name,
                                       ElementType type,
                                       size_t ordinal);

} // namespace aasx_kg
