#ifndef RESTORE_SNAPSHOT_JSON_H
#define RESTORE_SNAPSHOT_JSON_H

#include "restore/snapshot/snapshot_types.h"
#include <cstdint>
#include <string>
#include <string_view>

namespace restore {

enum class SnapshotError : std::uint8_t {
    Ok = 0,
    InvalidJson = 1,      // text is not well-formed JSON or not an object
    MissingDocument = 2,  // no "document" member
    InvalidNode = 3,      // "document" is present but not an object
};

const char* toString(SnapshotError error);

/**
 * Decodes REST-shaped snapshot JSON: { "name"?, "document": { ... } }.
 * Unknown members are ignored; members of the wrong JSON type are treated as
 * absent. On MissingDocument `out.name` is still filled in.
 */
SnapshotError parseSnapshotJson(std::string_view text, SnapshotDocument& out);

/**
 * Encodes a snapshot back to JSON. Absent optional attributes are omitted.
 * @param indent Pretty-print indent, or -1 for compact output
 */
std::string buildSnapshotJson(const SnapshotDocument& doc, int indent = -1);

} // namespace restore

#endif // RESTORE_SNAPSHOT_JSON_H
