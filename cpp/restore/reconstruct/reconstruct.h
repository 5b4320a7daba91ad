#ifndef RESTORE_RECONSTRUCT_RECONSTRUCT_H
#define RESTORE_RECONSTRUCT_RECONSTRUCT_H

#include "restore/reconstruct/snapshot_walker.h"
#include "restore/snapshot/snapshot_types.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace restore {

class SceneHost;
class FontService;

struct ReconstructOptions {
    // Root is named "<rootLabel> (restored)"; the document node's name is
    // used when unset or empty.
    std::optional<std::string> rootLabel;
    ProgressCallback onProgress;
};

struct ReconstructionResult {
    std::string rootNodeId;
    std::vector<std::string> warnings;
};

/**
 * Rebuilds the snapshot's document tree on the host's current page, names
 * and centers the root in the viewport and selects it.
 *
 * Node-level problems become warnings. Throws std::runtime_error only when
 * the snapshot has no document or the root produces no node.
 */
ReconstructionResult reconstructFromSnapshot(
    const SnapshotDocument& snapshot,
    SceneHost& host,
    FontService& fonts,
    const ReconstructOptions& options = {});

// Decodes REST-shaped JSON first; decoding failures throw std::runtime_error.
ReconstructionResult reconstructFromJson(
    std::string_view json,
    SceneHost& host,
    FontService& fonts,
    const ReconstructOptions& options = {});

} // namespace restore

#endif // RESTORE_RECONSTRUCT_RECONSTRUCT_H
