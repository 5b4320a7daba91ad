#ifndef RESTORE_RECONSTRUCT_SNAPSHOT_WALKER_H
#define RESTORE_RECONSTRUCT_SNAPSHOT_WALKER_H

#include "restore/core/types.h"
#include "restore/scene/scene_types.h"
#include "restore/snapshot/snapshot_types.h"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace restore {

class SceneHost;
class FontResolver;
class WarningCollector;

using ProgressCallback = std::function<void(const std::string& message, float percent)>;

// State of one reconstruction call. Nothing here outlives the call.
struct BuildContext {
    SceneHost& host;
    FontResolver& fonts;
    WarningCollector& warnings;
    ProgressCallback onProgress;
    std::uint32_t processed = 0; // typed nodes visited so far
    std::uint32_t total = 0;     // typed nodes in the snapshot
};

// Number of nodes with a type in the subtree, the root included.
std::uint32_t countSnapshotNodes(const SnapshotNode& node);

/**
 * SnapshotWalker: depth-first builder dispatching on node kind.
 *
 * build() never throws for a single node: a host exception raised while
 * building a node becomes one warning, and the partially built subtree is
 * removed. Every kYieldInterval typed nodes the host's yield hook runs.
 */
class SnapshotWalker {
public:
    explicit SnapshotWalker(BuildContext& ctx);

    /**
     * Builds `snap` and its subtree under `parent`.
     * @param parentSnap Snapshot of the node's original parent, used for
     *        positioning; nullptr for the root and for variants.
     * @return Live node id, or kInvalidNodeId when the node was skipped.
     */
    NodeId build(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap);

    // Per-kind builders, also used by the variant builder.
    NodeId buildFrame(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap);
    NodeId buildComponent(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap);

    BuildContext& context() { return ctx_; }

    // Marks a node built outside the current node's own builder as part of
    // its subtree, so a later failure removes it too.
    void trackCreated(NodeId id) { created_.push_back(id); }

private:
    BuildContext& ctx_;
    std::vector<NodeId> created_; // nodes of builds in progress, outermost first

    NodeId dispatch(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap);
    NodeId buildRectangle(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap);
    NodeId buildEllipse(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap);
    NodeId buildText(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap);
    NodeId buildGroup(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap);
    NodeId buildVectorLike(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap);
    NodeId buildFromSvg(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap);
    NodeId buildVectorFallback(const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap);

    NodeId createAttached(SceneNodeType type, NodeId parent);
    void buildChildren(const SnapshotNode& snap, NodeId container);
    void countProcessed();
};

} // namespace restore

#endif // RESTORE_RECONSTRUCT_SNAPSHOT_WALKER_H
