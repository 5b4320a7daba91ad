#include "restore/reconstruct/reconstruct.h"
#include "restore/reconstruct/font_resolver.h"
#include "restore/reconstruct/warnings.h"
#include "restore/scene/scene_host.h"
#include "restore/snapshot/snapshot_json.h"
#include "restore/core/logging.h"
#include "restore/core/util.h"

#include <cmath>
#include <stdexcept>

namespace restore {

namespace {
    void report(const ReconstructOptions& options, const std::string& message, float percent) {
        if (options.onProgress) options.onProgress(message, percent);
    }

    std::string rootLabel(const ReconstructOptions& options, const SnapshotNode& doc) {
        if (options.rootLabel && !options.rootLabel->empty()) return *options.rootLabel;
        if (!doc.name.empty()) return doc.name;
        return "Component";
    }
} // namespace

ReconstructionResult reconstructFromSnapshot(
    const SnapshotDocument& snapshot,
    SceneHost& host,
    FontService& fonts,
    const ReconstructOptions& options
) {
    if (!snapshot.document) {
        throw std::runtime_error("Snapshot has no document property");
    }
    const SnapshotNode& doc = *snapshot.document;
    const double t0 = emscripten_get_now();

    report(options, "Preparing reconstruction...", kProgressStart);

    WarningCollector warnings;
    FontResolver resolver(fonts, warnings);
    BuildContext ctx{host, resolver, warnings, options.onProgress};
    ctx.total = countSnapshotNodes(doc);

    SnapshotWalker walker(ctx);
    const NodeId root = walker.build(doc, host.currentPage(), nullptr);
    if (root == kInvalidNodeId) {
        throw std::runtime_error("Failed to create root node from snapshot");
    }

    const Vec2 center = host.viewportCenter();
    if (SceneNode* node = host.getNode(root)) {
        node->name = rootLabel(options, doc) + " (restored)";
        const float x = std::round(center.x - node->width / 2.0f);
        const float y = std::round(center.y - node->height / 2.0f);
        host.setPosition(root, x, y);
    }
    host.selectAndFocus(root);

    RESTORE_LOG_DEBUG("reconstructed %u nodes in %.2f ms, %zu warnings",
        ctx.processed, emscripten_get_now() - t0, warnings.size());

    report(options, "Reconstruction complete!", kProgressDone);

    ReconstructionResult result;
    result.rootNodeId = host.formatNodeId(root);
    result.warnings = warnings.take();
    return result;
}

ReconstructionResult reconstructFromJson(
    std::string_view json,
    SceneHost& host,
    FontService& fonts,
    const ReconstructOptions& options
) {
    SnapshotDocument snapshot;
    switch (parseSnapshotJson(json, snapshot)) {
        case SnapshotError::Ok:
            break;
        case SnapshotError::InvalidJson:
            throw std::runtime_error("Snapshot is not valid JSON");
        case SnapshotError::MissingDocument:
            throw std::runtime_error("Snapshot has no document property");
        case SnapshotError::InvalidNode:
            throw std::runtime_error("Snapshot document is not an object");
    }
    return reconstructFromSnapshot(snapshot, host, fonts, options);
}

} // namespace restore
