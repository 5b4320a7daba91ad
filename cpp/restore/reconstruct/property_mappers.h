#ifndef RESTORE_RECONSTRUCT_PROPERTY_MAPPERS_H
#define RESTORE_RECONSTRUCT_PROPERTY_MAPPERS_H

#include "restore/core/types.h"
#include "restore/snapshot/snapshot_types.h"
#include "restore/text/font_service.h"

namespace restore {

class SceneHost;
class WarningCollector;

// Property mappers copy snapshot attributes onto a live node. Absent
// attributes leave the host default in place; enumerated values outside their
// legal set are skipped.

// Name, visibility, opacity, blend mode, size, paints, stroke and effects.
void applyCommonProperties(SceneHost& host, NodeId id, const SnapshotNode& snap, WarningCollector& warnings);

// applyCommonProperties without resizing; clipsContent included. Used on a
// combined variant group, whose extent is computed from its variants.
void applyVisualOnlyProperties(SceneHost& host, NodeId id, const SnapshotNode& snap, WarningCollector& warnings);

// clipsContent, auto layout (mode first, then padding, spacing, sizing and
// alignment) and corner radius.
void applyFrameProperties(SceneHost& host, NodeId id, const SnapshotNode& snap);

// Uniform radius first, then each per-corner override.
void applyCornerRadius(SceneHost& host, NodeId id, const SnapshotNode& snap);

// Relative position under a non-auto-layout parent; layout participation
// (align, grow, sizing) under an auto-layout one. No-op without a parent.
void applyChildLayoutProperties(SceneHost& host, NodeId id, const SnapshotNode& snap, const SnapshotNode* parentSnap);

// Assigns `font` (falling back to Inter Regular if the host refuses it), then
// characters and the text style in a fixed order.
void applyTextProperties(SceneHost& host, NodeId id, const SnapshotNode& snap, const FontName& font, WarningCollector& warnings);

// Re-declares BOOLEAN, TEXT and INSTANCE_SWAP component properties.
void applyComponentProperties(SceneHost& host, NodeId id, const SnapshotNode& snap, WarningCollector& warnings);

} // namespace restore

#endif // RESTORE_RECONSTRUCT_PROPERTY_MAPPERS_H
