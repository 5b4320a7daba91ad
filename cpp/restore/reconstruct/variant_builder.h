#ifndef RESTORE_RECONSTRUCT_VARIANT_BUILDER_H
#define RESTORE_RECONSTRUCT_VARIANT_BUILDER_H

#include "restore/core/types.h"
#include "restore/snapshot/snapshot_types.h"

namespace restore {

class SnapshotWalker;

/**
 * Builds a component set.
 *
 * Variants are built as siblings under `parent` and then combined by one host
 * call. With zero variants the set becomes a frame; with one, that component
 * stands in for the set. Combined variants keep their original arrangement,
 * inset by kVariantSetInset, when every variant carries a bounding box;
 * otherwise the set falls back to horizontal auto layout.
 */
NodeId buildVariantSet(SnapshotWalker& walker, const SnapshotNode& snap, NodeId parent, const SnapshotNode* parentSnap);

} // namespace restore

#endif // RESTORE_RECONSTRUCT_VARIANT_BUILDER_H
