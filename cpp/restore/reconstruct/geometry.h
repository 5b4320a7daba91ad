#ifndef RESTORE_RECONSTRUCT_GEOMETRY_H
#define RESTORE_RECONSTRUCT_GEOMETRY_H

#include "restore/core/types.h"
#include "restore/snapshot/snapshot_types.h"
#include <string>
#include <string_view>
#include <vector>

// Pure helpers shared by the property mappers and the variant builder.

namespace restore {

// Weight bucket to style name: <=100 Thin ... <=800 ExtraBold, else Black.
const char* mapWeightToStyle(float weight);

// Inverse of mapWeightToStyle: the upper bound of the style's bucket
// (Thin 100 ... Black 900). Unknown style names read as Regular.
float mapStyleToWeight(std::string_view style);

// Child box origin minus parent box origin; (0, 0) when either box is absent.
Vec2 computeRelativePosition(const SnapshotNode& child, const SnapshotNode& parent);

/**
 * Affine gradient transform from the first two handle positions:
 * [[cos, sin, p0.x], [-sin, cos, p0.y]] where (cos, sin) is the unit
 * direction p0 -> p1. A zero-length direction counts as length 1. Fewer than
 * two handles gives the identity. Further handles are ignored.
 */
Transform2D computeGradientTransform(const std::vector<HandlePosition>& handles);

// Size a node takes from its snapshot: box extents, else declared size, each
// clamped to at least 1. False when neither is present.
bool snapshotSize(const SnapshotNode& node, float& width, float& height);

} // namespace restore

#endif // RESTORE_RECONSTRUCT_GEOMETRY_H
