#ifndef RESTORE_RECONSTRUCT_PAINT_CONVERTER_H
#define RESTORE_RECONSTRUCT_PAINT_CONVERTER_H

#include "restore/scene/scene_types.h"
#include "restore/snapshot/snapshot_types.h"
#include <optional>
#include <vector>

namespace restore {

// =============================================================================
// Paints
// =============================================================================

// Invisible paints, IMAGE paints, gradients without stops and unknown kinds
// are dropped. Order of the survivors is preserved.
std::vector<Paint> convertPaints(const std::vector<SnapshotPaint>& paints);
std::optional<Paint> convertPaint(const SnapshotPaint& paint);

// True when a visible IMAGE paint is in the list (its pixels cannot be restored).
bool containsImagePaint(const std::vector<SnapshotPaint>& paints);

// =============================================================================
// Effects
// =============================================================================

std::vector<Effect> convertEffects(const std::vector<SnapshotEffect>& effects);
std::optional<Effect> convertEffect(const SnapshotEffect& effect);

} // namespace restore

#endif // RESTORE_RECONSTRUCT_PAINT_CONVERTER_H
