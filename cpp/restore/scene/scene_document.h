#pragma once

#include "restore/scene/scene_host.h"
#include "restore/snapshot/snapshot_types.h"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace restore {

class FontService;

// In-process scene graph implementing the host API. Serves as the reference
// host for native and WebAssembly builds and as the collaborator in tests.
class SceneDocument : public SceneHost {
public:
    static constexpr NodeId kPageId = 1;

    explicit SceneDocument(const FontService& fonts);

    void clear() noexcept;

    // SceneHost
    NodeId currentPage() const override { return kPageId; }
    NodeId createNode(SceneNodeType type) override;
    SceneNode* getNode(NodeId id) override;
    const SceneNode* getNode(NodeId id) const override;
    bool appendChild(NodeId parent, NodeId child) override;
    void removeNode(NodeId id) override;
    bool resize(NodeId id, float width, float height) override;
    bool setPosition(NodeId id, float x, float y) override;
    bool setFontName(NodeId id, const FontName& font) override;
    bool setCharacters(NodeId id, std::string_view characters) override;
    bool setTextAutoResize(NodeId id, TextAutoResize mode) override;
    bool addComponentProperty(NodeId id, const ComponentProperty& property) override;
    NodeId group(const std::vector<NodeId>& children, NodeId parent) override;
    NodeId combineAsVariants(const std::vector<NodeId>& components, NodeId parent) override;
    NodeId createNodeFromSvg(std::string_view markup) override;
    Vec2 viewportCenter() const override { return viewportCenter_; }
    void selectAndFocus(NodeId id) override;
    std::string formatNodeId(NodeId id) const override;
    void yieldToHost() override { ++yieldCount_; }

    // Viewport / selection state
    void setViewportCenter(Vec2 center) { viewportCenter_ = center; }
    const std::vector<NodeId>& selection() const { return selection_; }
    NodeId focusedNode() const { return focused_; }

    // Counters
    std::size_t nodeCount() const { return nodes_.size() - 1; } // excludes the page
    std::uint32_t yieldCount() const { return yieldCount_; }
    std::uint32_t combineCallCount() const { return combineCalls_; }
    std::uint32_t groupCallCount() const { return groupCalls_; }

    // Parent-independent position: sum of ancestor offsets below the page.
    Vec2 absolutePosition(NodeId id) const;

    // Deterministic FNV-1a digest of a subtree (structure and properties).
    std::uint64_t digest(NodeId root) const;

    // Read-only export of a live subtree back into snapshot form.
    SnapshotNode exportSnapshot(NodeId root) const;

private:
    const FontService& fonts_;
    std::unordered_map<NodeId, SceneNode> nodes_;
    NodeId nextId_ = kPageId + 1;

    Vec2 viewportCenter_{0.0f, 0.0f};
    std::vector<NodeId> selection_;
    NodeId focused_ = kInvalidNodeId;

    std::uint32_t yieldCount_ = 0;
    std::uint32_t combineCalls_ = 0;
    std::uint32_t groupCalls_ = 0;

    NodeId allocate(SceneNodeType type);
    void detach(SceneNode& node);
    bool isAncestor(NodeId ancestor, NodeId node) const;
    NodeId wrapSiblings(SceneNodeType wrapperType, const std::vector<NodeId>& children, NodeId parent);
    void fitTextWidth(SceneNode& node);
    std::uint64_t hashNode(std::uint64_t h, const SceneNode& node) const;
    void exportInto(const SceneNode& node, float absX, float absY, SnapshotNode& out) const;
};

} // namespace restore
