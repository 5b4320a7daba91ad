#ifndef RESTORE_SCENE_HOST_H
#define RESTORE_SCENE_HOST_H

#include "restore/core/types.h"
#include "restore/scene/scene_types.h"
#include <string>
#include <string_view>
#include <vector>

namespace restore {

/**
 * SceneHost: node-creation, vector-import and viewport API of the editing
 * environment the engine rebuilds into.
 *
 * Creation calls return kInvalidNodeId when the host refuses; property setters
 * that the host may reject return false. Plain properties are written through
 * the SceneNode record returned by getNode().
 */
class SceneHost {
public:
    virtual ~SceneHost() = default;

    virtual NodeId currentPage() const = 0;

    // Frame, Rectangle, Ellipse, Text and Component are creatable directly.
    // The new node is detached until appended.
    virtual NodeId createNode(SceneNodeType type) = 0;

    virtual SceneNode* getNode(NodeId id) = 0;
    virtual const SceneNode* getNode(NodeId id) const = 0;

    // Moves child under parent (detaching it from any previous parent).
    virtual bool appendChild(NodeId parent, NodeId child) = 0;
    virtual void removeNode(NodeId id) = 0;

    virtual bool resize(NodeId id, float width, float height) = 0;
    virtual bool setPosition(NodeId id, float x, float y) = 0;

    // Text setters fail unless the font involved has been loaded.
    virtual bool setFontName(NodeId id, const FontName& font) = 0;
    virtual bool setCharacters(NodeId id, std::string_view characters) = 0;
    virtual bool setTextAutoResize(NodeId id, TextAutoResize mode) = 0;

    virtual bool addComponentProperty(NodeId id, const ComponentProperty& property) = 0;

    // Wraps already placed siblings of parent. Fails on an empty list.
    virtual NodeId group(const std::vector<NodeId>& children, NodeId parent) = 0;
    // Requires two or more components.
    virtual NodeId combineAsVariants(const std::vector<NodeId>& components, NodeId parent) = 0;

    // Parses vector markup into a wrapper frame appended to the current page.
    virtual NodeId createNodeFromSvg(std::string_view markup) = 0;

    virtual Vec2 viewportCenter() const = 0;
    virtual void selectAndFocus(NodeId id) = 0;

    virtual std::string formatNodeId(NodeId id) const = 0;

    // Cooperative yield point for long reconstructions.
    virtual void yieldToHost() {}
};

} // namespace restore

#endif // RESTORE_SCENE_HOST_H
