#pragma once

#include <glm/vec2.hpp>

#include "teacup/layout/LayoutTree.hpp"

namespace teacup::layout
{
// Fit pass (post-order).
// Resolves every node under id to its content minimum: children first, then
// sum along the main axis and max along the cross axis, padding and gaps included.
// Fixed axes take their fixed value. Every result is clamped to [min, max].
void FitSizing(LayoutTree& tree, NodeId id);

// Grow pass (pre-order).
// Distributes leftover main-axis space among Grow children of id, stretches
// Grow children across the cross axis, then recurses into child containers.
// Expects sizes from the fit pass.
void GrowSizing(LayoutTree& tree, NodeId id);

// Water-filling over the main axis of a single container, no recursion.
// The currently smallest Grow children grow first, in steps that never pass the
// next larger sibling, until the space is used or every candidate hit its max.
// Returns the main-axis space left unconsumed (negative when overflowing).
int DistributeMainAxis(LayoutTree& tree, NodeId id);

// Position pass (pre-order). Children are stacked along the main axis starting
// at position + padding and share the leading cross-axis edge.
void AssignPositions(LayoutTree& tree, NodeId id);

// Sets the root to the viewport size on every axis where its sizing is Grow.
void ForceRootToViewport(LayoutTree& tree, glm::ivec2 viewport);

// Full frame sequence on the tree root: fit, root forcing, grow, positions.
// The root is placed at the origin.
void ComputeLayout(LayoutTree& tree, glm::ivec2 viewport);
} // namespace teacup::layout
