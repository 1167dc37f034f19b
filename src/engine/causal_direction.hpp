#pragma once

#include <array>
#include <utility>

#include "common/enums.hpp"

namespace vita {

// Domain knowledge about which node categories may cause which. The tables
// are fixed and never learned from data.
class CausalDirection
{
public:
    using Constraint = std::pair<NodeType, NodeType>;

    // Topological order: earlier categories may cause later ones.
    static const std::array<NodeType, 6> &causalOrder();
    // (cause, cannotCause) pairs.
    static const std::array<Constraint, 3> &hardConstraints();

    // Only the hard constraints.
    static bool isValid(NodeType source, NodeType target);
    // Order index(source) <= index(target) and not a forbidden pair.
    static bool canCause(NodeType source, NodeType target);
};

} // namespace vita
