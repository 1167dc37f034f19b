#include "engine/causal_direction.hpp"

#include <algorithm>
#include <iterator>

namespace vita {

namespace {

const std::array<NodeType, 6> kCausalOrder = {
    NodeType::Meal,
    NodeType::Environmental,
    NodeType::Behavioral,
    NodeType::Glucose,
    NodeType::Physiological,
    NodeType::Symptom,
};

const std::array<CausalDirection::Constraint, 3> kHardConstraints = {{
    // Screen behavior does not move glucose directly.
    {NodeType::Behavioral, NodeType::Glucose},
    // Reverse causation trap.
    {NodeType::Symptom, NodeType::Meal},
    {NodeType::Environmental, NodeType::Behavioral},
}};

std::ptrdiff_t orderIndex(NodeType type)
{
    return std::distance(kCausalOrder.begin(),
                         std::find(kCausalOrder.begin(), kCausalOrder.end(), type));
}

} // namespace

const std::array<NodeType, 6> &CausalDirection::causalOrder()
{
    return kCausalOrder;
}

const std::array<CausalDirection::Constraint, 3> &CausalDirection::hardConstraints()
{
    return kHardConstraints;
}

bool CausalDirection::isValid(NodeType source, NodeType target)
{
    for (const auto &constraint : kHardConstraints) {
        if (constraint.first == source && constraint.second == target) {
            return false;
        }
    }
    return true;
}

bool CausalDirection::canCause(NodeType source, NodeType target)
{
    return orderIndex(source) <= orderIndex(target) && isValid(source, target);
}

} // namespace vita
