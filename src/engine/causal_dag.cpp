#include "engine/causal_dag.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "engine/causal_direction.hpp"

namespace vita {

namespace {

bool hasPrefix(const std::string &value, const std::string &prefix)
{
    return value.rfind(prefix, 0) == 0;
}

} // namespace

CausalDAG::CausalDAG(const std::vector<CausalEdge> &edges)
{
    std::size_t dropped = 0;
    for (const auto &edge : edges) {
        const auto source = edge.sourceType ? edge.sourceType : nodeTypeFromId(edge.sourceNodeId);
        const auto target = edge.targetType ? edge.targetType : nodeTypeFromId(edge.targetNodeId);
        if (!source || !target || !CausalDirection::canCause(*source, *target)) {
            ++dropped;
            continue;
        }
        m_adjacency[*source].push_back(Edge{*target, edge.edgeType, edge.causalStrength});
    }

    VLOG_DEBUG(QStringLiteral("CausalDAG"),
               QStringLiteral("CausalDAG"),
               QStringLiteral("dag_built"),
               QStringLiteral("path_query"),
               QStringLiteral("direction_filter"),
               vita::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"edges", edges.size()}, {"dropped", dropped}}));
}

std::vector<CausalDAG::Path> CausalDAG::tracePaths(NodeType source) const
{
    std::vector<Path> paths;
    Path currentPath{source};
    dfs(source, NodeType::Symptom, currentPath, paths);
    return paths;
}

double CausalDAG::pathStrength(const Path &path) const
{
    if (path.size() < 2) {
        return 0.0;
    }

    double strength = 1.0;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        double weight = 0.0;
        const auto it = m_adjacency.find(path[i]);
        if (it != m_adjacency.end()) {
            const NodeType next = path[i + 1];
            const auto edge = std::find_if(it->second.begin(), it->second.end(),
                                           [next](const Edge &e) { return e.target == next; });
            if (edge != it->second.end()) {
                weight = edge->weight;
            }
        }
        strength *= weight;
    }
    return strength;
}

std::vector<CausalDAG::Edge> CausalDAG::neighbors(NodeType nodeType) const
{
    const auto it = m_adjacency.find(nodeType);
    if (it == m_adjacency.end()) {
        return {};
    }
    return it->second;
}

std::size_t CausalDAG::edgeCount() const
{
    std::size_t count = 0;
    for (const auto &entry : m_adjacency) {
        count += entry.second.size();
    }
    return count;
}

std::optional<NodeType> CausalDAG::nodeTypeFromId(const std::string &nodeId)
{
    if (hasPrefix(nodeId, "physio_")) {
        return NodeType::Physiological;
    }
    if (hasPrefix(nodeId, "glucose_")) {
        return NodeType::Glucose;
    }
    if (hasPrefix(nodeId, "meal_")) {
        return NodeType::Meal;
    }
    if (hasPrefix(nodeId, "behavioral_")) {
        return NodeType::Behavioral;
    }
    if (hasPrefix(nodeId, "environment_")) {
        return NodeType::Environmental;
    }
    if (hasPrefix(nodeId, "symptom_")) {
        return NodeType::Symptom;
    }
    return std::nullopt;
}

void CausalDAG::dfs(NodeType current, NodeType target, Path &currentPath,
                    std::vector<Path> &allPaths) const
{
    if (current == target && currentPath.size() > 1) {
        allPaths.push_back(currentPath);
        return;
    }

    const auto it = m_adjacency.find(current);
    if (it == m_adjacency.end()) {
        return;
    }

    // Parallel edges between the same categories yield one path.
    std::vector<NodeType> expanded;
    for (const auto &edge : it->second) {
        if (std::find(currentPath.begin(), currentPath.end(), edge.target) != currentPath.end()
            || std::find(expanded.begin(), expanded.end(), edge.target) != expanded.end()) {
            continue;
        }
        expanded.push_back(edge.target);
        currentPath.push_back(edge.target);
        dfs(edge.target, target, currentPath, allPaths);
        currentPath.pop_back();
    }
}

} // namespace vita
