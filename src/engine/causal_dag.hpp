#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace vita {

// In-memory DAG over node categories, built from persisted edges. Edges whose
// categories are unknown or fail CausalDirection::canCause are dropped.
class CausalDAG
{
public:
    struct Edge {
        NodeType target;
        EdgeType edgeType;
        double weight;
    };

    using Path = std::vector<NodeType>;

    explicit CausalDAG(const std::vector<CausalEdge> &edges);

    // Every simple path from `source` to the symptom category.
    std::vector<Path> tracePaths(NodeType source) const;

    // Product of the first matching edge weight per hop. Zero for paths with
    // fewer than two nodes or any missing hop.
    double pathStrength(const Path &path) const;

    std::vector<Edge> neighbors(NodeType nodeType) const;

    std::size_t edgeCount() const;

    // Category from the node id prefix (meal_, glucose_, ...).
    static std::optional<NodeType> nodeTypeFromId(const std::string &nodeId);

private:
    void dfs(NodeType current, NodeType target, Path &currentPath,
             std::vector<Path> &allPaths) const;

    std::map<NodeType, std::vector<Edge>> m_adjacency;
};

} // namespace vita
