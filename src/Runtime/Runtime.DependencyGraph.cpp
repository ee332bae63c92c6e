module;

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <expected>
#include <span>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>
#include <entt/entity/entity.hpp>

module Runtime.DependencyGraph;

import Core;
import ECS;

namespace Runtime
{
    namespace Symbolic = ECS::Components::Symbolic;

    // -------------------------------------------------------------------------
    // Construction
    // -------------------------------------------------------------------------

    DependencyGraph::DependencyGraph()
    {
        m_Nodes.reserve(64);
    }

    void DependencyGraph::Clear()
    {
        m_Nodes.clear();
    }

    // -------------------------------------------------------------------------
    // Node Lookup
    // -------------------------------------------------------------------------

    const DependencyGraph::Node* DependencyGraph::FindNode(entt::entity entity) const
    {
        if (entity == entt::null) return nullptr;

        const auto slot = static_cast<std::size_t>(entt::to_entity(entity));
        if (slot >= m_Nodes.size()) return nullptr;

        const Node& node = m_Nodes[slot];
        return node.Owner == entity ? &node : nullptr;
    }

    DependencyGraph::Node* DependencyGraph::FindNode(entt::entity entity)
    {
        return const_cast<Node*>(static_cast<const DependencyGraph&>(*this).FindNode(entity));
    }

    DependencyGraph::Node& DependencyGraph::GetOrCreateNode(entt::entity entity)
    {
        const auto slot = static_cast<std::size_t>(entt::to_entity(entity));
        if (slot >= m_Nodes.size())
        {
            m_Nodes.resize(slot + 1);
        }

        Node& node = m_Nodes[slot];
        if (node.Owner != entity)
        {
            // Slot was free or belonged to a recycled identifier.
            node.Owner = entity;
            node.Dependents.clear();
        }
        return node;
    }

    // -------------------------------------------------------------------------
    // Edge Management (deduplicated)
    // -------------------------------------------------------------------------

    void DependencyGraph::Add(entt::entity dependency, entt::entity dependent)
    {
        if (dependency == entt::null || dependent == entt::null) return;

        if (dependency == dependent) return; // Self edges are ignored.

        Node& node = GetOrCreateNode(dependency);

        // Deduplicate (linear scan is fine for typical dependent counts).
        for (entt::entity existing : node.Dependents)
        {
            if (existing == dependent) return;
        }

        node.Dependents.push_back(dependent);
    }

    void DependencyGraph::Remove(entt::entity entity)
    {
        if (Node* node = FindNode(entity))
        {
            node->Owner = entt::null;
            node->Dependents.clear();
        }
    }

    void DependencyGraph::RemoveDependent(entt::entity dependency, entt::entity dependent)
    {
        Node* node = FindNode(dependency);
        if (!node) return;

        auto& deps = node->Dependents;
        deps.erase(std::remove(deps.begin(), deps.end(), dependent), deps.end());
    }

    // -------------------------------------------------------------------------
    // Definition Mirroring
    // -------------------------------------------------------------------------

    void DependencyGraph::Link(entt::entity entity, const Symbolic::Definition& definition)
    {
        for (entt::entity dependency : Symbolic::References(definition))
        {
            Add(dependency, entity);
        }
    }

    void DependencyGraph::Unlink(entt::entity entity, const Symbolic::Definition& definition)
    {
        for (entt::entity dependency : Symbolic::References(definition))
        {
            RemoveDependent(dependency, entity);
        }
    }

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    std::span<const entt::entity> DependencyGraph::GetDependents(entt::entity entity) const
    {
        if (const Node* node = FindNode(entity))
        {
            return node->Dependents;
        }
        return {};
    }

    bool DependencyGraph::HasEdge(entt::entity dependency, entt::entity dependent) const
    {
        const auto deps = GetDependents(dependency);
        return std::find(deps.begin(), deps.end(), dependent) != deps.end();
    }

    std::size_t DependencyGraph::EdgeCount() const
    {
        std::size_t count = 0;
        for (const Node& node : m_Nodes)
        {
            if (node.Owner != entt::null) count += node.Dependents.size();
        }
        return count;
    }

    // -------------------------------------------------------------------------
    // RecomputeOrder: reachability + Kahn's algorithm
    // -------------------------------------------------------------------------

    Core::Expected<std::vector<entt::entity>> DependencyGraph::RecomputeOrder(std::span<const entt::entity> seed) const
    {
        // 1. Collect the reachable set in discovery order, each entity once.
        std::vector<entt::entity> reachable;
        std::unordered_map<entt::entity, uint32_t> localIndex;
        reachable.reserve(seed.size());

        auto visit = [&](entt::entity e)
        {
            if (e == entt::null) return;
            if (localIndex.try_emplace(e, static_cast<uint32_t>(reachable.size())).second)
            {
                reachable.push_back(e);
            }
        };

        for (entt::entity e : seed) visit(e);
        for (std::size_t i = 0; i < reachable.size(); ++i)
        {
            for (entt::entity dep : GetDependents(reachable[i])) visit(dep);
        }

        const auto count = static_cast<uint32_t>(reachable.size());
        if (count == 0) return std::vector<entt::entity>{};

        // 2. Indegrees restricted to the induced subgraph.
        std::vector<uint32_t> indeg(count, 0);
        for (entt::entity e : reachable)
        {
            for (entt::entity dep : GetDependents(e))
            {
                indeg[localIndex.at(dep)]++;
            }
        }

        // 3. Layered Kahn's, seeded with local roots.
        std::vector<entt::entity> order;
        order.reserve(count);

        std::vector<uint32_t> layer;
        layer.reserve(count);
        for (uint32_t i = 0; i < count; ++i)
        {
            if (indeg[i] == 0) layer.push_back(i);
        }

        while (!layer.empty())
        {
            std::vector<uint32_t> next;
            next.reserve(count);

            for (uint32_t nodeIdx : layer)
            {
                order.push_back(reachable[nodeIdx]);

                for (entt::entity dep : GetDependents(reachable[nodeIdx]))
                {
                    const uint32_t depIdx = localIndex.at(dep);
                    if (indeg[depIdx] == 0) continue; // Already scheduled
                    indeg[depIdx]--;
                    if (indeg[depIdx] == 0)
                    {
                        next.push_back(depIdx);
                    }
                }
            }

            layer = std::move(next);
        }

        if (order.size() != count)
        {
            Core::Log::Error("DependencyGraph: dependency cycle detected (ordered {} / {})", order.size(), count);
            assert(false && "DependencyGraph: dependency cycle detected");
            return Core::Err<std::vector<entt::entity>>(Core::ErrorCode::InvalidState);
        }

        return order;
    }
}
