module;

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include <glm/glm.hpp>
#include <entt/entity/entity.hpp>

export module Runtime.DependencyGraph;

import Core;
import ECS;

// -------------------------------------------------------------------------
// Runtime::DependencyGraph - Entity -> dependents adjacency
// -------------------------------------------------------------------------
// Records, for every entity, the entities whose symbolic definition names it.
// Edges mirror definitions exactly: Link() adds one edge per reference when a
// definition is inserted, Unlink() removes them again on removal.
//
// Storage is a single arena indexed by the entity slot (entt::to_entity), so
// no entity ever holds a reference to another one. The owner is stored per
// slot to reject stale handles after the registry recycles an identifier.
//
// Usage pattern:
//   graph.Link(mid, Symbolic::SymbolicPoint{Symbolic::MidPoint{a, b}});
//   auto order = graph.RecomputeOrder(changed);   // a/b before mid
// -------------------------------------------------------------------------

export namespace Runtime
{
    class DependencyGraph
    {
    public:
        DependencyGraph();

        // ----- Edge Management -----
        // Inserts 'dependent' into the dependent set of 'dependency'. Idempotent.
        void Add(entt::entity dependency, entt::entity dependent);

        // Drops the entity's own dependent set. Edges pointing at the entity from
        // other entries are removed with RemoveDependent (or Unlink).
        void Remove(entt::entity entity);

        void RemoveDependent(entt::entity dependency, entt::entity dependent);

        // ----- Definition Mirroring -----
        void Link(entt::entity entity, const ECS::Components::Symbolic::Definition& definition);
        void Unlink(entt::entity entity, const ECS::Components::Symbolic::Definition& definition);

        // ----- Queries -----
        [[nodiscard]] std::span<const entt::entity> GetDependents(entt::entity entity) const;
        [[nodiscard]] bool HasEdge(entt::entity dependency, entt::entity dependent) const;
        [[nodiscard]] std::size_t EdgeCount() const;

        // Every entity reachable from 'seed' through dependent edges (seeds
        // included), each exactly once, dependencies before dependents.
        // Kahn's algorithm over the induced subgraph; Err(InvalidState) if a
        // cycle is found.
        [[nodiscard]] Core::Expected<std::vector<entt::entity>> RecomputeOrder(std::span<const entt::entity> seed) const;

        void Clear();

    private:
        struct Node
        {
            entt::entity Owner = entt::null;
            std::vector<entt::entity> Dependents; // Outgoing edges
        };

        // Node pool indexed by entity slot.
        std::vector<Node> m_Nodes;

        [[nodiscard]] const Node* FindNode(entt::entity entity) const;
        [[nodiscard]] Node* FindNode(entt::entity entity);
        Node& GetOrCreateNode(entt::entity entity);
    };
}
