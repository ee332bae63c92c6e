module;

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_set>
#include <vector>

#include <glm/glm.hpp>
#include <entt/entity/entity.hpp>

export module Runtime.SpatialHashTable;

import Geometry;

// -------------------------------------------------------------------------
// Runtime::SpatialHashTable - Screen-space tile buckets for picking
// -------------------------------------------------------------------------
// Partitions the viewport's pixel rectangle into square tiles, row-major from
// the top-left: tile = y * XTiles + x. Each tile holds the set of entities
// whose drawn shape touches it. Inserts take virtual-space geometry plus the
// viewport and do the conversion themselves.
//
// Insertion is conservative: an entity may appear in a tile it only grazes
// numerically, but never misses a tile it visibly crosses.
// -------------------------------------------------------------------------

export namespace Runtime
{
    class SpatialHashTable
    {
    public:
        struct Config
        {
            double TileSize = 40.0; // Pixels
        };

        SpatialHashTable();
        explicit SpatialHashTable(const Config& config);

        // Resizes the grid to cover the viewport's actual size. Drops all content.
        void InitViewport(const Geometry::Viewport& viewport);

        void InsertPoint(entt::entity entity, const Geometry::Point& point, const Geometry::Viewport& viewport);
        void InsertLine(entt::entity entity, const Geometry::Line& line, const Geometry::Viewport& viewport);
        void InsertCircle(entt::entity entity, const Geometry::Circle& circle, const Geometry::Viewport& viewport);

        void RemoveFromAll(entt::entity entity);

        // Empties every tile, keeping the grid dimensions.
        void Clear();

        // Unique entities in the 3x3 tile block around a virtual point, centre
        // tile first. nullopt if the point maps outside the grid.
        [[nodiscard]] std::optional<std::vector<entt::entity>> GetNeighborEntitiesOfPoint(const Geometry::Point& point,
                                                                                          const Geometry::Viewport& viewport) const;

        // Entities in every tile overlapped by an actual-space box.
        [[nodiscard]] std::unordered_set<entt::entity> GetNeighborEntitiesOfAabb(const Geometry::AABB& actualBox) const;

        // ----- Inspection -----
        [[nodiscard]] std::uint32_t XTiles() const { return m_XTiles; }
        [[nodiscard]] std::uint32_t YTiles() const { return m_YTiles; }
        [[nodiscard]] std::size_t TileCount() const { return m_Tiles.size(); }
        [[nodiscard]] const Config& GetConfig() const { return m_Config; }

        [[nodiscard]] std::optional<std::uint32_t> GetTileOfActualPoint(const Geometry::Vector2& actual) const;
        [[nodiscard]] const std::unordered_set<entt::entity>& GetEntitiesInTile(std::uint32_t tile) const;

    private:
        struct TileCoord
        {
            std::int64_t X = 0;
            std::int64_t Y = 0;
        };

        [[nodiscard]] TileCoord GetUnlimitedTile(const Geometry::Vector2& actual) const;
        [[nodiscard]] bool IsInGrid(std::int64_t x, std::int64_t y) const;

        // Inserts into a grid cell; skips cells outside the grid.
        void InsertIfInGrid(std::int64_t x, std::int64_t y, entt::entity entity);
        void InsertIntoTile(std::uint32_t tile, entt::entity entity);

        void RasterizeSegment(entt::entity entity, Geometry::Vector2 a, Geometry::Vector2 b);

        Config m_Config;
        std::uint32_t m_XTiles = 0;
        std::uint32_t m_YTiles = 0;
        std::vector<std::unordered_set<entt::entity>> m_Tiles;
    };
}
