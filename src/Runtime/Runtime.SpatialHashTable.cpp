module;

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <optional>
#include <unordered_set>
#include <utility>
#include <vector>

#include <glm/glm.hpp>
#include <entt/entity/entity.hpp>

module Runtime.SpatialHashTable;

import Core;
import Geometry;

namespace Runtime
{
    namespace
    {
        // Endpoints are pulled inward by this much (pixels) before tiling, so a
        // clipped endpoint lying exactly on a tile edge lands in the tile the
        // segment actually runs through.
        constexpr double kEndpointNudge = 1.0e-6;

        // Keeps floor() results representable before the integer cast.
        constexpr double kTileIndexLimit = 1.0e15;

        std::int64_t ToTileIndex(double value)
        {
            return static_cast<std::int64_t>(std::clamp(std::floor(value), -kTileIndexLimit, kTileIndexLimit));
        }

        const std::unordered_set<entt::entity>& EmptyTile()
        {
            static const std::unordered_set<entt::entity> empty;
            return empty;
        }
    }

    SpatialHashTable::SpatialHashTable() = default;

    SpatialHashTable::SpatialHashTable(const Config& config) : m_Config(config) {}

    // -------------------------------------------------------------------------
    // Grid
    // -------------------------------------------------------------------------

    void SpatialHashTable::InitViewport(const Geometry::Viewport& viewport)
    {
        const double tile = m_Config.TileSize;
        const auto tilesAlong = [tile](double extent) -> std::uint32_t
        {
            if (!(extent > 0.0)) return 0;
            return static_cast<std::uint32_t>(std::ceil(extent / tile));
        };

        m_XTiles = tilesAlong(viewport.ActualSize.x);
        m_YTiles = tilesAlong(viewport.ActualSize.y);

        m_Tiles.clear();
        m_Tiles.resize(static_cast<std::size_t>(m_XTiles) * m_YTiles);

        Core::Log::Debug("SpatialHashTable: {}x{} tiles for {}x{} px",
                         m_XTiles, m_YTiles, viewport.ActualSize.x, viewport.ActualSize.y);
    }

    void SpatialHashTable::Clear()
    {
        for (auto& tile : m_Tiles)
        {
            tile.clear();
        }
    }

    SpatialHashTable::TileCoord SpatialHashTable::GetUnlimitedTile(const Geometry::Vector2& actual) const
    {
        return {ToTileIndex(actual.x / m_Config.TileSize), ToTileIndex(actual.y / m_Config.TileSize)};
    }

    bool SpatialHashTable::IsInGrid(std::int64_t x, std::int64_t y) const
    {
        return x >= 0 && y >= 0 && x < static_cast<std::int64_t>(m_XTiles) && y < static_cast<std::int64_t>(m_YTiles);
    }

    std::optional<std::uint32_t> SpatialHashTable::GetTileOfActualPoint(const Geometry::Vector2& actual) const
    {
        if (!Geometry::IsFinite(actual)) return std::nullopt;

        const TileCoord c = GetUnlimitedTile(actual);
        if (!IsInGrid(c.X, c.Y)) return std::nullopt;
        return static_cast<std::uint32_t>(c.Y * m_XTiles + c.X);
    }

    const std::unordered_set<entt::entity>& SpatialHashTable::GetEntitiesInTile(std::uint32_t tile) const
    {
        if (tile >= m_Tiles.size())
        {
            Core::Log::Warn("SpatialHashTable: tile {} out of range ({} tiles)", tile, m_Tiles.size());
            return EmptyTile();
        }
        return m_Tiles[tile];
    }

    void SpatialHashTable::InsertIntoTile(std::uint32_t tile, entt::entity entity)
    {
        if (tile >= m_Tiles.size())
        {
            Core::Log::Error("SpatialHashTable: computed tile {} outside grid of {} tiles", tile, m_Tiles.size());
            assert(false && "SpatialHashTable: tile index out of range");
            return;
        }
        m_Tiles[tile].insert(entity);
    }

    void SpatialHashTable::InsertIfInGrid(std::int64_t x, std::int64_t y, entt::entity entity)
    {
        if (!IsInGrid(x, y)) return;
        InsertIntoTile(static_cast<std::uint32_t>(y * m_XTiles + x), entity);
    }

    // -------------------------------------------------------------------------
    // Insertion
    // -------------------------------------------------------------------------

    void SpatialHashTable::InsertPoint(entt::entity entity, const Geometry::Point& point, const Geometry::Viewport& viewport)
    {
        if (const auto tile = GetTileOfActualPoint(viewport.ToActual(point)))
        {
            InsertIntoTile(*tile, entity);
        }
    }

    void SpatialHashTable::InsertLine(entt::entity entity, const Geometry::Line& line, const Geometry::Viewport& viewport)
    {
        if (m_Tiles.empty()) return;

        const auto visible = Geometry::ClipLine(viewport.ToActual(line), viewport.ActualAabb());
        if (!visible) return;

        RasterizeSegment(entity, visible->first, visible->second);
    }

    // Walks the tile rows crossed by an actual-space segment, left to right,
    // inserting the column span covered in each row.
    void SpatialHashTable::RasterizeSegment(entt::entity entity, Geometry::Vector2 a, Geometry::Vector2 b)
    {
        if (a.x > b.x) std::swap(a, b);

        const Geometry::Vector2 delta = b - a;
        const double length = glm::length(delta);
        if (length <= 2.0 * kEndpointNudge)
        {
            const TileCoord c = GetUnlimitedTile(a);
            InsertIfInGrid(c.X, c.Y, entity);
            return;
        }

        const Geometry::Vector2 dir = delta / length;
        a += dir * kEndpointNudge;
        b -= dir * kEndpointNudge;

        const TileCoord start = GetUnlimitedTile(a);
        const TileCoord end = GetUnlimitedTile(b);

        // Vertical (within one column)
        if (start.X == end.X)
        {
            const auto [yMin, yMax] = std::minmax(start.Y, end.Y);
            for (std::int64_t y = yMin; y <= yMax; ++y)
            {
                InsertIfInGrid(start.X, y, entity);
            }
            return;
        }

        const double tile = m_Config.TileSize;
        const std::int64_t step = end.Y >= start.Y ? 1 : -1;
        const std::int64_t rows = (end.Y - start.Y) * step;

        std::int64_t row = start.Y;
        std::int64_t col = start.X;
        Geometry::Vector2 cursor = a;

        for (std::int64_t i = 0; i <= rows; ++i, row += step)
        {
            std::int64_t lastCol = end.X;
            double nextX = cursor.x;

            if (i < rows)
            {
                const double boundaryY = static_cast<double>(step > 0 ? row + 1 : row) * tile;
                nextX = cursor.x + (boundaryY - cursor.y) / dir.y * dir.x;
                lastCol = std::max(col, std::min(end.X, ToTileIndex(std::ceil(nextX / tile)) - 1));
                cursor = {nextX, boundaryY};
            }

            for (std::int64_t x = col; x <= lastCol; ++x)
            {
                InsertIfInGrid(x, row, entity);
            }

            if (i < rows)
            {
                col = std::clamp(ToTileIndex(nextX / tile), col, end.X);
            }
        }
    }

    void SpatialHashTable::InsertCircle(entt::entity entity, const Geometry::Circle& circle, const Geometry::Viewport& viewport)
    {
        if (m_Tiles.empty()) return;

        const Geometry::Circle actual = viewport.ToActual(circle);
        const Geometry::Vector2 extent(actual.Radius);

        const TileCoord first = GetUnlimitedTile(actual.Center - extent);
        const TileCoord last = GetUnlimitedTile(actual.Center + extent);

        const std::int64_t xBegin = std::max<std::int64_t>(first.X, 0);
        const std::int64_t yBegin = std::max<std::int64_t>(first.Y, 0);
        const std::int64_t xEnd = std::min<std::int64_t>(last.X, static_cast<std::int64_t>(m_XTiles) - 1);
        const std::int64_t yEnd = std::min<std::int64_t>(last.Y, static_cast<std::int64_t>(m_YTiles) - 1);

        const double tile = m_Config.TileSize;
        for (std::int64_t y = yBegin; y <= yEnd; ++y)
        {
            for (std::int64_t x = xBegin; x <= xEnd; ++x)
            {
                const auto cell = Geometry::AABB::FromOriginSize(
                    {static_cast<double>(x) * tile, static_cast<double>(y) * tile}, Geometry::Vector2(tile));

                // Disc/cell overlap: nearest point of the cell within the radius.
                if (Geometry::SquaredDistance(cell, actual.Center) <= actual.Radius * actual.Radius)
                {
                    InsertIfInGrid(x, y, entity);
                }
            }
        }
    }

    void SpatialHashTable::RemoveFromAll(entt::entity entity)
    {
        for (auto& tile : m_Tiles)
        {
            tile.erase(entity);
        }
    }

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    std::optional<std::vector<entt::entity>> SpatialHashTable::GetNeighborEntitiesOfPoint(const Geometry::Point& point,
                                                                                         const Geometry::Viewport& viewport) const
    {
        const auto centerTile = GetTileOfActualPoint(viewport.ToActual(point));
        if (!centerTile) return std::nullopt;

        const auto cx = static_cast<std::int64_t>(*centerTile % m_XTiles);
        const auto cy = static_cast<std::int64_t>(*centerTile / m_XTiles);

        std::vector<entt::entity> result;
        std::unordered_set<entt::entity> seen;

        const auto collect = [&](std::int64_t x, std::int64_t y)
        {
            if (!IsInGrid(x, y)) return;
            for (entt::entity e : m_Tiles[static_cast<std::size_t>(y * m_XTiles + x)])
            {
                if (seen.insert(e).second) result.push_back(e);
            }
        };

        collect(cx, cy);
        for (std::int64_t dy = -1; dy <= 1; ++dy)
        {
            for (std::int64_t dx = -1; dx <= 1; ++dx)
            {
                if (dx == 0 && dy == 0) continue;
                collect(cx + dx, cy + dy);
            }
        }

        return result;
    }

    std::unordered_set<entt::entity> SpatialHashTable::GetNeighborEntitiesOfAabb(const Geometry::AABB& actualBox) const
    {
        std::unordered_set<entt::entity> result;
        if (m_Tiles.empty() || !actualBox.IsValid()) return result;

        const TileCoord first = GetUnlimitedTile(actualBox.Min);
        const TileCoord last = GetUnlimitedTile(actualBox.Max);

        const std::int64_t xBegin = std::max<std::int64_t>(first.X, 0);
        const std::int64_t yBegin = std::max<std::int64_t>(first.Y, 0);
        const std::int64_t xEnd = std::min<std::int64_t>(last.X, static_cast<std::int64_t>(m_XTiles) - 1);
        const std::int64_t yEnd = std::min<std::int64_t>(last.Y, static_cast<std::int64_t>(m_YTiles) - 1);

        for (std::int64_t y = yBegin; y <= yEnd; ++y)
        {
            for (std::int64_t x = xBegin; x <= xEnd; ++x)
            {
                const auto& tile = m_Tiles[static_cast<std::size_t>(y * m_XTiles + x)];
                result.insert(tile.begin(), tile.end());
            }
        }
        return result;
    }
}
