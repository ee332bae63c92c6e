export module Geometry;

export import :Vector;
export import :AABB;
export import :Primitives;
export import :Intersect;
export import :Viewport;
