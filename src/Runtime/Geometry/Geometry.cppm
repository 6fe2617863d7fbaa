export module Geometry;

export import :Primitives;
export import :Overlap;
