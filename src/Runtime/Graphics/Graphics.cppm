export module Graphics;

export import :Camera;
export import :Color;
export import :Image;
