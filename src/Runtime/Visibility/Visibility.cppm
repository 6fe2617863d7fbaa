export module Visibility;

export import :Engine;
