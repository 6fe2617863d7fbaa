export module Residency;

export import :Types;
export import :Thresholds;
export import :ResourceCache;
export import :ResourceSource;
export import :Manager;
