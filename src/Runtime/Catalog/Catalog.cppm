export module Catalog;

export import :Loader;
