export module Core;

// Re-export all sub-systems so the user only needs 'import Core;'
export import :Error;
export import :Hash;
export import :Handle;
export import :Logging;
export import :ResourcePool;
export import :Tasks;
export import :IOBackend;
