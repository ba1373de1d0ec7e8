export module Core;

// Re-export all sub-systems so the user only needs 'import Core;'
export import :Logging;
export import :Error;
export import :Handle;
export import :Input;
export import :Window;
export import :Filesystem;
export import :ResourcePool;
