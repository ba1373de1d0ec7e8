export module RHI;

export import :Types;
export import :Context;
export import :Device;
export import :Buffer;
export import :Image;
export import :Texture;
export import :CommandUtils;
export import :Descriptors;
export import :Shader;
export import :Pipeline;
export import :Swapchain;
export import :GpuContext;
