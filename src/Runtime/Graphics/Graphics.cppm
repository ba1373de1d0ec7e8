export module Graphics;

export import :AssetErrors;
export import :Geometry;
export import :Camera;
export import :GpuMirror;
export import :CameraUniform;
export import :LightUniform;
export import :InstanceBuffer;
export import :ResourceUploader;
export import :RenderPipelineSet;
export import :FrameStateMachine;
export import :FrameRenderer;
export import :TextureLoader;
export import :Importers.OBJ;
export import :ModelLoader;
