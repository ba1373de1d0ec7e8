export module Runtime;

export import :CameraInput;
export import :SceneDriver;
