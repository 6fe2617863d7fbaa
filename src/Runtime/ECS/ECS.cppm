export module ECS;

export import :Components;
export import :SceneObjectRegistry;
