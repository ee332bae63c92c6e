export module ECS:Components;

export import :Components.NameTag;
export import :Components.Symbolic;
export import :Components.Resolved;
