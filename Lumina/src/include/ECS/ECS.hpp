#pragma once

// ---------------------------------------------------------------------------
// ECS.hpp: single convenience include for the Lumina ECS runtime.
//
//   #include <ECS/ECS.hpp>
//
//   using namespace Lumina::ECS;
//
// Overview
// --------
//
//   Entity           index + generation handle; stale handles read as dead
//   EntityManager    allocation, liveness bitset, LIFO free list
//   ComponentPool    sparse-set storage for one component type
//   ComponentManager one pool per type, each behind its own lock
//   ResourceManager  typed singletons, one lock per resource
//   World            facade over the three managers; the only thing
//                    systems need
//   System           per-frame logic; SystemSchedule runs them in order
//   Components       built-in engine component structs
//
// Quick-start
// -----------
//
//   // 1. Own a World (typically one per Scene, shared with systems)
//   auto world = std::make_shared<Lumina::ECS::World>();
//
//   // 2. Spawn entities with components
//   Entity e = world->Spawn()
//                   .With(TransformComponent{})
//                   .With(VelocityComponent{ Vector3{0, 0, 5} })
//                   .With(TagComponent{"Bullet"})
//                   .Build();
//
//   // 3. Schedule systems and tick them
//   SystemSchedule schedule;
//   schedule.Emplace<TimeSystem>();
//   schedule.Emplace<MovementSystem>();
//   schedule.Emplace<LifetimeSystem>();
//   schedule.Init(*world);
//   schedule.Run(*world, dt);
//
//   // 4. Despawn
//   world->Despawn(e); // removes ALL components automatically
//
// ---------------------------------------------------------------------------

#include <ECS/Entity.hpp>
#include <ECS/Handle.hpp>
#include <ECS/BitSet.hpp>
#include <ECS/EntityManager.hpp>
#include <ECS/ComponentPool.hpp>
#include <ECS/ComponentManager.hpp>
#include <ECS/ResourceManager.hpp>
#include <ECS/World.hpp>
#include <ECS/System.hpp>
#include <ECS/Components.hpp>
#include <ECS/BuiltinSystems.hpp>
