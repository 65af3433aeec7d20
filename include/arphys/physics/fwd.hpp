/// @file fwd.hpp
/// @brief Forward declarations for arphys_physics

#pragma once

#include <cstdint>

namespace arphys_physics {

// Identifiers
struct ColliderId;
struct SnapTargetId;

// Geometry
struct SphereGeometry;
struct BoxGeometry;
struct PlaneGeometry;
struct MeshGeometry;
enum class GeometryKind : std::uint8_t;

// Entities and colliders
struct PhysicsEntity;
struct EntityDesc;
struct StaticCollider;
struct SnapTarget;
struct SnapTargetDesc;
class IEntityHandle;

// Collision
struct Contact;
struct Collision;
struct CollisionPair;
class SpatialGrid;
class CollisionDetector;
class BatchProcessor;

// Simulation
struct PhysicsConfig;
struct PerformanceConfig;
struct QualitySettings;
class Integrator;
class PhysicsWorld;

// Snapping
struct SnapResult;
struct SnapState;
struct SnapOperation;
struct SnapCandidate;
class SnapSystem;

// Performance
class LodManager;
class Culler;
class MemoryTracker;
class PerformanceManager;

// Host integration
struct SurfaceEvent;
class SurfaceFeed;
class PhysicsSystem;

// Statistics
struct GridStats;
struct CollisionStats;
struct WorldStats;
struct SnapStats;
struct PerformanceStats;
struct PhysicsStats;

} // namespace arphys_physics
