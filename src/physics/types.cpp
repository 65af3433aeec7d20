/// @file types.cpp
/// @brief Core type implementations for arphys_physics

#include <arphys/physics/types.hpp>

namespace arphys_physics {

// =============================================================================
// String Conversions
// =============================================================================

const char* to_string(CollisionKind kind) {
    switch (kind) {
        case CollisionKind::EntityEntity: return "EntityEntity";
        case CollisionKind::EntityStatic: return "EntityStatic";
    }
    return "Unknown";
}

const char* to_string(SnapType type) {
    switch (type) {
        case SnapType::Floor: return "Floor";
        case SnapType::Wall: return "Wall";
        case SnapType::Surface: return "Surface";
        case SnapType::Automatic: return "Automatic";
    }
    return "Unknown";
}

const char* to_string(SnapTargetType type) {
    switch (type) {
        case SnapTargetType::Floor: return "Floor";
        case SnapTargetType::Wall: return "Wall";
        case SnapTargetType::Corner: return "Corner";
        case SnapTargetType::Edge: return "Edge";
    }
    return "Unknown";
}

const char* to_string(QualityTier tier) {
    switch (tier) {
        case QualityTier::Low: return "Low";
        case QualityTier::Medium: return "Medium";
        case QualityTier::High: return "High";
        case QualityTier::Ultra: return "Ultra";
    }
    return "Unknown";
}

const char* to_string(CollisionPrecision precision) {
    switch (precision) {
        case CollisionPrecision::Full: return "Full";
        case CollisionPrecision::Reduced: return "Reduced";
    }
    return "Unknown";
}

// =============================================================================
// Material Presets
// =============================================================================

Material Material::wood() {
    Material mat;
    mat.friction = 0.6f;
    mat.restitution = 0.3f;
    mat.density = 700.0f; // kg/m^3
    return mat;
}

Material Material::fabric() {
    Material mat;
    mat.friction = 0.9f;
    mat.restitution = 0.1f;
    mat.density = 300.0f;
    return mat;
}

Material Material::metal() {
    Material mat;
    mat.friction = 0.4f;
    mat.restitution = 0.5f;
    mat.density = 7800.0f;
    return mat;
}

Material Material::glass() {
    Material mat;
    mat.friction = 0.3f;
    mat.restitution = 0.6f;
    mat.density = 2500.0f;
    return mat;
}

} // namespace arphys_physics
