/// @file config.cpp
/// @brief PhysicsConfig presets, validation and JSON serialization

#include <arphys/physics/config.hpp>

#include <arphys/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>

namespace arphys_physics {

using arphys_core::ConfigError;
using arphys_core::Err;
using arphys_core::Ok;
using arphys_core::Result;

namespace {

// =============================================================================
// Enum keys
// =============================================================================

const char* tier_key(QualityTier tier) {
    switch (tier) {
        case QualityTier::Low: return "low";
        case QualityTier::Medium: return "medium";
        case QualityTier::High: return "high";
        case QualityTier::Ultra: return "ultra";
    }
    return "high";
}

std::optional<QualityTier> parse_tier(const std::string& key) {
    if (key == "low") return QualityTier::Low;
    if (key == "medium") return QualityTier::Medium;
    if (key == "high") return QualityTier::High;
    if (key == "ultra") return QualityTier::Ultra;
    return std::nullopt;
}

const char* precision_key(CollisionPrecision precision) {
    return precision == CollisionPrecision::Reduced ? "reduced" : "full";
}

std::optional<CollisionPrecision> parse_precision(const std::string& key) {
    if (key == "full") return CollisionPrecision::Full;
    if (key == "reduced") return CollisionPrecision::Reduced;
    return std::nullopt;
}

// =============================================================================
// JSON helpers
// =============================================================================

// Helper to parse Vec3 from JSON array [x, y, z]
std::optional<arphys_math::Vec3> parse_vec3(const nlohmann::json& arr) {
    if (!arr.is_array() || arr.size() != 3) return std::nullopt;
    return arphys_math::Vec3(arr[0].get<float>(), arr[1].get<float>(), arr[2].get<float>());
}

nlohmann::json vec3_to_json(const arphys_math::Vec3& v) {
    return nlohmann::json::array({v.x, v.y, v.z});
}

template<typename T>
void read(const nlohmann::json& j, const char* key, T& field) {
    field = j.value(key, field);
}

Result<void> check(bool ok, const char* key, const char* reason) {
    if (ok) return Ok();
    return Err(ConfigError::invalid_value(key, reason));
}

bool unit_interval(float v) {
    return v >= 0.0f && v <= 1.0f;
}

Result<void> read_performance(const nlohmann::json& j, PerformanceConfig& perf) {
    if (j.contains("lod_distances")) {
        const auto& arr = j["lod_distances"];
        if (!arr.is_array() || arr.size() != perf.lod_distances.size()) {
            return Err(ConfigError::invalid_value("performance.lod_distances", "expected 4 distances"));
        }
        for (std::size_t i = 0; i < perf.lod_distances.size(); ++i) {
            perf.lod_distances[i] = arr[i].get<float>();
        }
    }
    read(j, "lod_hysteresis", perf.lod_hysteresis);
    read(j, "max_cull_distance", perf.max_cull_distance);
    read(j, "frustum_culling_enabled", perf.frustum_culling_enabled);
    read(j, "frame_time_threshold", perf.frame_time_threshold);
    read(j, "emergency_frame_count", perf.emergency_frame_count);
    read(j, "recovery_frame_count", perf.recovery_frame_count);
    read(j, "optimization_interval", perf.optimization_interval);
    read(j, "pool_capacity", perf.pool_capacity);
    read(j, "memory_threshold_bytes", perf.memory_threshold_bytes);
    read(j, "batch_size", perf.batch_size);
    read(j, "adaptive_cell_size", perf.adaptive_cell_size);
    return Ok();
}

} // anonymous namespace

// =============================================================================
// Quality
// =============================================================================

QualitySettings QualitySettings::for_tier(QualityTier tier) {
    QualitySettings q;
    switch (tier) {
        case QualityTier::Low:
            q.performance_budget = 0.020f;
            q.shadows_enabled = false;
            q.occlusion_enabled = false;
            q.precision = CollisionPrecision::Reduced;
            break;
        case QualityTier::Medium:
            q.performance_budget = 0.012f;
            q.shadows_enabled = true;
            q.occlusion_enabled = false;
            break;
        case QualityTier::High:
            q.performance_budget = 0.008f;
            break;
        case QualityTier::Ultra:
            q.performance_budget = 0.005f;
            break;
    }
    return q;
}

// =============================================================================
// Presets
// =============================================================================

PhysicsConfig PhysicsConfig::defaults() {
    return PhysicsConfig{};
}

PhysicsConfig PhysicsConfig::high_fidelity() {
    PhysicsConfig config;
    config.apply_quality(QualityTier::Ultra);
    config.sleep_threshold = 0.005f;
    config.time_to_sleep = 2.0f;
    config.grid_cell_size = 0.5f;
    config.collision_margin = 0.005f;
    config.max_collision_checks_warning = 400;
    return config;
}

PhysicsConfig PhysicsConfig::performance_preset() {
    PhysicsConfig config;
    config.apply_quality(QualityTier::Low);
    config.sleep_threshold = 0.05f;
    config.time_to_sleep = 0.5f;
    config.grid_cell_size = 2.0f;
    config.performance.max_cull_distance = 25.0f;
    config.performance.lod_distances = {3.0f, 8.0f, 15.0f, 25.0f};
    return config;
}

void PhysicsConfig::apply_quality(QualityTier tier) {
    const QualitySettings q = QualitySettings::for_tier(tier);
    quality = tier;
    performance_budget = q.performance_budget;
    shadows_enabled = q.shadows_enabled;
    occlusion_enabled = q.occlusion_enabled;
    precision = q.precision;
}

// =============================================================================
// Validation
// =============================================================================

Result<void> PhysicsConfig::validate() const {
    const Result<void> checks[] = {
        check(arphys_math::is_finite(gravity), "gravity", "must be finite"),
        check(unit_interval(linear_damping), "linear_damping", "must be in [0, 1]"),
        check(unit_interval(angular_damping), "angular_damping", "must be in [0, 1]"),
        check(max_velocity > 0.0f, "max_velocity", "must be positive"),
        check(sleep_threshold >= 0.0f, "sleep_threshold", "must not be negative"),
        check(time_to_sleep >= 0.0f, "time_to_sleep", "must not be negative"),
        check(collision_margin >= 0.0f, "collision_margin", "must not be negative"),
        check(rest_velocity_threshold >= 0.0f, "rest_velocity_threshold", "must not be negative"),
        check(unit_interval(default_friction), "default_friction", "must be in [0, 1]"),
        check(unit_interval(default_restitution), "default_restitution", "must be in [0, 1]"),
        check(grid_cell_size > 0.0f, "grid_cell_size", "must be positive"),
        check(grid_optimize_interval >= 0.0f, "grid_optimize_interval", "must not be negative"),
        check(snap_distance >= 0.0f, "snap_distance", "must not be negative"),
        check(snap_search_radius >= snap_distance, "snap_search_radius", "must be at least snap_distance"),
        check(snap_duration > 0.0f, "snap_duration", "must be positive"),
        check(snap_spring_constant >= 0.0f, "snap_spring_constant", "must not be negative"),
        check(snap_hold_tolerance >= 0.0f, "snap_hold_tolerance", "must not be negative"),
        check(performance_budget > 0.0f, "performance_budget", "must be positive"),
        check(std::is_sorted(performance.lod_distances.begin(), performance.lod_distances.end()) &&
                  performance.lod_distances.front() > 0.0f,
              "performance.lod_distances", "must be positive and ascending"),
        check(performance.lod_hysteresis >= 0.0f, "performance.lod_hysteresis", "must not be negative"),
        check(performance.max_cull_distance > 0.0f, "performance.max_cull_distance", "must be positive"),
        check(performance.emergency_frame_count > 0, "performance.emergency_frame_count", "must be positive"),
        check(performance.batch_size > 0, "performance.batch_size", "must be positive"),
    };

    for (const auto& result : checks) {
        if (result.is_err()) {
            return result;
        }
    }
    return Ok();
}

// =============================================================================
// JSON
// =============================================================================

Result<PhysicsConfig> PhysicsConfig::from_json(const std::string& text) {
    PhysicsConfig config;

    try {
        const nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            return Err<PhysicsConfig>(ConfigError::parse("top level must be an object"));
        }

        if (j.contains("gravity")) {
            auto gravity = parse_vec3(j["gravity"]);
            if (!gravity) {
                return Err<PhysicsConfig>(ConfigError::invalid_value("gravity", "expected [x, y, z]"));
            }
            config.gravity = *gravity;
        }

        read(j, "linear_damping", config.linear_damping);
        read(j, "angular_damping", config.angular_damping);
        read(j, "max_velocity", config.max_velocity);
        read(j, "gravity_enabled", config.gravity_enabled);
        read(j, "simulation_enabled", config.simulation_enabled);
        read(j, "sleep_threshold", config.sleep_threshold);
        read(j, "time_to_sleep", config.time_to_sleep);
        read(j, "collision_detection_enabled", config.collision_detection_enabled);
        read(j, "collision_margin", config.collision_margin);
        read(j, "rest_velocity_threshold", config.rest_velocity_threshold);
        read(j, "default_friction", config.default_friction);
        read(j, "default_restitution", config.default_restitution);
        read(j, "grid_cell_size", config.grid_cell_size);
        read(j, "grid_optimize_interval", config.grid_optimize_interval);
        read(j, "max_collision_checks_warning", config.max_collision_checks_warning);
        read(j, "snap_to_floor_enabled", config.snap_to_floor_enabled);
        read(j, "snap_to_wall_enabled", config.snap_to_wall_enabled);
        read(j, "auto_snap_enabled", config.auto_snap_enabled);
        read(j, "snap_distance", config.snap_distance);
        read(j, "snap_search_radius", config.snap_search_radius);
        read(j, "snap_duration", config.snap_duration);
        read(j, "snap_spring_constant", config.snap_spring_constant);
        read(j, "snap_hold_tolerance", config.snap_hold_tolerance);
        read(j, "snap_auto_max_speed", config.snap_auto_max_speed);
        read(j, "snap_angle_tolerance", config.snap_angle_tolerance);

        // The tier seeds the quality fields, explicit keys override it
        if (j.contains("quality")) {
            auto tier = parse_tier(j["quality"].get<std::string>());
            if (!tier) {
                return Err<PhysicsConfig>(ConfigError::invalid_value("quality", "expected low, medium, high or ultra"));
            }
            config.apply_quality(*tier);
        }
        read(j, "performance_budget", config.performance_budget);
        read(j, "shadows_enabled", config.shadows_enabled);
        read(j, "occlusion_enabled", config.occlusion_enabled);
        if (j.contains("precision")) {
            auto precision = parse_precision(j["precision"].get<std::string>());
            if (!precision) {
                return Err<PhysicsConfig>(ConfigError::invalid_value("precision", "expected full or reduced"));
            }
            config.precision = *precision;
        }

        if (j.contains("performance") && j["performance"].is_object()) {
            auto perf = read_performance(j["performance"], config.performance);
            if (perf.is_err()) {
                return Err<PhysicsConfig>(perf.error());
            }
        }
    } catch (const nlohmann::json::type_error& e) {
        return Err<PhysicsConfig>(ConfigError::invalid_value("<type>", e.what()));
    } catch (const nlohmann::json::exception& e) {
        return Err<PhysicsConfig>(ConfigError::parse(e.what()));
    }

    auto valid = config.validate();
    if (valid.is_err()) {
        return Err<PhysicsConfig>(valid.error());
    }
    return config;
}

Result<PhysicsConfig> PhysicsConfig::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        arphys_core::physics_logger()->error("Cannot open physics config '{}'", path);
        return Err<PhysicsConfig>(ConfigError::io(path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = from_json(buffer.str());
    if (result.is_err()) {
        result.error().with_context("path", path);
        arphys_core::physics_logger()->error("Failed to load physics config: {}",
                                             arphys_core::build_error_chain(result.error()));
    }
    return result;
}

std::string PhysicsConfig::to_json() const {
    nlohmann::json j;
    j["gravity"] = vec3_to_json(gravity);
    j["linear_damping"] = linear_damping;
    j["angular_damping"] = angular_damping;
    j["max_velocity"] = max_velocity;
    j["gravity_enabled"] = gravity_enabled;
    j["simulation_enabled"] = simulation_enabled;
    j["sleep_threshold"] = sleep_threshold;
    j["time_to_sleep"] = time_to_sleep;
    j["collision_detection_enabled"] = collision_detection_enabled;
    j["collision_margin"] = collision_margin;
    j["rest_velocity_threshold"] = rest_velocity_threshold;
    j["default_friction"] = default_friction;
    j["default_restitution"] = default_restitution;
    j["grid_cell_size"] = grid_cell_size;
    j["grid_optimize_interval"] = grid_optimize_interval;
    j["max_collision_checks_warning"] = max_collision_checks_warning;
    j["snap_to_floor_enabled"] = snap_to_floor_enabled;
    j["snap_to_wall_enabled"] = snap_to_wall_enabled;
    j["auto_snap_enabled"] = auto_snap_enabled;
    j["snap_distance"] = snap_distance;
    j["snap_search_radius"] = snap_search_radius;
    j["snap_duration"] = snap_duration;
    j["snap_spring_constant"] = snap_spring_constant;
    j["snap_hold_tolerance"] = snap_hold_tolerance;
    j["snap_auto_max_speed"] = snap_auto_max_speed;
    j["snap_angle_tolerance"] = snap_angle_tolerance;
    j["quality"] = tier_key(quality);
    j["performance_budget"] = performance_budget;
    j["shadows_enabled"] = shadows_enabled;
    j["occlusion_enabled"] = occlusion_enabled;
    j["precision"] = precision_key(precision);

    nlohmann::json perf;
    perf["lod_distances"] = performance.lod_distances;
    perf["lod_hysteresis"] = performance.lod_hysteresis;
    perf["max_cull_distance"] = performance.max_cull_distance;
    perf["frustum_culling_enabled"] = performance.frustum_culling_enabled;
    perf["frame_time_threshold"] = performance.frame_time_threshold;
    perf["emergency_frame_count"] = performance.emergency_frame_count;
    perf["recovery_frame_count"] = performance.recovery_frame_count;
    perf["optimization_interval"] = performance.optimization_interval;
    perf["pool_capacity"] = performance.pool_capacity;
    perf["memory_threshold_bytes"] = performance.memory_threshold_bytes;
    perf["batch_size"] = performance.batch_size;
    perf["adaptive_cell_size"] = performance.adaptive_cell_size;
    j["performance"] = perf;

    return j.dump(2);
}

Result<void> PhysicsConfig::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        return Err(ConfigError::io(path));
    }
    file << to_json();
    if (!file) {
        return Err(ConfigError::io(path));
    }
    return Ok();
}

} // namespace arphys_physics
