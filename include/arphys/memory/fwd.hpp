#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for arphys_memory

namespace arphys_memory {

struct PoolStats;
template<typename T> class ObjectPool;

} // namespace arphys_memory
