#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for arphys_structures

namespace arphys_structures {

template<typename T> struct SlotKey;
template<typename T> class SlotMap;
template<typename T> class CommandQueue;

} // namespace arphys_structures
