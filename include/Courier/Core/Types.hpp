/**
 * @file Types.hpp
 * @brief Core type definitions for Courier
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 * 
 * Fundamental type aliases and constants shared by every Courier module.
 */

#pragma once

#ifndef COURIER_CORE_TYPES_HPP
#define COURIER_CORE_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace Courier {

/// Full version string
constexpr const char* VERSION_STRING = "1.0.0";

// ============================================================================
// Fundamental Type Aliases
// ============================================================================

/// Byte type for raw payloads
using Byte = uint8_t;

/// Span of bytes (non-owning view)
using ByteSpan = std::span<const Byte>;

/// Owning byte buffer
using ByteBuffer = std::vector<Byte>;

// ============================================================================
// Time Types
// ============================================================================

/// Steady clock for elapsed-time measurements
using Clock = std::chrono::steady_clock;

/// Duration in milliseconds
using Milliseconds = std::chrono::milliseconds;

} // namespace Courier

#endif // COURIER_CORE_TYPES_HPP
