// Fixed-width aliases used across the Corral headers.
#pragma once
#include <cstddef>
#include <cstdint>

namespace Corral
{
    /// @brief Tag width for the small enums (`IterationError`, `ViewKind`, ...).
    using UInt8 = std::uint8_t;

    /// @brief Width of the generation counters.
    using UInt64 = std::uint64_t;

    /// @brief Load factors and other ratios.
    using F64 = double;

    /// @brief Element counts, capacities and ring indices.
    using UIntSize = std::size_t;
}// namespace Corral
