#pragma once

#include <cstdint>

namespace compgroup
{
    using Component = std::uint16_t;
    using Entity = std::uint64_t;
    using Generation = std::uint16_t;

    constexpr std::uint64_t ENTITY_MASK = 0x0000FFFFFFFFFFFF; /* 48 lower bits for entity id */
    constexpr std::uint64_t GENERATION_SHIFT = 48; /* we need to shift 16 bits upper to accommodate the entity bits */
    constexpr Generation MAX_GENERATION = 0xFFFF; /* for 16-bit generation */

    enum class BorrowMode : std::uint8_t
    {
        READ,
        WRITE
    };
}
