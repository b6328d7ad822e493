#pragma once

/// @file types.hpp
/// @brief Strong ID types for the entities of a battle.

#include <compare>
#include <cstdint>
#include <functional>

namespace sgc::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Prevents accidental mixing of different ID types (e.g. EnemyId and ItemId)
/// at compile time while keeping the same underlying representation.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct EnemyIdTag {};
struct MinionIdTag {};
struct ItemIdTag {};

/// Identifier of an enemy; a corpse keeps the id of the enemy it came from.
using EnemyId = StrongId<EnemyIdTag>;

/// Identifier of a summoned or raised minion.
using MinionId = StrongId<MinionIdTag>;

/// Identifier of an item, on the grid or in the inventory.
using ItemId = StrongId<ItemIdTag>;

} // namespace sgc::foundation

template <typename Tag, typename T>
struct std::hash<sgc::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const sgc::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
