#pragma once

/// @file actions.hpp
/// @brief Player-facing actions as values, and the status of a request.

#include <cstdint>
#include <string_view>
#include <variant>

#include "sgc/game/entities.hpp"
#include "sgc/game/grid_types.hpp"
#include "sgc/game/spell_types.hpp"

namespace sgc::game {

struct MoveAction {
    Direction direction = Direction::Up;
    bool operator==(const MoveAction&) const = default;
};

struct DashAction {
    Direction direction = Direction::Up;
    bool operator==(const DashAction&) const = default;
};

struct UseItemAction {
    ItemId item;
    bool operator==(const UseItemAction&) const = default;
};

/// Focus and wait: pass the turn with the enlarged mana regeneration.
struct FocusAction {
    bool operator==(const FocusAction&) const = default;
};

struct CastSpellAction {
    Position target;
    bool operator==(const CastSpellAction&) const = default;
};

struct SelectElementAction {
    Element element = Element::Fire;
    bool operator==(const SelectElementAction&) const = default;
};

struct SelectShapeAction {
    SpellShape shape = SpellShape::Ball;
    bool operator==(const SelectShapeAction&) const = default;
};

struct RestartAction {
    bool operator==(const RestartAction&) const = default;
};

using Action = std::variant<MoveAction, DashAction, UseItemAction, FocusAction, CastSpellAction,
                            SelectElementAction, SelectShapeAction, RestartAction>;

/// Why a request did or did not change the snapshot.
enum class ActionStatus : uint8_t {
    Resolved,          ///< Effect applied and a full turn resolved.
    Applied,           ///< Effect applied without consuming a turn.
    NotPlaying,        ///< Battle is over; only restart is accepted.
    InsufficientMana,
    DashOnCooldown,
    ItemNotFound,
    InvalidTarget,     ///< Spell target outside the grid or unusable.
    Locked,            ///< Element or shape not unlocked yet.
};

constexpr std::string_view ActionStatusName(ActionStatus status) noexcept {
    switch (status) {
        case ActionStatus::Resolved:         return "Resolved";
        case ActionStatus::Applied:          return "Applied";
        case ActionStatus::NotPlaying:       return "NotPlaying";
        case ActionStatus::InsufficientMana: return "InsufficientMana";
        case ActionStatus::DashOnCooldown:   return "DashOnCooldown";
        case ActionStatus::ItemNotFound:     return "ItemNotFound";
        case ActionStatus::InvalidTarget:    return "InvalidTarget";
        case ActionStatus::Locked:           return "Locked";
    }
    return "Unknown";
}

/// True if the request left the snapshot untouched.
constexpr bool IsRejected(ActionStatus status) noexcept {
    return status != ActionStatus::Resolved && status != ActionStatus::Applied;
}

/// Short name of an action kind, for logs.
std::string_view ActionName(const Action& action) noexcept;

} // namespace sgc::game
