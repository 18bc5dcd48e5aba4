// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FSE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <type_traits>

namespace FSE {

/**
 * @brief Opaque identifier of a state within one StateMachine
 *
 * Integer-backed so it can key ordered and hashed containers without
 * reflection. Any enumeration converts implicitly, which lets hosts keep
 * their own `enum class Move { Idle, Run, Jump }` vocabulary:
 *
 * @code
 * machine.addState(Move::Idle);
 * if (machine.getCurrentStateId().as<Move>() == Move::Run) { ... }
 * @endcode
 */
class StateId {
public:
    using ValueType = std::uint32_t;

    constexpr explicit StateId(ValueType value) : value_(value) {}

    template <typename Enum, typename = std::enable_if_t<std::is_enum_v<Enum>>>
    constexpr StateId(Enum value) : value_(static_cast<ValueType>(value)) {}

    constexpr ValueType value() const {
        return value_;
    }

    template <typename Enum> constexpr Enum as() const {
        static_assert(std::is_enum_v<Enum>, "StateId::as requires an enumeration type");
        return static_cast<Enum>(value_);
    }

    constexpr auto operator<=>(const StateId &) const = default;

private:
    ValueType value_;
};

inline std::ostream &operator<<(std::ostream &os, const StateId &id) {
    return os << '#' << id.value();
}

}  // namespace FSE

template <> struct std::hash<FSE::StateId> {
    std::size_t operator()(const FSE::StateId &id) const noexcept {
        return std::hash<FSE::StateId::ValueType>{}(id.value());
    }
};
