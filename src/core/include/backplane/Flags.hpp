// Copyright © 2025 Robert Smallshire <robert@smallshire.org.uk>
//
// This file is part of Backplane.
//
// Backplane is free software: you can redistribute it and/or modify it under the terms of the
// GNU General Public License as published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version. Backplane is distributed in the hope that it will
// be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
// You should have received a copy of the GNU General Public License along with Backplane.
// If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include <concepts>
#include <type_traits>

namespace backplane {

// Opt-in trait for scoped enums used as bit sets.
// Specialize to std::true_type to enable |, &, ~ and has_flag().
template<typename E>
struct EnableFlagOperators : std::false_type {};

template<typename E>
concept FlagEnum = std::is_enum_v<E> && EnableFlagOperators<E>::value;

template<FlagEnum E>
constexpr E operator|(E a, E b) {
    using U = std::underlying_type_t<E>;
    return static_cast<E>(static_cast<U>(a) | static_cast<U>(b));
}

template<FlagEnum E>
constexpr E operator&(E a, E b) {
    using U = std::underlying_type_t<E>;
    return static_cast<E>(static_cast<U>(a) & static_cast<U>(b));
}

template<FlagEnum E>
constexpr E operator~(E a) {
    using U = std::underlying_type_t<E>;
    return static_cast<E>(static_cast<U>(~static_cast<U>(a)));
}

template<FlagEnum E>
constexpr E& operator|=(E& a, E b) {
    a = a | b;
    return a;
}

template<FlagEnum E>
constexpr E& operator&=(E& a, E b) {
    a = a & b;
    return a;
}

// True if any bit of flag is set in flags
template<FlagEnum E>
constexpr bool has_flag(E flags, E flag) {
    using U = std::underlying_type_t<E>;
    return (static_cast<U>(flags) & static_cast<U>(flag)) != 0;
}

// True if every bit of required is set in flags
template<FlagEnum E>
constexpr bool has_all(E flags, E required) {
    using U = std::underlying_type_t<E>;
    return (static_cast<U>(flags) & static_cast<U>(required)) == static_cast<U>(required);
}

} // namespace backplane
