//
// healthd - Core Types
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef HEALTHD_CORE_TYPES_H
#define HEALTHD_CORE_TYPES_H

#include <compare>
#include <cstdint>
#include <utility>

namespace healthd {

    //
    // Strong type wrapper using CRTP for zero-cost abstraction.
    // Prevents accidental mixing of semantically different types.
    //
    // Example:
    //   using Port = StrongType<struct PortTag, std::uint16_t>;
    //   Port port{8081};
    //
    template<typename Tag, typename T>
    struct StrongType {
        T value;

        constexpr StrongType() = default;
        explicit constexpr StrongType(T v) : value(std::move(v)) {}

        [[nodiscard]] constexpr auto operator*() const -> T const& { return value; }
        [[nodiscard]] constexpr auto operator*() -> T& { return value; }

        auto operator<=>(StrongType const&) const = default;
    };

    // TCP port number (0 = let the kernel choose)
    using Port = StrongType<struct PortTag, std::uint16_t>;

    //
    // HTTP status codes produced by the application.
    //
    enum class HttpStatus : int {
        ok = 200,
        not_found = 404
    };

    [[nodiscard]] constexpr auto to_int(HttpStatus status) -> int {
        return static_cast<int>(status);
    }

}  // namespace healthd

#endif  // HEALTHD_CORE_TYPES_H
