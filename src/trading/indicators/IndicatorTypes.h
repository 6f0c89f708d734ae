#pragma once

#include <optional>
#include <type_traits>

namespace trading
{
    // 지표 출력: 윈도우가 차기 전에는 ready=false
    template <typename T>
    struct Value final {
        static_assert(std::is_arithmetic_v<T>, "Value<T> holds arithmetic indicator outputs");

        bool ready{ false };
        T v{};

        [[nodiscard]] constexpr std::optional<T> asOptional() const noexcept {
            return ready ? std::optional<T>(v) : std::nullopt;
        }
    };

} // namespace trading
