#pragma once

#include <cstddef>

#include "IndicatorTypes.h"
#include "RingBuffer.h"

namespace core { struct Candle; }

namespace trading::indicators
{
    /*
     * PriceChannel (Donchian)
     * - 최근 N개 캔들의 최고 high / 최저 low
     * - N개가 찰 때까지 ready=false
     * - 극값은 update마다 윈도우 전체를 다시 본다 (N이 작아서 O(N)으로 충분)
     */
    class PriceChannel final
    {
    public:
        PriceChannel() = default;
        explicit PriceChannel(std::size_t length) { reset(length); }

        void reset(std::size_t length);
        void clear() noexcept;

        [[nodiscard]] std::size_t length() const noexcept { return highs_.capacity(); }
        [[nodiscard]] std::size_t count() const noexcept { return highs_.size(); }

        void update(const core::Candle& c);

        [[nodiscard]] trading::Value<double> upper() const noexcept;
        [[nodiscard]] trading::Value<double> lower() const noexcept;

    private:
        RingBuffer<double> highs_{};
        RingBuffer<double> lows_{};
        double upper_{ 0.0 };
        double lower_{ 0.0 };
    };

} // namespace trading::indicators
