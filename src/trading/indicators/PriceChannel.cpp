#include "PriceChannel.h"

#include <algorithm>

#include "core/domain/Candle.h"

namespace trading::indicators
{
    void PriceChannel::reset(std::size_t length)
    {
        highs_.reset(length);
        lows_.reset(length);
        upper_ = 0.0;
        lower_ = 0.0;
    }

    void PriceChannel::clear() noexcept
    {
        highs_.clear();
        lows_.clear();
        upper_ = 0.0;
        lower_ = 0.0;
    }

    void PriceChannel::update(const core::Candle& c)
    {
        if (highs_.capacity() == 0)
            return;

        highs_.push(c.high);
        lows_.push(c.low);

        upper_ = highs_.at(0);
        lower_ = lows_.at(0);
        for (std::size_t i = 1; i < highs_.size(); ++i)
        {
            upper_ = std::max(upper_, highs_.at(i));
            lower_ = std::min(lower_, lows_.at(i));
        }
    }

    trading::Value<double> PriceChannel::upper() const noexcept
    {
        trading::Value<double> out{};
        out.ready = highs_.full();
        out.v = out.ready ? upper_ : 0.0;
        return out;
    }

    trading::Value<double> PriceChannel::lower() const noexcept
    {
        trading::Value<double> out{};
        out.ready = lows_.full();
        out.v = out.ready ? lower_ : 0.0;
        return out;
    }

} // namespace trading::indicators
