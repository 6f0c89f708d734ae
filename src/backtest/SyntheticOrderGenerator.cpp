// src/backtest/SyntheticOrderGenerator.cpp

#include "SyntheticOrderGenerator.h"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace backtest
{
    SyntheticOrderGenerator::SyntheticOrderGenerator(std::uint64_t seed,
                                                     std::size_t max_orders,
                                                     std::size_t series_divisor)
        : rng_(seed)
        , max_orders_(max_orders)
        , series_divisor_(series_divisor)
    {
        if (series_divisor_ == 0)
            throw std::invalid_argument("SyntheticOrderGenerator: series_divisor must be > 0");
    }

    std::size_t SyntheticOrderGenerator::orderCount(std::size_t series_length) const noexcept
    {
        return std::min(max_orders_, series_length / series_divisor_);
    }

    std::vector<core::Order> SyntheticOrderGenerator::generate(const MarketSeries& series,
                                                               core::OrderId next_order_id)
    {
        const std::size_t count = orderCount(series.size());

        std::vector<core::Order> orders;
        orders.reserve(count);
        if (count == 0)
            return orders;

        std::uniform_int_distribution<std::size_t> pick_index(0, series.size() - 1);
        std::bernoulli_distribution pick_buy(0.5);

        for (std::size_t offset = 0; offset < count; ++offset)
        {
            const core::Candle& candle = series.at(pick_index(rng_));
            const core::OrderSide side = pick_buy(rng_) ? core::OrderSide::BUY : core::OrderSide::SELL;

            const core::Price price = selectPrice(side, candle);
            const core::Volume qty = selectQuantity(candle);

            core::Order o;
            o.id = next_order_id - static_cast<core::OrderId>(count) + static_cast<core::OrderId>(offset);
            o.client_order_id = makeClientOrderId(o.id);
            o.symbol = series.symbol();
            o.side = side;
            o.type = core::OrderType::Market;
            o.quantity = qty;
            o.stop_price = 0.0;
            o.status = core::OrderStatus::Filled;
            o.executed_qty = qty;
            o.cumulative_quote_qty = qty * price;
            o.created_at = candle.open_time;
            o.updated_at = candle.open_time;
            orders.push_back(std::move(o));
        }

        // 같은 시각이면 생성 순서 유지
        std::stable_sort(orders.begin(), orders.end(),
            [](const core::Order& a, const core::Order& b) { return a.created_at < b.created_at; });

        return orders;
    }

    core::Price SyntheticOrderGenerator::selectPrice(core::OrderSide side, const core::Candle& candle)
    {
        const double span = candle.high - candle.low;
        double adjustment = 0.0;
        if (span > 0)
        {
            std::uniform_real_distribution<double> dist(0.0, span * 0.3);
            adjustment = dist(rng_);
        }

        // 매수는 저가 근처, 매도는 고가 근처
        if (side == core::OrderSide::BUY)
            return candle.low + adjustment;
        return candle.high - adjustment;
    }

    core::Volume SyntheticOrderGenerator::selectQuantity(const core::Candle& candle)
    {
        const double cap = std::min(10.0, candle.volume * 0.01);

        // 거래량 0 캔들: 체결 주문 수량은 항상 양수여야 하므로 최소 수량으로
        if (!(cap > 0))
            return 0.1;

        const double lower = std::min(0.1, cap);
        if (lower >= cap)
            return cap;

        std::uniform_real_distribution<double> dist(lower, cap);
        return dist(rng_);
    }

    std::string SyntheticOrderGenerator::makeClientOrderId(core::OrderId id)
    {
        std::uniform_int_distribution<int> suffix(1000, 9999);

        char buf[48];
        std::snprintf(buf, sizeof(buf), "x-%08lld-%d", static_cast<long long>(id), suffix(rng_));
        return std::string(buf);
    }
}
