#include "BreakoutStopStrategy.h"

#include <cmath>
#include <stdexcept>
#include <utility>
#include <variant>

#include "util/Logger.h"

namespace trading::strategies {

    BreakoutStopStrategy::BreakoutStopStrategy(std::string symbol, Params p)
        : symbol_(std::move(symbol))
        , params_(p)
    {
        if (params_.channelLength == 0)
            throw std::invalid_argument("BreakoutStopStrategy: channelLength must be > 0");
        if (!(params_.riskPercent > 0.0 && params_.riskPercent <= 100.0))
            throw std::invalid_argument("BreakoutStopStrategy: riskPercent must be in (0, 100]");

        channel_.reset(params_.channelLength);
    }

    void BreakoutStopStrategy::init(api::IExchangeClient& exchange)
    {
        const auto info = exchange.getExchangeInfo();
        for (const auto& rules : info.symbols)
        {
            if (rules.symbol == symbol_)
                step_size_ = rules.step_size;
        }

        // 잔고 순서: base, quote
        const auto account = exchange.getAccount();
        if (account.balances.size() >= 2)
        {
            base_asset_ = account.balances[0].asset;
            quote_asset_ = account.balances[1].asset;
        }

        util::Logger::instance().info("[BreakoutStop] init ", symbol_, " base=", base_asset_,
            " quote=", quote_asset_, " step=", step_size_, " channel=", params_.channelLength);
    }

    bool BreakoutStopStrategy::isOpen(api::IExchangeClient& exchange, core::OrderId id) const
    {
        for (const auto& o : exchange.getOpenOrders(symbol_))
        {
            if (o.id == id)
                return true;
        }
        return false;
    }

    double BreakoutStopStrategy::roundDownToStep(double qty) const noexcept
    {
        if (step_size_ <= 0.0)
            return qty;
        return std::floor(qty / step_size_ + 1e-9) * step_size_;
    }

    core::OrderRequest BreakoutStopStrategy::makeStop(core::OrderSide side, double qty, double stop, std::string_view tag)
    {
        core::OrderRequest req;
        req.symbol = symbol_;
        req.side = side;
        req.type = core::OrderType::StopLoss;
        req.quantity = qty;
        req.stop_price = stop;
        req.client_order_id = "breakout-" + std::string(tag) + "-" + std::to_string(++seq_);
        return req;
    }

    void BreakoutStopStrategy::next(api::IExchangeClient& exchange, const core::Candle& candle)
    {
        switch (state_)
        {
        case State::Flat:
            maybeEnter(exchange, candle);
            break;

        case State::PendingEntry:
            if (!isOpen(exchange, *pending_id_))
            {
                // 직전 캔들에서 체결됨
                state_ = State::InPosition;
                pending_id_.reset();
                ++trades_;
                util::Logger::instance().info("[BreakoutStop] entry filled at ", entryPrice(),
                    " qty=", position_qty_);
                maybeExit(exchange, candle);
            }
            else if (++pending_age_ >= params_.entryTimeout)
            {
                exchange.cancelOrder(symbol_, pending_id_, std::nullopt);
                util::Logger::instance().debug("[BreakoutStop] entry timeout, canceled id=", *pending_id_);
                pending_id_.reset();
                entry_price_.reset();
                position_qty_ = 0.0;
                state_ = State::Flat;
                maybeEnter(exchange, candle);
            }
            break;

        case State::InPosition:
            maybeExit(exchange, candle);
            break;

        case State::PendingExit:
            if (!isOpen(exchange, *pending_id_))
            {
                util::Logger::instance().info("[BreakoutStop] exit filled, qty=", position_qty_);
                pending_id_.reset();
                entry_price_.reset();
                position_qty_ = 0.0;
                state_ = State::Flat;
                maybeEnter(exchange, candle);
            }
            break;
        }

        // 채널은 이번 캔들까지 반영 (다음 캔들의 기준)
        channel_.update(candle);
    }

    void BreakoutStopStrategy::maybeEnter(api::IExchangeClient& exchange, const core::Candle& candle)
    {
        const auto upper = channel_.upper();
        if (!upper.ready || upper.v <= candle.open)
            return;

        const auto account = exchange.getAccount();
        const auto quote = account.find(quote_asset_);
        if (!quote.has_value() || quote->free <= 0.0)
            return;

        const double budget = quote->free * (params_.riskPercent / 100.0);
        const double qty = roundDownToStep(budget / upper.v);
        if (qty <= 0.0)
            return;

        auto res = exchange.createOrder(makeStop(core::OrderSide::BUY, qty, upper.v, "entry"));
        if (std::holds_alternative<api::ExchangeError>(res))
        {
            ++rejects_;
            util::Logger::instance().debug("[BreakoutStop] entry rejected: ",
                api::errorMessage(std::get<api::ExchangeError>(res)));
            return;
        }

        const auto& order = std::get<core::Order>(res);
        pending_id_ = order.id;
        pending_age_ = 0;
        entry_price_ = order.stop_price;
        position_qty_ = order.quantity;
        state_ = State::PendingEntry;
    }

    void BreakoutStopStrategy::maybeExit(api::IExchangeClient& exchange, const core::Candle& candle)
    {
        const auto lower = channel_.lower();
        if (!lower.ready || lower.v >= candle.open)
            return;

        auto res = exchange.createOrder(makeStop(core::OrderSide::SELL, position_qty_, lower.v, "exit"));
        if (std::holds_alternative<api::ExchangeError>(res))
        {
            ++rejects_;
            util::Logger::instance().debug("[BreakoutStop] exit rejected: ",
                api::errorMessage(std::get<api::ExchangeError>(res)));
            return;
        }

        pending_id_ = std::get<core::Order>(res).id;
        state_ = State::PendingExit;
    }

} // namespace trading::strategies
