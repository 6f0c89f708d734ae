// backtest/SimExchange.cpp

#include "SimExchange.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

#include "util/Logger.h"

namespace backtest
{
    namespace
    {
        // 거래소 심볼은 대문자 ("adausdc" -> "ADAUSDC")
        std::string toUpper(std::string_view s)
        {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return out;
        }

        bool isPositiveFinite(double v) noexcept
        {
            return std::isfinite(v) && v > 0.0;
        }
    }

    SimExchange::SimExchange(Ledger& ledger,
                             const MarketSeries& series,
                             const api::ISymbolResolver& resolver,
                             const api::IKlineStore& klines,
                             SimExchangeOptions options)
        : ledger_(ledger)
        , series_(series)
        , resolver_(resolver)
        , klines_(klines)
        , instrument_(resolver.resolve(series.symbol()))
        , rules_(std::move(options.rules))
        , cursor_(series.cursorAt(0))
        , history_(options.history.max_orders, options.history.window_ms)
        , synthetic_gen_(options.synthetic.seed, options.synthetic.max_orders, options.synthetic.series_divisor)
        , balance_epsilon_(options.balance_epsilon)
    {
        if (rules_.symbol.empty())
            rules_.symbol = series_.symbol();
    }

    // ========== 커서 ==========

    void SimExchange::setCursor(std::size_t index)
    {
        cursor_ = series_.cursorAt(index);
    }

    void SimExchange::seekTo(core::TimestampMs open_time)
    {
        auto found = series_.findCursor(open_time);
        if (!found.has_value())
        {
            throw std::out_of_range("SimExchange: no candle at open_time " + std::to_string(open_time)
                + " for " + series_.symbol());
        }
        cursor_ = *found;
    }

    // ========== 주문 접수 ==========

    api::ExchangeResult<core::Order> SimExchange::createOrder(const core::OrderRequest& req)
    {
        const std::string symbol = toUpper(req.symbol);

        // 1) 주문 타입: 스탑 트리거만
        if (req.type != core::OrderType::StopLoss)
        {
            util::Logger::instance().warn("[SimExchange] reject ", core::to_string(req.type),
                " order for ", symbol, ": unsupported type");
            return api::ExchangeError{ api::UnsupportedOrderType{ symbol, req.type } };
        }

        // 2) 파라미터 검증
        if (!isPositiveFinite(req.quantity))
            return api::ExchangeError{ api::InvalidOrder{ "quantity", "must be a positive number" } };
        if (!isPositiveFinite(req.stop_price))
            return api::ExchangeError{ api::InvalidOrder{ "stopPrice", "must be a positive number" } };
        if (symbol != series_.symbol())
        {
            return api::ExchangeError{ api::InvalidOrder{ "symbol",
                symbol + " is not traded in this session (" + series_.symbol() + ")" } };
        }

        // 3) 현재 캔들 시가 기준 즉시 트리거 여부 (실거래소도 같은 주문을 거부)
        const core::Price open = currentCandle().open;
        const bool would_trigger =
            (req.side == core::OrderSide::BUY && req.stop_price <= open) ||
            (req.side == core::OrderSide::SELL && req.stop_price >= open);
        if (would_trigger)
        {
            util::Logger::instance().info("[SimExchange] reject ", core::to_string(req.side), " ", symbol,
                " stop=", req.stop_price, " open=", open, ": would trigger immediately");
            return api::ExchangeError{ api::ImmediateTrigger{ symbol, req.side, req.stop_price, open } };
        }

        // 4) 예약 계산: BUY는 quote(q * stop), SELL은 base(q)
        const core::Instrument inst = resolver_.resolve(symbol);

        PendingOrder pending;
        if (req.side == core::OrderSide::BUY)
        {
            pending.reserved_asset = inst.quote;
            pending.reserved_amount = req.quantity * req.stop_price;
        }
        else
        {
            pending.reserved_asset = inst.base;
            pending.reserved_amount = req.quantity;
        }

        const core::Amount free_amount = totalFor(inst, pending.reserved_asset) - locked(pending.reserved_asset);
        if (free_amount + balance_epsilon_ < pending.reserved_amount)
        {
            util::Logger::instance().info("[SimExchange] reject ", core::to_string(req.side), " ", symbol,
                ": insufficient ", pending.reserved_asset,
                " required=", pending.reserved_amount, " free=", free_amount);
            return api::ExchangeError{ api::InsufficientBalance{
                symbol, req.side, pending.reserved_asset, pending.reserved_amount, free_amount } };
        }

        // 5) 주문 등록 = 예약 생성 (locked는 pending_에서 계산)
        core::Order& order = pending.order;
        order.id = next_order_id_++;
        order.client_order_id = req.client_order_id;
        order.symbol = symbol;
        order.side = req.side;
        order.type = req.type;
        order.quantity = req.quantity;
        order.stop_price = req.stop_price;
        order.status = core::OrderStatus::New;
        order.created_at = cursor_.open_time;
        order.updated_at = cursor_.open_time;

        util::Logger::instance().info("[SimExchange] order placed id=", order.id, " ",
            core::to_string(order.side), " ", symbol, " qty=", order.quantity,
            " stop=", order.stop_price, " locked ", pending.reserved_asset, "=", pending.reserved_amount);

        core::Order result = order;
        pending_.push_back(std::move(pending));
        return result;
    }

    // ========== 체결 ==========

    bool SimExchange::isTriggered(const core::Order& order, const core::Candle& candle) noexcept
    {
        if (order.side == core::OrderSide::BUY)
            return candle.high >= order.stop_price;
        return candle.low <= order.stop_price;
    }

    std::vector<core::Order> SimExchange::evaluatePendingOrders()
    {
        const core::Candle& candle = currentCandle();

        std::vector<core::Order> filled;

        // 접수 순서대로 판단, 체결된 주문은 즉시 목록에서 제거 (제거 후 같은 인덱스 재검사)
        // settleFill이 던지면 그 주문부터 뒤는 그대로 남고, 앞서 체결된 주문은 이미 빠져 있다
        std::size_t i = 0;
        while (i < pending_.size())
        {
            if (!isTriggered(pending_[i].order, candle))
            {
                ++i;
                continue;
            }

            core::Order done = settleFill(pending_[i]);
            pending_.erase(pending_.begin() + static_cast<std::ptrdiff_t>(i));
            filled.push_back(std::move(done));
        }
        return filled;
    }

    core::Order SimExchange::settleFill(const PendingOrder& pending)
    {
        core::Order order = pending.order;
        const core::Price fill_price = order.stop_price;

        const bool applied = (order.side == core::OrderSide::BUY)
            ? ledger_.applyBuy(order.symbol, order.quantity, fill_price, Commission::Waived)
            : ledger_.applySell(order.symbol, order.quantity, fill_price, Commission::Waived);

        // 예약이 잔고를 보장하므로 여기서 거부되면 장부가 외부에서 변경된 것
        if (!applied)
        {
            util::Logger::instance().error("[SimExchange] ledger refused reserved fill id=", order.id);
            throw std::logic_error("SimExchange: ledger refused fill for reserved order "
                + std::to_string(order.id));
        }

        order.status = core::OrderStatus::Filled;
        order.executed_qty = order.quantity;
        order.cumulative_quote_qty = order.quantity * fill_price;
        order.updated_at = cursor_.open_time;

        history_.record(order);

        util::Logger::instance().info("[SimExchange] order filled id=", order.id, " ",
            core::to_string(order.side), " ", order.symbol, " qty=", order.quantity,
            " price=", fill_price, " at ", order.updated_at);

        return order;
    }

    // ========== 취소 ==========

    core::Order SimExchange::cancelOrder(std::string_view symbol,
                                         const std::optional<core::OrderId>& order_id,
                                         const std::optional<std::string>& client_order_id)
    {
        const std::string sym = toUpper(symbol);

        auto it = std::find_if(pending_.begin(), pending_.end(), [&](const PendingOrder& p) {
            if (order_id.has_value() && p.order.id == *order_id)
                return true;
            return client_order_id.has_value() && p.order.client_order_id == client_order_id;
        });

        if (it == pending_.end())
        {
            // 없는 주문/이미 종결된 주문: 상태 변경 없이 합성 CANCELED 응답
            util::Logger::instance().debug("[SimExchange] cancel no-op for ", sym,
                " orderId=", order_id.value_or(0), " clientOrderId=", client_order_id.value_or(""));

            core::Order synthetic;
            synthetic.id = order_id.value_or(0);
            synthetic.client_order_id = client_order_id;
            synthetic.symbol = sym;
            synthetic.side = core::OrderSide::BUY;
            synthetic.type = core::OrderType::StopLoss;
            synthetic.status = core::OrderStatus::Canceled;
            synthetic.created_at = cursor_.open_time;
            synthetic.updated_at = cursor_.open_time;
            return synthetic;
        }

        core::Order canceled = it->order;
        pending_.erase(it);

        canceled.status = core::OrderStatus::Canceled;
        canceled.updated_at = cursor_.open_time;

        util::Logger::instance().info("[SimExchange] order canceled id=", canceled.id, " ",
            core::to_string(canceled.side), " ", canceled.symbol);
        return canceled;
    }

    // ========== 조회 ==========

    std::vector<core::Order> SimExchange::getOpenOrders(const std::optional<std::string>& symbol) const
    {
        std::optional<std::string> filter;
        if (symbol.has_value() && !symbol->empty())
            filter = toUpper(*symbol);

        std::vector<core::Order> result;
        result.reserve(pending_.size());
        for (const auto& p : pending_)
        {
            if (filter.has_value() && p.order.symbol != *filter)
                continue;
            result.push_back(p.order);
        }
        return result;
    }

    api::ExchangeResult<std::vector<core::Order>>
    SimExchange::getAllOrders(const api::OrderHistoryQuery& q) const
    {
        if (q.limit.has_value() && *q.limit < 0)
            return api::ExchangeError{ api::InvalidQuery{ "limit", "must be non-negative" } };

        const OrderHistory::Sequence& source = (q.symbol.has_value() && !q.symbol->empty())
            ? history_.bySymbol(toUpper(*q.symbol))
            : history_.all();

        std::vector<core::Order> result;
        if (q.limit.has_value() && *q.limit == 0)
            return result;

        for (const auto& order : source)
        {
            if (q.from_order_id.has_value() && order.id < *q.from_order_id)
                continue;

            result.push_back(order);
            if (q.limit.has_value() && static_cast<std::int64_t>(result.size()) >= *q.limit)
                break;
        }
        return result;
    }

    core::AccountSnapshot SimExchange::getAccount() const
    {
        core::AccountSnapshot snap;
        for (const std::string* asset : { &instrument_.base, &instrument_.quote })
        {
            const core::Amount lk = locked(*asset);
            snap.balances.push_back(core::AssetBalance{ *asset, totalFor(instrument_, *asset) - lk, lk });
        }
        return snap;
    }

    core::Ticker SimExchange::getSymbolTicker(std::string_view symbol) const
    {
        return core::Ticker{ toUpper(symbol), currentCandle().close };
    }

    core::ExchangeInfo SimExchange::getExchangeInfo() const
    {
        return core::ExchangeInfo{ { rules_ } };
    }

    // ========== kline 패스스루 ==========

    api::ExchangeResult<std::vector<core::Candle>> SimExchange::getKlines(const api::KlineQuery& q) const
    {
        if (q.symbol.empty())
            return api::ExchangeError{ api::InvalidQuery{ "symbol", "symbol is required" } };
        if (q.timeframe.empty())
            return api::ExchangeError{ api::InvalidQuery{ "interval", "interval is required" } };
        if (q.start_time.has_value() && q.end_time.has_value() && *q.start_time > *q.end_time)
            return api::ExchangeError{ api::InvalidQuery{ "startTime", "startTime must be <= endTime" } };

        // limit <= 0은 빈 결과 (다른 의미로 재해석하지 않음)
        if (q.limit.has_value() && *q.limit <= 0)
            return std::vector<core::Candle>{};

        api::KlineSelect sel;
        sel.symbol = toUpper(q.symbol);
        sel.timeframe = q.timeframe;
        sel.end_time = q.end_time;
        sel.limit = q.limit;

        std::vector<core::Candle> rows;
        if (!q.start_time.has_value())
        {
            // 최신 N개: end_time 이전(또는 전체)에서 내림차순으로 N개 -> 오름차순으로 뒤집기
            sel.order = api::SortOrder::Descending;
            rows = klines_.select(sel);
            std::reverse(rows.begin(), rows.end());
        }
        else
        {
            // start_time부터 오름차순, end_time까지, 최대 N개
            sel.start_time = q.start_time;
            sel.order = api::SortOrder::Ascending;
            rows = klines_.select(sel);
        }

        // 저장소가 순서를 어기면 조용히 정렬하지 않고 실패
        for (std::size_t i = 1; i < rows.size(); ++i)
        {
            if (rows[i].open_time <= rows[i - 1].open_time)
            {
                throw std::runtime_error("SimExchange: kline store returned rows out of order for "
                    + sel.symbol + " " + sel.timeframe);
            }
        }
        return rows;
    }

    // ========== 가상 과거 주문 ==========

    const std::vector<core::Order>& SimExchange::generateSyntheticHistory()
    {
        synthetic_orders_ = synthetic_gen_.generate(series_, next_order_id_);
        util::Logger::instance().info("[SimExchange] generated ", synthetic_orders_.size(),
            " synthetic historical orders for ", series_.symbol());
        return synthetic_orders_;
    }

    // ========== 잔고 ==========

    core::Amount SimExchange::locked(std::string_view asset) const
    {
        // NEW 주문이 없으면 정확히 0 (누적 합/차감으로 생기는 잔차 없음)
        core::Amount sum = 0.0;
        for (const auto& p : pending_)
        {
            if (p.reserved_asset == asset)
                sum += p.reserved_amount;
        }
        return sum;
    }

    core::Amount SimExchange::total(std::string_view asset) const
    {
        return totalFor(instrument_, asset);
    }

    core::Amount SimExchange::totalFor(const core::Instrument& inst, std::string_view asset) const
    {
        // Ledger 포지션은 심볼 기준으로 기록된다
        if (asset == inst.quote)
            return ledger_.cash();
        if (asset == inst.base)
            return ledger_.position(inst.symbol);
        return 0.0;
    }
}
