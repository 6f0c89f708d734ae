// src/backtest/BacktestRunner.cpp

#include "BacktestRunner.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "util/Logger.h"

namespace backtest
{
    BacktestRunner::BacktestRunner(SimExchange& exchange, const MarketSeries& series, const Ledger& ledger)
        : exchange_(exchange)
        , series_(series)
        , ledger_(ledger)
    {
    }

    RunReport BacktestRunner::run(IStrategy& strategy)
    {
        util::Logger::instance().info("[BacktestRunner] start ", series_.symbol(), " ", series_.timeframe(),
            " candles=", series_.size(), " cash=", ledger_.cash());

        RunReport report;

        exchange_.setCursor(0);
        strategy.init(exchange_);

        for (std::size_t i = 0; i < series_.size(); ++i)
        {
            exchange_.setCursor(i);
            strategy.next(exchange_, series_.at(i));

            auto filled = exchange_.evaluatePendingOrders();
            for (auto& o : filled)
                report.fills.push_back(std::move(o));

            ++report.candles;
        }

        Ledger::PriceMap last_prices;
        last_prices.emplace(series_.symbol(), series_.back().close);
        report.final_value = ledger_.portfolioValue(last_prices);

        util::Logger::instance().info("[BacktestRunner] done candles=", report.candles,
            " fills=", report.fills.size(), " final_value=", report.final_value);

        return report;
    }

    MarketSeries loadSeries(const api::IKlineStore& store,
                            const std::string& symbol,
                            const std::string& timeframe,
                            std::optional<core::TimestampMs> start_ts,
                            std::optional<core::TimestampMs> end_ts)
    {
        // 저장소/거래소/심볼 테이블 모두 대문자 심볼 기준
        std::string upper(symbol);
        std::transform(upper.begin(), upper.end(), upper.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        api::KlineSelect sel;
        sel.symbol = upper;
        sel.timeframe = timeframe;
        sel.start_time = start_ts;
        sel.end_time = end_ts;
        sel.limit = std::nullopt;
        sel.order = api::SortOrder::Ascending;

        auto candles = store.select(sel);
        if (candles.empty())
        {
            util::Logger::instance().error("[BacktestRunner] no candles for ", upper, " ", timeframe);
            throw std::runtime_error("no candles for " + upper + " " + timeframe);
        }

        return MarketSeries(upper, timeframe, std::move(candles));
    }
}
