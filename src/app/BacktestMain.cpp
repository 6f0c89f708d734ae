// app/BacktestMain.cpp
//
// 사용 예)
//   coinsim_backtest config/backtest.json
//   coinsim_backtest                        (기본 설정)
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>

#include "api/ExchangeError.h"
#include "api/StaticSymbolResolver.h"
#include "api/sqlite/SqliteKlineStore.h"
#include "backtest/BacktestRunner.h"
#include "backtest/Ledger.h"
#include "backtest/SimExchange.h"
#include "trading/strategies/BreakoutStopStrategy.h"
#include "util/Config.h"
#include "util/Logger.h"

int main(int argc, char** argv)
{
    // ---- 설정 ----
    util::AppConfig cfg;
    try
    {
        if (argc > 1)
            cfg = util::loadConfig(argv[1]);
        util::applyLogConfig(cfg.log);
    }
    catch (const std::exception& e)
    {
        std::cerr << "[Fatal] config: " << e.what() << "\n";
        return 2;
    }

    try
    {
        // ---- 저장소 / 시계열 ----
        api::sqlite::SqliteKlineStore store(cfg.store.sqlite_path);

        const backtest::MarketSeries series = backtest::loadSeries(
            store, cfg.backtest.symbol, cfg.backtest.timeframe, cfg.backtest.start_ts, cfg.backtest.end_ts);

        // ---- 장부 / 거래소 ----
        backtest::Ledger ledger(cfg.backtest.initial_cash, cfg.backtest.commission_rate);
        api::StaticSymbolResolver resolver(cfg.symbols);

        backtest::SimExchangeOptions opt;
        opt.history = cfg.history;
        opt.synthetic = cfg.synthetic;
        opt.rules = cfg.rules;
        opt.balance_epsilon = cfg.backtest.balance_epsilon;

        backtest::SimExchange exchange(ledger, series, resolver, store, opt);

        const auto& seeded = exchange.generateSyntheticHistory();
        util::Logger::instance().info("[Main] synthetic history orders=", seeded.size());

        // ---- 전략 ----
        trading::strategies::BreakoutStopStrategy::Params sp{};
        trading::strategies::BreakoutStopStrategy strategy(series.symbol(), sp);

        backtest::BacktestRunner runner(exchange, series, ledger);
        const backtest::RunReport report = runner.run(strategy);

        // ---- 리포트 (stdout) ----
        const double pnl = report.final_value - ledger.initialCash();
        std::cout << std::fixed << std::setprecision(4)
            << "symbol       : " << series.symbol() << " " << series.timeframe() << "\n"
            << "candles      : " << report.candles << "\n"
            << "fills        : " << report.fills.size() << "\n"
            << "entries      : " << strategy.tradeCount() << "\n"
            << "open orders  : " << exchange.pendingCount() << "\n"
            << "initial cash : " << ledger.initialCash() << "\n"
            << "final value  : " << report.final_value << "\n"
            << "pnl          : " << pnl << "\n";
    }
    catch (const std::exception& e)
    {
        util::Logger::instance().error("[Main] backtest aborted: ", e.what());
        return 1;
    }

    return 0;
}
