// tests/test_backtest_runner.cpp
//
// BacktestRunner / loadSeries / BreakoutStopStrategy 테스트
// - 러너 루프 순서 (cursor -> next -> evaluate)
// - 저장소 로드 (빈 결과 실패)
// - 돌파 전략 상태 머신 (진입 -> 청산 -> 재진입, 진입 타임아웃)

#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "test_utils.h"
#include "fixtures/MarketFixture.h"
#include "backtest/BacktestRunner.h"
#include "backtest/IStrategy.h"
#include "core/domain/OrderRequest.h"
#include "trading/indicators/PriceChannel.h"
#include "trading/strategies/BreakoutStopStrategy.h"

using namespace backtest;
using trading::strategies::BreakoutStopStrategy;

namespace test {

    // 첫 캔들에서 BUY 스탑 1개를 내고 호출 기록만 남기는 전략
    class ScriptedStrategy final : public IStrategy {
    public:
        void init(api::IExchangeClient& exchange) override {
            ++init_calls;
            init_cash = exchange.getAccount().find("USDC")->free;
        }

        void next(api::IExchangeClient& exchange, const core::Candle& candle) override {
            seen.push_back(candle.open_time);
            open_at_next.push_back(exchange.getOpenOrders(std::nullopt).size());

            if (seen.size() == 1) {
                core::OrderRequest req;
                req.symbol = "ADAUSDC";
                req.side = core::OrderSide::BUY;
                req.quantity = 10.0;
                req.stop_price = 5.0;
                placed = std::holds_alternative<core::Order>(exchange.createOrder(req));
            }
        }

        int init_calls{ 0 };
        double init_cash{ 0.0 };
        bool placed{ false };
        std::vector<core::TimestampMs> seen;
        std::vector<std::size_t> open_at_next;
    };

    // ========== 러너 ==========

    void testRunnerDrivesEveryCandle() {
        SimSession s(100.0);
        ScriptedStrategy strategy;

        BacktestRunner runner(s.exchange, s.series, s.ledger);
        const RunReport report = runner.run(strategy);

        TEST_ASSERT_EQ(strategy.init_calls, 1);
        TEST_ASSERT_DOUBLE_EQ(strategy.init_cash, 100.0);
        TEST_ASSERT(strategy.placed);
        TEST_ASSERT_EQ(strategy.seen.size(), static_cast<std::size_t>(3));
        TEST_ASSERT_EQ(strategy.seen[0], kT0);
        TEST_ASSERT_EQ(strategy.seen[2], kT0 + 2 * kMinute);

        // candle 0에서 접수, candle 1 평가에서 체결
        TEST_ASSERT_EQ(strategy.open_at_next[1], static_cast<std::size_t>(1));
        TEST_ASSERT_EQ(strategy.open_at_next[2], static_cast<std::size_t>(0));

        TEST_ASSERT_EQ(report.candles, static_cast<std::size_t>(3));
        TEST_ASSERT_EQ(report.fills.size(), static_cast<std::size_t>(1));
        TEST_ASSERT_EQ(report.fills[0].updated_at, kT0 + kMinute);

        // 50 현금 + 10 * 6.1 (마지막 종가)
        TEST_ASSERT_DOUBLE_EQ(report.final_value, 111.0);
    }

    void testLoadSeries() {
        MockKlineStore store;
        store.setCandles("ADAUSDC", "1m", risingCandles(20));

        const MarketSeries all = loadSeries(store, "ADAUSDC", "1m");
        TEST_ASSERT_EQ(all.size(), static_cast<std::size_t>(20));
        TEST_ASSERT(store.lastSelect().order == api::SortOrder::Ascending);
        TEST_ASSERT(!store.lastSelect().limit.has_value());

        const MarketSeries part = loadSeries(store, "ADAUSDC", "1m", kT0 + 5 * kMinute, kT0 + 9 * kMinute);
        TEST_ASSERT_EQ(part.size(), static_cast<std::size_t>(5));
        TEST_ASSERT_EQ(part.front().open_time, kT0 + 5 * kMinute);

        TEST_ASSERT_THROWS(loadSeries(store, "BTCUSDC", "1m"), std::runtime_error);
    }

    // 설정에 소문자 심볼이 들어와도 대문자 시계열로 로드되어 주문이 받아진다
    void testLoadSeriesUppercasesSymbol() {
        MockKlineStore store;
        store.setCandles("ADAUSDC", "1m", threeCandles());

        const MarketSeries series = loadSeries(store, "adaUsdc", "1m");
        TEST_ASSERT_EQ(series.symbol(), std::string("ADAUSDC"));
        TEST_ASSERT_EQ(store.lastSelect().symbol, std::string("ADAUSDC"));

        Ledger ledger(100.0);
        api::StaticSymbolResolver resolver;
        resolver.add(core::Instrument{ "ADAUSDC", "ADA", "USDC" });
        SimExchange exchange(ledger, series, resolver, store);

        core::OrderRequest req;
        req.symbol = "adausdc";
        req.side = core::OrderSide::BUY;
        req.type = core::OrderType::StopLoss;
        req.quantity = 1.0;
        req.stop_price = 5.0;
        const auto placed = exchange.createOrder(req);
        TEST_ASSERT(std::holds_alternative<core::Order>(placed));
        TEST_ASSERT_EQ(std::get<core::Order>(placed).symbol, std::string("ADAUSDC"));
    }

    void testSeriesRejectsBadInput() {
        TEST_ASSERT_THROWS(MarketSeries("ADAUSDC", "1m", {}), std::invalid_argument);
        TEST_ASSERT_THROWS(MarketSeries("", "1m", threeCandles()), std::invalid_argument);

        auto dup = threeCandles();
        dup[2].open_time = dup[1].open_time;
        TEST_ASSERT_THROWS(MarketSeries("ADAUSDC", "1m", dup), std::invalid_argument);
    }

    // ========== 지표 ==========

    void testPriceChannel() {
        trading::indicators::PriceChannel ch(3);
        TEST_ASSERT(!ch.upper().ready);

        ch.update(makeCandle(kT0, 1.0, 1.2, 0.8, 1.0));
        ch.update(makeCandle(kT0 + kMinute, 1.0, 1.5, 0.9, 1.0));
        TEST_ASSERT(!ch.lower().ready);

        ch.update(makeCandle(kT0 + 2 * kMinute, 1.0, 1.1, 0.7, 1.0));
        TEST_ASSERT(ch.upper().ready);
        TEST_ASSERT_DOUBLE_EQ(ch.upper().v, 1.5);
        TEST_ASSERT_DOUBLE_EQ(ch.lower().v, 0.7);

        // 가장 오래된 캔들(1.2 / 0.8)이 빠져도 극값 유지, 1.5가 빠지면 갱신
        ch.update(makeCandle(kT0 + 3 * kMinute, 1.0, 1.0, 0.95, 1.0));
        TEST_ASSERT_DOUBLE_EQ(ch.upper().v, 1.5);
        ch.update(makeCandle(kT0 + 4 * kMinute, 1.0, 1.0, 0.95, 1.0));
        TEST_ASSERT_DOUBLE_EQ(ch.upper().v, 1.1);
        TEST_ASSERT_DOUBLE_EQ(ch.lower().v, 0.7);
    }

    // ========== 돌파 전략 ==========

    std::vector<core::Candle> breakoutCandles() {
        return {
            makeCandle(kT0,               1.00, 1.10, 0.90, 1.00),
            makeCandle(kT0 + 1 * kMinute, 1.00, 1.10, 0.90, 1.00),
            makeCandle(kT0 + 2 * kMinute, 1.00, 1.10, 0.90, 1.00),
            makeCandle(kT0 + 3 * kMinute, 1.00, 1.30, 0.95, 1.25),     // 1.1 돌파 -> 진입 체결
            makeCandle(kT0 + 4 * kMinute, 1.25, 1.30, 1.20, 1.25),     // 0.9 청산 스탑 접수
            makeCandle(kT0 + 5 * kMinute, 1.00, 1.00, 0.80, 0.85),     // 0.9 이탈 -> 청산 체결
            makeCandle(kT0 + 6 * kMinute, 1.00, 1.05, 0.95, 1.00),     // 1.3 재진입 스탑 대기
        };
    }

    void testBreakoutRoundTrip() {
        SimSession s(1000.0, {}, breakoutCandles());

        BreakoutStopStrategy::Params p{};
        p.channelLength = 3;
        p.riskPercent = 50.0;
        BreakoutStopStrategy strategy("ADAUSDC", p);

        BacktestRunner runner(s.exchange, s.series, s.ledger);
        const RunReport report = runner.run(strategy);

        TEST_ASSERT_EQ(report.fills.size(), static_cast<std::size_t>(2));
        TEST_ASSERT(report.fills[0].side == core::OrderSide::BUY);
        TEST_ASSERT_DOUBLE_EQ(report.fills[0].stop_price, 1.1);
        TEST_ASSERT_DOUBLE_EQ(report.fills[0].quantity, 454.5);
        TEST_ASSERT(report.fills[1].side == core::OrderSide::SELL);
        TEST_ASSERT_DOUBLE_EQ(report.fills[1].stop_price, 0.9);

        // 1000 - 454.5 * 1.1 + 454.5 * 0.9
        TEST_ASSERT_DOUBLE_EQ(s.ledger.cash(), 909.1);
        TEST_ASSERT_DOUBLE_EQ(s.ledger.position("ADAUSDC"), 0.0);

        TEST_ASSERT_EQ(strategy.tradeCount(), static_cast<std::size_t>(1));
        TEST_ASSERT(strategy.state() == BreakoutStopStrategy::State::PendingEntry);
        TEST_ASSERT_EQ(s.exchange.pendingCount(), static_cast<std::size_t>(1));
        TEST_ASSERT_DOUBLE_EQ(s.exchange.getOpenOrders(std::nullopt)[0].stop_price, 1.3);
        TEST_ASSERT_DOUBLE_EQ(report.final_value, 909.1);
    }

    // 진입 스탑이 안 걸리면 timeout 후 취소하고 다시 낸다
    void testBreakoutEntryTimeout() {
        std::vector<core::Candle> candles;
        for (int i = 0; i < 3; ++i)
            candles.push_back(makeCandle(kT0 + i * kMinute, 1.00, 1.10, 0.90, 1.00));
        for (int i = 3; i < 6; ++i)
            candles.push_back(makeCandle(kT0 + i * kMinute, 1.00, 1.05, 0.95, 1.00));

        SimSession s(1000.0, {}, candles);

        BreakoutStopStrategy::Params p{};
        p.channelLength = 3;
        p.riskPercent = 10.0;
        p.entryTimeout = 2;
        BreakoutStopStrategy strategy("ADAUSDC", p);

        BacktestRunner runner(s.exchange, s.series, s.ledger);
        const RunReport report = runner.run(strategy);

        TEST_ASSERT(report.fills.empty());
        const auto open = s.exchange.getOpenOrders(std::nullopt);
        TEST_ASSERT_EQ(open.size(), static_cast<std::size_t>(1));
        TEST_ASSERT_EQ(open[0].id, 2);

        // 예약은 살아 있는 주문 1개 몫만
        TEST_ASSERT_DOUBLE_EQ(s.exchange.locked("USDC"), open[0].quantity * open[0].stop_price);
        TEST_ASSERT_DOUBLE_EQ(report.final_value, 1000.0);
    }

    void testStrategyRejectsBadParams() {
        BreakoutStopStrategy::Params p{};
        p.channelLength = 0;
        TEST_ASSERT_THROWS(BreakoutStopStrategy("ADAUSDC", p), std::invalid_argument);

        p.channelLength = 3;
        p.riskPercent = 0.0;
        TEST_ASSERT_THROWS(BreakoutStopStrategy("ADAUSDC", p), std::invalid_argument);
    }

    bool runAllTests() {
        static const TestCase tests[] = {
            {"RunnerDrivesEveryCandle", testRunnerDrivesEveryCandle},
            {"LoadSeries", testLoadSeries},
            {"LoadSeriesUppercasesSymbol", testLoadSeriesUppercasesSymbol},
            {"SeriesRejectsBadInput", testSeriesRejectsBadInput},
            {"PriceChannel", testPriceChannel},
            {"BreakoutRoundTrip", testBreakoutRoundTrip},
            {"BreakoutEntryTimeout", testBreakoutEntryTimeout},
            {"StrategyRejectsBadParams", testStrategyRejectsBadParams},
        };
        return runSuite("Backtest Runner Tests", tests);
    }

} // namespace test

int main() {
    return test::runAllTests() ? 0 : 1;
}
