// src/backtest/BacktestRunner.h
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "api/IKlineStore.h"
#include "core/domain/Order.h"
#include "IStrategy.h"
#include "Ledger.h"
#include "MarketSeries.h"
#include "SimExchange.h"

namespace backtest
{
    // 한 번의 실행 결과
    struct RunReport
    {
        core::Amount final_value{ 0.0 };        // 마지막 종가 기준 평가액
        std::vector<core::Order> fills;         // 체결 순서
        std::size_t candles{ 0 };               // 처리한 캔들 수
    };

    /*
     * BacktestRunner
     *
     * 캔들 루프:
     *   strategy.init()
     *   for each candle:
     *     exchange.setCursor(i) -> strategy.next() -> exchange.evaluatePendingOrders()
     *
     * 커서를 옮기는 것은 러너뿐이다.
     * 같은 러너로 run()을 두 번 호출하지 않는다 (거래소 상태가 이어짐).
     */
    class BacktestRunner
    {
    public:
        BacktestRunner(SimExchange& exchange, const MarketSeries& series, const Ledger& ledger);

        RunReport run(IStrategy& strategy);

    private:
        SimExchange& exchange_;
        const MarketSeries& series_;
        const Ledger& ledger_;
    };

    /*
     * 저장소에서 전체 구간 시계열 로드 (오름차순, 개수 제한 없음)
     * 결과가 비어 있으면 std::runtime_error
     */
    MarketSeries loadSeries(const api::IKlineStore& store,
                            const std::string& symbol,
                            const std::string& timeframe,
                            std::optional<core::TimestampMs> start_ts = std::nullopt,
                            std::optional<core::TimestampMs> end_ts = std::nullopt);
}
