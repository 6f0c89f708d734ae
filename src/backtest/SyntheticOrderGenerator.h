// src/backtest/SyntheticOrderGenerator.h
#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include "core/domain/Order.h"
#include "MarketSeries.h"

namespace backtest
{
    /*
     * SyntheticOrderGenerator
     *
     * 시계열에서 "이미 체결된" 가상 과거 주문을 만든다.
     * - 과거 거래 이력이 있다고 가정하는 컴포넌트를 위한 시드 데이터
     * - Ledger/예약/미체결 주문과 완전히 독립 (상태 변경 없음)
     *
     * [생성 규칙]
     * - 개수: min(max_orders, 캔들 수 / series_divisor)
     * - 캔들: 무작위 위치, 방향: BUY/SELL 균등
     * - 가격: BUY는 low + U(0, 0.3 * (high - low)), SELL은 high - U(...)
     * - 수량: U(min(0.1, cap), cap), cap = min(10, volume * 0.01)
     * - id: next_order_id - 개수 + offset (실주문 id보다 앞선 번호)
     * - 결과는 시간 오름차순
     *
     * seed가 같으면 같은 결과 (재현 가능한 백테스트)
     */
    class SyntheticOrderGenerator
    {
    public:
        explicit SyntheticOrderGenerator(std::uint64_t seed,
                                         std::size_t max_orders = 50,
                                         std::size_t series_divisor = 10);

        // 시계열 길이에 대한 생성 개수
        std::size_t orderCount(std::size_t series_length) const noexcept;

        std::vector<core::Order> generate(const MarketSeries& series, core::OrderId next_order_id);

    private:
        core::Price selectPrice(core::OrderSide side, const core::Candle& candle);
        core::Volume selectQuantity(const core::Candle& candle);
        std::string makeClientOrderId(core::OrderId id);

        std::mt19937_64 rng_;
        std::size_t max_orders_;
        std::size_t series_divisor_;
    };
}
