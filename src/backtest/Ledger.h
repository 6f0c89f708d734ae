// src/backtest/Ledger.h
#pragma once

#include <map>
#include <string>
#include <string_view>

#include "core/domain/Types.h"
#include "FeePolicy.h"

namespace backtest {

    /*
     * Ledger
     *
     * 백테스트용 현금/포지션 장부 (broker)
     *
     * [역할]
     * - quote 현금(cash)과 심볼별 보유 수량(positions) 보관
     * - 체결 반영 (applyBuy / applySell)
     * - 가격 맵 기준 평가금액 계산
     *
     * [모르는 것]
     * - 주문, 시간, 예약(locked) 개념 없음
     * - 예약 검증은 SimExchange 책임. Ledger는 잔고 부족 시 false만 돌려준다.
     *
     * [불변 조건]
     * - 허용된 연산 후 cash >= 0
     * - 거부된 연산은 상태를 전혀 바꾸지 않음 (부분 반영 없음)
     *
     * [Thread-Safety]
     * - 없음. 백테스트 1회 실행이 단독 소유한다.
     */
    class Ledger {
    public:
        using PriceMap = std::map<std::string, core::Price, std::less<>>;
        using PositionMap = std::map<std::string, core::Volume, std::less<>>;

        /*
         * @param initial_cash: 초기 quote 잔고 (>= 0)
         * @param commission_rate: [0, 1)
         * @param initial_positions: 시작 보유 수량 (심볼 기준, >= 0)
         *
         * 범위 밖 값은 std::invalid_argument
         */
        explicit Ledger(core::Amount initial_cash,
                        double commission_rate = 0.0,
                        PositionMap initial_positions = {});

        // 매수 체결 반영
        // cost = q * p, fee = cost * rate (Waived면 0)
        // cash < cost + fee 이면 아무것도 하지 않고 false
        bool applyBuy(std::string_view symbol, core::Volume quantity, core::Price price,
                      Commission mode = Commission::Charged);

        // 매도 체결 반영
        // positions[symbol] < q 이면 아무것도 하지 않고 false
        bool applySell(std::string_view symbol, core::Volume quantity, core::Price price,
                       Commission mode = Commission::Charged);

        // cash + sum(positions[s] * prices[s]), 수량 > 0인 포지션만, 가격 없으면 0 기여
        core::Amount portfolioValue(const PriceMap& prices) const;

        core::Amount cash() const noexcept { return cash_; }
        core::Amount initialCash() const noexcept { return initial_cash_; }
        double commissionRate() const noexcept { return fee_.rate(); }

        // 미보유 심볼은 0
        core::Volume position(std::string_view symbol) const;
        const PositionMap& positions() const noexcept { return positions_; }

    private:
        core::Amount initial_cash_{0};
        core::Amount cash_{0};
        FeePolicy fee_;
        PositionMap positions_;
    };

} // namespace backtest
