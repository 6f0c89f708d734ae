// src/backtest/SimExchange.h
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "api/IExchangeClient.h"
#include "api/IKlineStore.h"
#include "api/ISymbolResolver.h"
#include "core/domain/Instrument.h"
#include "Ledger.h"
#include "MarketSeries.h"
#include "OrderHistory.h"
#include "SyntheticOrderGenerator.h"
#include "util/Config.h"

// 백테스트용 가상 거래소
//
// 실거래 클라이언트와 같은 IExchangeClient 모양으로 스탑 주문만 처리한다.
// - 주문 상태 머신: NEW -> FILLED (트리거), NEW -> CANCELED (취소)
// - 잔고 예약(locked): NEW 주문 1개당 예약 1개, locked는 NEW 주문 목록의 합 (주문이 빠지면 해제)
// - 커서: 하네스가 옮기고, 거래소는 절대 스스로 옮기지 않는다
// - 체결 판단: evaluatePendingOrders() 호출 시에만 (커서 이동 시 자동 처리 없음)
namespace backtest
{
    struct SimExchangeOptions
    {
        util::HistoryConfig history;
        util::SyntheticConfig synthetic;

        // exchange info fixture. symbol이 비어 있으면 시계열 심볼 사용
        core::SymbolRules rules{ "", 8, 8, 0.1, 0.0001, 10.0 };

        // 잔고 비교 허용 오차 (free가 필요량보다 이만큼 작아도 통과)
        double balance_epsilon{ 1e-9 };
    };

    class SimExchange final : public api::IExchangeClient
    {
    public:
        /*
         * @param ledger: 체결을 반영할 장부 (거래소만 변경)
         * @param series: 이 거래소가 가격을 보는 시계열 (심볼 1개)
         * @param resolver: 심볼 -> base/quote (시계열 심볼을 모르면 생성자에서 예외)
         * @param klines: kline 패스스루 저장소
         *
         * 참조 인자는 모두 거래소보다 오래 살아야 한다.
         * 한 번의 백테스트 실행이 단독 소유하며 실행 간 재사용하지 않는다.
         */
        SimExchange(Ledger& ledger,
                    const MarketSeries& series,
                    const api::ISymbolResolver& resolver,
                    const api::IKlineStore& klines,
                    SimExchangeOptions options = {});

        SimExchange(const SimExchange&) = delete;
        SimExchange& operator=(const SimExchange&) = delete;

        // ========== 커서 ==========

        // index 위치로 이동 (범위 밖 std::out_of_range)
        void setCursor(std::size_t index);

        // open_time이 일치하는 캔들로 이동 (없으면 std::out_of_range)
        void seekTo(core::TimestampMs open_time);

        const MarketCursor& cursor() const noexcept { return cursor_; }
        const core::Candle& currentCandle() const { return series_.at(cursor_); }

        // ========== 체결 ==========

        /*
         * 현재 캔들 기준으로 NEW 주문 체결 판단 (접수 순서대로)
         * - BUY: high >= stop, SELL: low <= stop
         * - 트리거 가격 그대로, 수수료 없이 Ledger 반영
         * @return 이번 호출로 체결된 주문들
         */
        std::vector<core::Order> evaluatePendingOrders();

        // ========== IExchangeClient ==========

        api::ExchangeResult<core::Order>
            createOrder(const core::OrderRequest& req) override;

        core::Order
            cancelOrder(std::string_view symbol,
                        const std::optional<core::OrderId>& order_id,
                        const std::optional<std::string>& client_order_id) override;

        std::vector<core::Order>
            getOpenOrders(const std::optional<std::string>& symbol) const override;

        api::ExchangeResult<std::vector<core::Order>>
            getAllOrders(const api::OrderHistoryQuery& q) const override;

        core::AccountSnapshot getAccount() const override;

        core::Ticker getSymbolTicker(std::string_view symbol) const override;

        core::ExchangeInfo getExchangeInfo() const override;

        api::ExchangeResult<std::vector<core::Candle>>
            getKlines(const api::KlineQuery& q) const override;

        // ========== 가상 과거 주문 ==========

        // 현재 주문 번호 앞쪽 id로 체결 완료 주문을 생성해 보관 (이전 결과 대체)
        const std::vector<core::Order>& generateSyntheticHistory();
        const std::vector<core::Order>& syntheticOrders() const noexcept { return synthetic_orders_; }

        // ========== 조회 ==========

        core::Amount locked(std::string_view asset) const;
        core::Amount total(std::string_view asset) const;
        core::Amount free(std::string_view asset) const { return total(asset) - locked(asset); }

        std::size_t pendingCount() const noexcept { return pending_.size(); }
        core::OrderId nextOrderId() const noexcept { return next_order_id_; }
        const OrderHistory& history() const noexcept { return history_; }
        const core::Instrument& instrument() const noexcept { return instrument_; }

    private:
        // NEW 주문 + 생성 시 예약한 자산/수량 (해제 시 그대로 사용)
        struct PendingOrder
        {
            core::Order order;
            std::string reserved_asset;
            core::Amount reserved_amount{ 0.0 };
        };

        static bool isTriggered(const core::Order& order, const core::Candle& candle) noexcept;

        // Ledger 반영 + 이력 기록, 체결된 주문 반환 (예약 해제는 pending_ 제거로 처리)
        core::Order settleFill(const PendingOrder& pending);

        // asset 총량: quote면 현금, base면 심볼 포지션
        core::Amount totalFor(const core::Instrument& inst, std::string_view asset) const;

    private:
        Ledger& ledger_;
        const MarketSeries& series_;
        const api::ISymbolResolver& resolver_;
        const api::IKlineStore& klines_;

        core::Instrument instrument_;
        core::SymbolRules rules_;
        MarketCursor cursor_;

        // 접수 순서 유지 (체결 FIFO)
        std::vector<PendingOrder> pending_;

        double balance_epsilon_;

        // 세션 주문 번호 (1부터)
        core::OrderId next_order_id_{ 1 };

        OrderHistory history_;

        SyntheticOrderGenerator synthetic_gen_;
        std::vector<core::Order> synthetic_orders_;
    };
}
