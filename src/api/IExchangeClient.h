// src/api/IExchangeClient.h
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/domain/Account.h"
#include "core/domain/Candle.h"
#include "core/domain/ExchangeInfo.h"
#include "core/domain/Order.h"
#include "core/domain/OrderRequest.h"
#include "core/domain/Ticker.h"
#include "ExchangeError.h"
#include "KlineQuery.h"

namespace api
{
    // get_all_orders 조회 조건
    struct OrderHistoryQuery
    {
        std::optional<std::string>      symbol;         // 없으면 전체 이력
        std::optional<core::OrderId>    from_order_id;  // 이 id 이상만 (페이지네이션)
        std::optional<std::int64_t>     limit;          // 최대 개수 (음수면 InvalidQuery)
    };

    /*
     * IExchangeClient
     *
     * [역할]
     * 전략/백테스트 하네스가 보는 거래소 주문 API
     * - 실거래 클라이언트와 같은 모양을 유지해서 전략 코드가 구분하지 않게 한다
     * - SimExchange (백테스트)가 구현
     *
     * [오류]
     * - 도메인 오류는 ExchangeResult의 ExchangeError로 반환
     * - cancelOrder는 실패하지 않는다 (모르는 주문은 합성 CANCELED 응답)
     *
     * [Thread-Safety]
     * - 보장하지 않음. 한 번의 실행이 한 인스턴스를 단독 사용.
     */
    class IExchangeClient
    {
    public:
        virtual ~IExchangeClient() = default;

        /*
         * POST /order
         * 스탑 주문 접수, 성공 시 NEW 상태 주문
         */
        virtual ExchangeResult<core::Order>
            createOrder(const core::OrderRequest& req) = 0;

        /*
         * DELETE /order?orderId=... OR origClientOrderId=...
         * 주문 취소 (멱등)
         */
        virtual core::Order
            cancelOrder(std::string_view symbol,
                        const std::optional<core::OrderId>& order_id,
                        const std::optional<std::string>& client_order_id) = 0;

        /*
         * GET /openOrders?symbol=...
         * 미체결(NEW) 주문, 접수 순서
         */
        virtual std::vector<core::Order>
            getOpenOrders(const std::optional<std::string>& symbol) const = 0;

        /*
         * GET /allOrders
         * 체결 주문 이력 (오래된 순)
         */
        virtual ExchangeResult<std::vector<core::Order>>
            getAllOrders(const OrderHistoryQuery& q) const = 0;

        // GET /account
        virtual core::AccountSnapshot getAccount() const = 0;

        // GET /ticker/price
        virtual core::Ticker getSymbolTicker(std::string_view symbol) const = 0;

        // GET /exchangeInfo
        virtual core::ExchangeInfo getExchangeInfo() const = 0;

        // GET /klines
        virtual ExchangeResult<std::vector<core::Candle>>
            getKlines(const KlineQuery& q) const = 0;
    };

} // namespace api
