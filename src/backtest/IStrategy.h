// src/backtest/IStrategy.h
#pragma once

#include "api/IExchangeClient.h"
#include "core/domain/Candle.h"

namespace backtest
{
    /*
     * IStrategy
     *
     * 백테스트 하네스가 호출하는 전략 인터페이스
     * - 전략은 거래소 API(IExchangeClient)만 본다 (SimExchange 내부 접근 없음)
     * - 체결 판단은 next() 이후 하네스가 수행하므로,
     *   next()에서 낸 주문은 같은 캔들에서 체결될 수 있다
     */
    class IStrategy
    {
    public:
        virtual ~IStrategy() = default;

        // 첫 캔들 전에 1번
        virtual void init(api::IExchangeClient& exchange) = 0;

        // 캔들마다 1번 (커서는 이미 candle 위치)
        virtual void next(api::IExchangeClient& exchange, const core::Candle& candle) = 0;
    };
}
