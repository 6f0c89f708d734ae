// src/api/IKlineStore.h
#pragma once

#include <vector>

#include "core/domain/Candle.h"
#include "KlineQuery.h"

namespace api
{
    /*
     * IKlineStore
     *
     * [역할]
     * 과거 kline 시계열 저장소 (읽기 전용)
     * - SimExchange / 시계열 로더가 구체 저장소(SQLite 등)에 의존하지 않도록 추상화
     * - 테스트에서는 MockKlineStore 주입
     *
     * [계약]
     * - select는 조건에 맞는 행을 KlineSelect::order 방향으로 반환
     * - 값 변환 없음 (저장된 값 그대로)
     * - 쓰기 연산 없음
     * - 저장소 접근 실패는 std::runtime_error
     */
    class IKlineStore
    {
    public:
        virtual ~IKlineStore() = default;

        virtual std::vector<core::Candle> select(const KlineSelect& q) const = 0;
    };

} // namespace api
