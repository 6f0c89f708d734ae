// src/api/sqlite/SqliteKlineStore.h
#pragma once

#include <string>
#include <vector>

#include "api/IKlineStore.h"

namespace api::sqlite
{
    /*
     * SqliteKlineStore
     *
     * backtest_klines 테이블 읽기 전용 조회
     *
     * [연결 수명]
     * - select 호출마다 읽기 전용으로 열고, 호출이 끝나면 닫는다 (RAII)
     * - 객체는 경로만 들고 있고 핸들을 유지하지 않는다
     *
     * [테이블]
     *   symbol, timeframe, open_time, open_price, high_price, low_price, close_price,
     *   volume, close_time, quote_asset_volume, number_of_trades,
     *   taker_buy_base_asset_volume, taker_buy_quote_asset_volume
     *
     * 열기/준비/실행 실패는 std::runtime_error
     */
    class SqliteKlineStore final : public IKlineStore
    {
    public:
        explicit SqliteKlineStore(std::string db_path);

        std::vector<core::Candle> select(const KlineSelect& q) const override;

        const std::string& path() const noexcept { return db_path_; }

        // 조회에 쓰일 SQL (바인딩 순서: symbol, timeframe, [start], [end], [limit])
        static std::string buildSql(const KlineSelect& q);

    private:
        std::string db_path_;
    };

} // namespace api::sqlite
