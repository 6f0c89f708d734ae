// src/api/sqlite/SqliteKlineStore.cpp

#include "SqliteKlineStore.h"

#include <memory>
#include <stdexcept>

#include <sqlite3.h>

#include "util/Logger.h"

namespace api::sqlite
{
    namespace
    {
        // sqlite3 핸들 소유 (스코프 종료 시 close/finalize)
        struct ConnectionCloser
        {
            void operator()(sqlite3* db) const noexcept { sqlite3_close_v2(db); }
        };
        struct StatementFinalizer
        {
            void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
        };

        using Connection = std::unique_ptr<sqlite3, ConnectionCloser>;
        using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

        Connection openReadOnly(const std::string& path)
        {
            sqlite3* raw = nullptr;
            const int rc = sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READONLY, nullptr);

            // 실패해도 핸들이 할당될 수 있으므로 먼저 소유권을 잡는다
            Connection conn(raw);
            if (rc != SQLITE_OK)
            {
                const std::string msg = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
                throw std::runtime_error("SqliteKlineStore: cannot open " + path + ": " + msg);
            }
            return conn;
        }

        void check(int rc, sqlite3* db, const char* what)
        {
            if (rc != SQLITE_OK)
                throw std::runtime_error(std::string("SqliteKlineStore: ") + what + ": " + sqlite3_errmsg(db));
        }
    }

    SqliteKlineStore::SqliteKlineStore(std::string db_path)
        : db_path_(std::move(db_path))
    {
        if (db_path_.empty())
            throw std::invalid_argument("SqliteKlineStore: db path must not be empty");
    }

    std::string SqliteKlineStore::buildSql(const KlineSelect& q)
    {
        std::string sql =
            "SELECT open_time, open_price, high_price, low_price, close_price, volume, close_time, "
            "quote_asset_volume, number_of_trades, taker_buy_base_asset_volume, taker_buy_quote_asset_volume "
            "FROM backtest_klines WHERE symbol = ? AND timeframe = ?";

        if (q.start_time.has_value())
            sql += " AND open_time >= ?";
        if (q.end_time.has_value())
            sql += " AND open_time <= ?";

        sql += (q.order == SortOrder::Ascending) ? " ORDER BY open_time ASC" : " ORDER BY open_time DESC";

        if (q.limit.has_value())
            sql += " LIMIT ?";

        return sql;
    }

    std::vector<core::Candle> SqliteKlineStore::select(const KlineSelect& q) const
    {
        Connection conn = openReadOnly(db_path_);
        sqlite3* db = conn.get();

        const std::string sql = buildSql(q);

        sqlite3_stmt* raw_stmt = nullptr;
        check(sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr), db, "prepare");
        Statement stmt(raw_stmt);

        int idx = 1;
        check(sqlite3_bind_text(stmt.get(), idx++, q.symbol.c_str(), -1, SQLITE_TRANSIENT), db, "bind symbol");
        check(sqlite3_bind_text(stmt.get(), idx++, q.timeframe.c_str(), -1, SQLITE_TRANSIENT), db, "bind timeframe");
        if (q.start_time.has_value())
            check(sqlite3_bind_int64(stmt.get(), idx++, *q.start_time), db, "bind start_time");
        if (q.end_time.has_value())
            check(sqlite3_bind_int64(stmt.get(), idx++, *q.end_time), db, "bind end_time");
        if (q.limit.has_value())
            check(sqlite3_bind_int64(stmt.get(), idx++, *q.limit), db, "bind limit");

        std::vector<core::Candle> rows;
        while (true)
        {
            const int rc = sqlite3_step(stmt.get());
            if (rc == SQLITE_DONE)
                break;
            if (rc != SQLITE_ROW)
            {
                util::Logger::instance().error("[SqliteKlineStore] step failed for ", q.symbol, " ",
                    q.timeframe, ": ", sqlite3_errmsg(db));
                throw std::runtime_error(std::string("SqliteKlineStore: step: ") + sqlite3_errmsg(db));
            }

            core::Candle c;
            c.open_time = sqlite3_column_int64(stmt.get(), 0);
            c.open = sqlite3_column_double(stmt.get(), 1);
            c.high = sqlite3_column_double(stmt.get(), 2);
            c.low = sqlite3_column_double(stmt.get(), 3);
            c.close = sqlite3_column_double(stmt.get(), 4);
            c.volume = sqlite3_column_double(stmt.get(), 5);
            c.close_time = sqlite3_column_int64(stmt.get(), 6);
            c.quote_volume = sqlite3_column_double(stmt.get(), 7);
            c.trade_count = sqlite3_column_int64(stmt.get(), 8);
            c.taker_buy_base_volume = sqlite3_column_double(stmt.get(), 9);
            c.taker_buy_quote_volume = sqlite3_column_double(stmt.get(), 10);
            rows.push_back(c);
        }

        util::Logger::instance().debug("[SqliteKlineStore] ", q.symbol, " ", q.timeframe,
            " -> ", rows.size(), " rows");
        return rows;
    }

} // namespace api::sqlite
