// src/util/Config.cpp

#include "Config.h"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "Logger.h"

namespace util
{
    namespace
    {
        using nlohmann::json;

        // 키가 있으면 덮어쓰고, 없으면 기본값 유지
        template <typename T>
        void readIfPresent(const json& j, const char* key, T& out)
        {
            auto it = j.find(key);
            if (it != j.end() && !it->is_null())
                it->get_to(out);
        }

        template <typename T>
        void readIfPresent(const json& j, const char* key, std::optional<T>& out)
        {
            auto it = j.find(key);
            if (it != j.end() && !it->is_null())
                out = it->get<T>();
        }

        void readBacktest(const json& j, BacktestConfig& c)
        {
            readIfPresent(j, "symbol", c.symbol);
            readIfPresent(j, "timeframe", c.timeframe);
            readIfPresent(j, "start_ts", c.start_ts);
            readIfPresent(j, "end_ts", c.end_ts);
            readIfPresent(j, "initial_cash", c.initial_cash);
            readIfPresent(j, "commission_rate", c.commission_rate);
            readIfPresent(j, "balance_epsilon", c.balance_epsilon);
        }

        void readRules(const json& j, core::SymbolRules& r)
        {
            readIfPresent(j, "symbol", r.symbol);
            readIfPresent(j, "base_asset_precision", r.base_asset_precision);
            readIfPresent(j, "quote_asset_precision", r.quote_asset_precision);
            readIfPresent(j, "step_size", r.step_size);
            readIfPresent(j, "tick_size", r.tick_size);
            readIfPresent(j, "min_notional", r.min_notional);
        }

        // "symbols": { "ADAUSDC": { "base": "ADA", "quote": "USDC" }, ... }
        void readSymbols(const json& j, std::map<std::string, core::Instrument>& out)
        {
            if (!j.is_object())
                throw std::runtime_error("config: 'symbols' must be an object");

            out.clear();
            for (const auto& [symbol, entry] : j.items())
            {
                core::Instrument inst;
                inst.symbol = symbol;
                entry.at("base").get_to(inst.base);
                entry.at("quote").get_to(inst.quote);
                out.emplace(symbol, std::move(inst));
            }
        }
    }

    AppConfig loadConfig(const std::string& path)
    {
        std::ifstream in(path);
        if (!in.is_open())
            throw std::runtime_error("config: cannot open " + path);

        AppConfig cfg;
        try
        {
            const json root = json::parse(in);

            if (auto it = root.find("backtest"); it != root.end())
                readBacktest(*it, cfg.backtest);

            if (auto it = root.find("history"); it != root.end())
            {
                readIfPresent(*it, "max_orders", cfg.history.max_orders);
                readIfPresent(*it, "window_ms", cfg.history.window_ms);
            }

            if (auto it = root.find("synthetic"); it != root.end())
            {
                readIfPresent(*it, "max_orders", cfg.synthetic.max_orders);
                readIfPresent(*it, "series_divisor", cfg.synthetic.series_divisor);
                readIfPresent(*it, "seed", cfg.synthetic.seed);
            }

            if (auto it = root.find("store"); it != root.end())
                readIfPresent(*it, "sqlite_path", cfg.store.sqlite_path);

            if (auto it = root.find("log"); it != root.end())
            {
                readIfPresent(*it, "level", cfg.log.level);
                readIfPresent(*it, "file", cfg.log.file);
            }

            if (auto it = root.find("rules"); it != root.end())
                readRules(*it, cfg.rules);

            if (auto it = root.find("symbols"); it != root.end())
                readSymbols(*it, cfg.symbols);
        }
        catch (const nlohmann::json::exception& e)
        {
            // 파싱/타입 오류는 설정 오류로 통일
            throw std::runtime_error("config: invalid " + path + ": " + e.what());
        }

        if (cfg.history.max_orders == 0)
            throw std::runtime_error("config: history.max_orders must be > 0");
        if (cfg.synthetic.series_divisor == 0)
            throw std::runtime_error("config: synthetic.series_divisor must be > 0");

        return cfg;
    }

    void applyLogConfig(const LogConfig& cfg)
    {
        auto level = parseLogLevel(cfg.level);
        if (!level.has_value())
            throw std::invalid_argument("log level not recognized: " + cfg.level);

        Logger::instance().setLevel(*level);
        if (!cfg.file.empty())
        {
            if (!Logger::instance().enableFileOutput(cfg.file))
                Logger::instance().warn("[Config] file logging disabled, console only");
        }
    }

} // namespace util
