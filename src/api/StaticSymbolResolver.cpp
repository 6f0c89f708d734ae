#include "StaticSymbolResolver.h"

#include <stdexcept>

namespace api
{
    StaticSymbolResolver::StaticSymbolResolver(const std::map<std::string, core::Instrument>& table)
    {
        for (const auto& [symbol, inst] : table)
        {
            core::Instrument copy = inst;
            copy.symbol = symbol;
            add(std::move(copy));
        }
    }

    void StaticSymbolResolver::add(core::Instrument instrument)
    {
        if (instrument.symbol.empty() || instrument.base.empty() || instrument.quote.empty())
            throw std::invalid_argument("StaticSymbolResolver: symbol/base/quote must not be empty");

        std::string key = instrument.symbol;
        table_.insert_or_assign(std::move(key), std::move(instrument));
    }

    core::Instrument StaticSymbolResolver::resolve(std::string_view symbol) const
    {
        auto it = table_.find(symbol);
        if (it == table_.end())
            throw std::invalid_argument("unknown symbol: " + std::string(symbol));
        return it->second;
    }
}
