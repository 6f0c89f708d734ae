// src/api/StaticSymbolResolver.h
#pragma once

#include <map>
#include <string>
#include <string_view>

#include "ISymbolResolver.h"

namespace api
{
    // 설정 파일의 symbols 테이블 기반 조회
    class StaticSymbolResolver final : public ISymbolResolver
    {
    public:
        StaticSymbolResolver() = default;
        explicit StaticSymbolResolver(const std::map<std::string, core::Instrument>& table);

        // 같은 심볼이 있으면 덮어쓴다
        void add(core::Instrument instrument);

        core::Instrument resolve(std::string_view symbol) const override;

    private:
        std::map<std::string, core::Instrument, std::less<>> table_;
    };

} // namespace api
