// src/api/ISymbolResolver.h
#pragma once

#include <string_view>

#include "core/domain/Instrument.h"

namespace api
{
    /*
     * ISymbolResolver
     *
     * 심볼 -> (base, quote) 자산 조회
     * - 모르는 심볼은 std::invalid_argument (조용한 기본값 금지)
     */
    class ISymbolResolver
    {
    public:
        virtual ~ISymbolResolver() = default;

        virtual core::Instrument resolve(std::string_view symbol) const = 0;
    };

} // namespace api
