// core/domain/Instrument.h
#pragma once

#include <string>

namespace core 
{
	
	// 종목 정보
	struct Instrument 
	{
		std::string symbol;			// 거래쌍 코드 (예: "ADAUSDC")

		// 거래 통화에 대한 정보
		std::string base;			// 기본 통화 (예: "ADA")
		std::string quote;			// 상대 통화 (예: "USDC")
	};

}
