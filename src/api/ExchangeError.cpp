#include "ExchangeError.h"

#include <ostream>
#include <sstream>
#include <type_traits>

namespace api {

	namespace
	{
		// variant 방문용 오버로드 헬퍼
		template <class... Ts>
		struct Overloaded : Ts... { using Ts::operator()...; };
		template <class... Ts>
		Overloaded(Ts...) -> Overloaded<Ts...>;
	}

	int errorCode(const ExchangeError& err) noexcept
	{
		return std::visit(Overloaded{
			[](const UnsupportedOrderType&) { return -1116; },
			[](const ImmediateTrigger&)     { return -2010; },
			[](const InsufficientBalance&)  { return -2010; },
			[](const InvalidQuery&)         { return -1102; },
			[](const InvalidOrder&)         { return -1013; },
		}, err);
	}

	std::string errorMessage(const ExchangeError& err)
	{
		std::ostringstream oss;
		std::visit(Overloaded{
			[&](const UnsupportedOrderType& e) {
				oss << "Invalid orderType. (" << core::to_string(e.type)
					<< " not supported for " << e.symbol << ")";
			},
			[&](const ImmediateTrigger& e) {
				oss << "Stop price would trigger immediately. ("
					<< core::to_string(e.side) << " " << e.symbol
					<< " stop=" << e.stop_price << " open=" << e.open_price << ")";
			},
			[&](const InsufficientBalance& e) {
				oss << "Account has insufficient balance for requested action. ("
					<< core::to_string(e.side) << " " << e.symbol << " " << e.asset
					<< " required=" << e.required << " free=" << e.free << ")";
			},
			[&](const InvalidQuery& e) {
				oss << "Mandatory parameter '" << e.field
					<< "' was not sent, was empty/null, or malformed. (" << e.reason << ")";
			},
			[&](const InvalidOrder& e) {
				oss << "Filter failure: " << e.field << " (" << e.reason << ")";
			},
		}, err);
		return oss.str();
	}

	const char* errorKind(const ExchangeError& err) noexcept
	{
		return std::visit(Overloaded{
			[](const UnsupportedOrderType&) { return "UnsupportedOrderType"; },
			[](const ImmediateTrigger&)     { return "ImmediateTrigger"; },
			[](const InsufficientBalance&)  { return "InsufficientBalance"; },
			[](const InvalidQuery&)         { return "InvalidQuery"; },
			[](const InvalidOrder&)         { return "InvalidOrder"; },
		}, err);
	}

	std::ostream& operator<<(std::ostream& os, const ExchangeError& err)
	{
		return os << errorKind(err) << "(" << errorCode(err) << "): " << errorMessage(err);
	}
}
