/**
 * @file types.cpp
 * @brief Implements timestamp formatting and enum conversions for core types.
 */

#include "core/types.hpp"
#include "core/errors.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace core {

std::string formatTimestamp(Timestamp ts) {
    int64_t seconds = ts / kMillisPerSecond;
    int64_t millis = ts % kMillisPerSecond;
    if (millis < 0) {
        millis += kMillisPerSecond;
        seconds -= 1;
    }

    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(3) << std::setfill('0') << millis << "Z";
    return out.str();
}

std::string toString(Currency currency) {
    switch (currency) {
        case Currency::USD: return "USD";
        case Currency::EUR: return "EUR";
        case Currency::GBP: return "GBP";
        case Currency::JPY: return "JPY";
        case Currency::AUD: return "AUD";
        case Currency::CAD: return "CAD";
        case Currency::CHF: return "CHF";
        case Currency::NZD: return "NZD";
    }
    return "UNKNOWN";
}

Currency currencyFromString(const std::string& code) {
    static const Currency all[] = {
        Currency::USD, Currency::EUR, Currency::GBP, Currency::JPY,
        Currency::AUD, Currency::CAD, Currency::CHF, Currency::NZD
    };
    for (Currency c : all) {
        if (toString(c) == code) return c;
    }
    throw InvalidConfiguration("unknown currency code '" + code + "'");
}

std::string toString(BarResolution resolution) {
    switch (resolution) {
        case BarResolution::SECOND: return "SECOND";
        case BarResolution::MINUTE: return "MINUTE";
        case BarResolution::HOUR: return "HOUR";
        case BarResolution::DAY: return "DAY";
    }
    return "UNKNOWN";
}

std::string toString(PriceType price_type) {
    switch (price_type) {
        case PriceType::BID: return "BID";
        case PriceType::ASK: return "ASK";
        case PriceType::MID: return "MID";
    }
    return "UNKNOWN";
}

}
