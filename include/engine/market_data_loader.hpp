/**
 * @file market_data_loader.hpp
 * @brief Declares the MarketDataLoader class for reading historical bars from CSV.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace engine {

/**
 * @class MarketDataLoader
 * @brief Loads OHLCV bars from a CSV file.
 *
 * Format: timestamp,open,high,low,close,volume with the timestamp in
 * milliseconds since the Unix epoch. A header line is optional.
 */
class MarketDataLoader {
public:
    /**
     * @brief Constructs a MarketDataLoader.
     * @param file_path Path to the CSV file
     * @param logger Receives warnings about skipped rows
     */
    MarketDataLoader(const std::string& file_path, core::Logger& logger);

    /**
     * @brief Reads every well-formed row. Malformed rows are skipped with a warning.
     * @throws std::runtime_error if the file cannot be opened
     */
    std::vector<core::Bar> load() const;

    /**
     * @brief Parses a CSV line into a Bar.
     * @throws std::runtime_error on a wrong field count or unparsable number
     */
    static core::Bar parseLine(const std::string& line);

private:
    std::string file_path_;
    core::LoggerAdapter log_;
};

/**
 * @brief Loads a bid file and an ask file into a BarData pair.
 */
core::BarData loadBidAskBars(const std::string& bid_path, const std::string& ask_path, core::Logger& logger);

}
