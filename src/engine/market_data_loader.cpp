/**
 * @file market_data_loader.cpp
 * @brief Implements MarketDataLoader for reading historical bars.
 */

#include "engine/market_data_loader.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace engine {

using namespace core;

MarketDataLoader::MarketDataLoader(const std::string& file_path, Logger& logger)
    : file_path_(file_path), log_("MarketDataLoader", logger) {}

std::vector<Bar> MarketDataLoader::load() const {
    std::ifstream infile(file_path_);
    if (!infile.is_open()) {
        throw std::runtime_error("Failed to open market data file: " + file_path_);
    }

    std::vector<Bar> bars;
    std::string line;
    size_t line_no = 0;
    size_t skipped = 0;

    while (std::getline(infile, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        // skip header line if present
        if (line_no == 1 && line.find("timestamp") != std::string::npos) continue;

        try {
            bars.push_back(parseLine(line));
        } catch (const std::exception& ex) {
            ++skipped;
            log_.warning(file_path_ + ":" + std::to_string(line_no) + ": skipping malformed row (" + ex.what() + ")");
        }
    }

    log_.info("Loaded " + std::to_string(bars.size()) + " bars from " + file_path_
              + (skipped > 0 ? ", skipped " + std::to_string(skipped) : ""));
    return bars;
}

Bar MarketDataLoader::parseLine(const std::string& line) {
    std::istringstream ss(line);
    std::string token;

    std::vector<std::string> fields;
    while (std::getline(ss, token, ',')) {
        fields.push_back(token);
    }

    if (fields.size() != 6) {
        throw std::runtime_error("Invalid field count");
    }

    Bar bar;
    size_t consumed = 0;
    try {
        bar.timestamp = std::stoll(fields[0], &consumed);
        if (consumed != fields[0].size()) throw std::invalid_argument(fields[0]);
        bar.open = std::stod(fields[1]);
        bar.high = std::stod(fields[2]);
        bar.low = std::stod(fields[3]);
        bar.close = std::stod(fields[4]);
        bar.volume = std::stod(fields[5]);
    } catch (const std::logic_error& ex) {
        throw std::runtime_error(std::string("Invalid number: ") + ex.what());
    }
    return bar;
}

BarData loadBidAskBars(const std::string& bid_path, const std::string& ask_path, Logger& logger) {
    BarData data;
    data.bid = MarketDataLoader(bid_path, logger).load();
    data.ask = MarketDataLoader(ask_path, logger).load();
    return data;
}

}
