// test_utils.hpp
#pragma once

#include <gmock/gmock.h>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "quant_engine/core/time_utils.hpp"
#include "quant_engine/data/market_data.hpp"

namespace quant_engine {
namespace testing {

using FactorMap = std::unordered_map<std::string, FactorObservation>;

// ================= Builders =================

inline Timestamp date(int year, int month, int day) {
    return core::make_date(year, month, day);
}

inline PriceData make_price(const Timestamp& day, double close) {
    PriceData price;
    price.trade_date = day;
    price.open = close;
    price.high = close * 1.01;
    price.low = close * 0.99;
    price.close = close;
    price.volume = 1000000.0;
    price.amount = close * price.volume;
    return price;
}

inline DataSnapshot make_snapshot(const std::string& stock_code, const Timestamp& day,
                                  double close,
                                  std::unordered_map<std::string, double> factors) {
    DataSnapshot snapshot;
    snapshot.timestamp = day;
    snapshot.stock_code = stock_code;
    snapshot.price = make_price(day, close);
    snapshot.factor_data = std::move(factors);
    return snapshot;
}

// ================= Fake provider =================

/**
 * Deterministic in-memory provider. Calendar defaults to "unavailable" until
 * set_calendar() is called.
 */
class FakeSnapshotProvider : public FactorSnapshotProvider {
public:
    void add_price(const std::string& stock_code, const PriceData& price) {
        std::lock_guard<std::mutex> lock(mutex_);
        prices_[stock_code][core::format_date(price.trade_date)] = price;
    }

    void add_factor(const std::string& stock_code, const Timestamp& day, const std::string& name,
                    double value, std::optional<Timestamp> as_of = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);
        factors_[stock_code][core::format_date(day)][name] =
            FactorObservation{value, as_of.value_or(day)};
    }

    // Adds a price and one factor for every date
    void add_series(const std::string& stock_code, const std::vector<Timestamp>& days,
                    double start_price, double daily_change, const std::string& factor_name,
                    double factor_value) {
        double close = start_price;
        for (const auto& day : days) {
            add_price(stock_code, make_price(day, close));
            add_factor(stock_code, day, factor_name, factor_value);
            close += daily_change;
        }
    }

    void set_calendar(std::vector<Timestamp> days) {
        std::lock_guard<std::mutex> lock(mutex_);
        calendar_ = std::move(days);
    }

    void fail_prices_with(std::optional<ErrorCode> code) {
        std::lock_guard<std::mutex> lock(mutex_);
        price_error_ = code;
    }

    Result<PriceData> get_price_on_date(const std::string& stock_code,
                                        const Timestamp& day) override {
        ++price_calls_;
        std::lock_guard<std::mutex> lock(mutex_);
        if (price_error_) {
            return make_error<PriceData>(*price_error_, "Injected price failure", "FakeProvider");
        }
        auto stock = prices_.find(stock_code);
        if (stock != prices_.end()) {
            auto price = stock->second.find(core::format_date(day));
            if (price != stock->second.end()) {
                return price->second;
            }
        }
        return make_error<PriceData>(ErrorCode::DATA_NOT_FOUND,
                                     "No price for " + stock_code + " on " +
                                         core::format_date(day),
                                     "FakeProvider");
    }

    Result<FactorMap> get_factor_values(const std::string& stock_code, const Timestamp& day,
                                        const std::vector<std::string>& names) override {
        ++factor_calls_;
        std::lock_guard<std::mutex> lock(mutex_);
        FactorMap found;
        auto stock = factors_.find(stock_code);
        if (stock == factors_.end()) {
            return found;
        }
        auto values = stock->second.find(core::format_date(day));
        if (values == stock->second.end()) {
            return found;
        }
        for (const auto& name : names) {
            auto value = values->second.find(name);
            if (value != values->second.end()) {
                found[name] = value->second;
            }
        }
        return found;
    }

    Result<std::vector<Timestamp>> get_trading_calendar(const std::string&,
                                                        const Timestamp& start,
                                                        const Timestamp& end) override {
        ++calendar_calls_;
        std::lock_guard<std::mutex> lock(mutex_);
        if (!calendar_) {
            return make_error<std::vector<Timestamp>>(ErrorCode::CONNECTION_ERROR,
                                                      "Calendar unavailable", "FakeProvider");
        }
        std::vector<Timestamp> days;
        for (const auto& day : *calendar_) {
            if (day >= start && day <= end) {
                days.push_back(day);
            }
        }
        return days;
    }

    size_t price_calls() const {
        return price_calls_.load();
    }
    size_t factor_calls() const {
        return factor_calls_.load();
    }
    size_t calendar_calls() const {
        return calendar_calls_.load();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, PriceData>> prices_;
    std::map<std::string, std::map<std::string, std::map<std::string, FactorObservation>>>
        factors_;
    std::optional<std::vector<Timestamp>> calendar_;
    std::optional<ErrorCode> price_error_;
    std::atomic<size_t> price_calls_{0};
    std::atomic<size_t> factor_calls_{0};
    std::atomic<size_t> calendar_calls_{0};
};

// ================= GMock provider =================

class MockSnapshotProvider : public FactorSnapshotProvider {
public:
    MOCK_METHOD(Result<PriceData>, get_price_on_date,
                (const std::string& stock_code, const Timestamp& date), (override));
    MOCK_METHOD(Result<FactorMap>, get_factor_values,
                (const std::string& stock_code, const Timestamp& date,
                 const std::vector<std::string>& factor_names),
                (override));
    MOCK_METHOD(Result<std::vector<Timestamp>>, get_trading_calendar,
                (const std::string& exchange, const Timestamp& start, const Timestamp& end),
                (override));
};

}  // namespace testing
}  // namespace quant_engine
