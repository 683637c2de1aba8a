#include "SignalGenerator.hpp"
#include "core/Clock.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>

namespace tickflow {

std::string to_string(SourceKind kind) {
    switch (kind) {
    case SourceKind::Stock: return "stock";
    case SourceKind::Sensor: return "sensor";
    case SourceKind::Network: return "network";
    case SourceKind::Crypto: return "crypto";
    case SourceKind::Weather: return "weather";
    case SourceKind::Generic: break;
    }
    return "generic";
}

SourceKind source_kind_from_name(const std::string& name) {
    if (name == "stock") return SourceKind::Stock;
    if (name == "sensor") return SourceKind::Sensor;
    if (name == "network") return SourceKind::Network;
    if (name == "crypto") return SourceKind::Crypto;
    if (name == "weather") return SourceKind::Weather;
    return SourceKind::Generic;
}

const std::vector<std::string>& available_source_names() {
    static const std::vector<std::string> names{"stock", "sensor", "network", "crypto", "weather"};
    return names;
}

void to_json(nlohmann::json& j, const DataPoint& p) {
    nlohmann::json values = nlohmann::json::object();
    for (const auto& [field, value] : p.values) values[field] = value;
    j = {
        {"timestamp", p.timestamp},
        {"source", p.source},
        {"data", values},
        {"metadata", {
            {"sequence", p.sequence},
            {"quality", p.quality},
            {"anomaly_score", p.anomaly_score},
            {"is_anomaly", p.is_anomaly}
        }}
    };
}

SignalGenerator::SignalGenerator(const std::string& source, uint64_t seed, double anomaly_probability)
: source_(source), kind_(source_kind_from_name(source)),
  anomaly_probability_(std::clamp(anomaly_probability, 0.0, 1.0)) {
    if (seed == 0) {
        rng_.seed((unsigned)std::chrono::high_resolution_clock::now().time_since_epoch().count());
    } else {
        rng_.seed(seed);
    }
    std::uniform_real_distribution<double> initial_trend(-kInitialTrendRange, kInitialTrendRange);
    trend_ = initial_trend(rng_);
    init_fields();
}

void SignalGenerator::init_fields() {
    auto uniform = [this](double lo, double hi) {
        std::uniform_real_distribution<double> d(lo, hi);
        return d(rng_);
    };
    switch (kind_) {
    case SourceKind::Stock:
        fields_ = {
            {"price", 100.0 + uniform(-20, 20)},
            {"volume", 1000000.0},
            {"market_cap", 1000000000.0}
        };
        break;
    case SourceKind::Sensor:
        fields_ = {
            {"temperature", 20.0 + uniform(-5, 15)},
            {"humidity", 50.0 + uniform(-20, 20)},
            {"pressure", 1013.25 + uniform(-50, 50)},
            {"light", uniform(0, 1000)}
        };
        break;
    case SourceKind::Network:
        fields_ = {
            {"bandwidth", uniform(100, 1000)},
            {"latency", 10.0 + uniform(0, 50)},
            {"packets", uniform(1000, 10000)},
            {"errors", uniform(0, 10)}
        };
        break;
    case SourceKind::Crypto:
        fields_ = {
            {"price", 50000.0 + uniform(-10000, 20000)},
            {"volume", uniform(100000000, 1000000000)},
            {"market_cap", 1000000000000.0},
            {"dominance", uniform(40, 60)}
        };
        break;
    case SourceKind::Weather:
        fields_ = {
            {"temperature", 15.0 + uniform(-10, 25)},
            {"humidity", 40.0 + uniform(-20, 40)},
            {"wind_speed", uniform(0, 30)},
            {"pressure", 1013.25 + uniform(-40, 40)},
            {"precipitation", uniform(0, 10)}
        };
        break;
    case SourceKind::Generic:
        fields_ = {{"value", 50.0}};
        break;
    }
}

double SignalGenerator::clamp_field(const std::string& field, double value, double prior) {
    if (field == "price") {
        if (value < 0) return prior * kPriceFloorRatio;
    } else if (field == "humidity" || field == "dominance") {
        return std::clamp(value, 0.0, 100.0);
    } else if (field == "temperature") {
        return std::clamp(value, -50.0, 60.0);
    }
    return value;
}

double SignalGenerator::round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

void SignalGenerator::walk_trend_locked() {
    std::uniform_real_distribution<double> step(-kTrendStep, kTrendStep);
    trend_ = std::clamp(trend_ + step(rng_), -kTrendLimit, kTrendLimit);
}

double SignalGenerator::next_value_locked(const std::string& field, double base, double seasonal) {
    walk_trend_locked();
    std::normal_distribution<double> noise(0.0, kVolatility);
    double raw = base * (1.0 + trend_ + seasonal + noise(rng_));
    double out = round2(clamp_field(field, raw, base));
    for (auto& [name, value] : fields_) {
        if (name == field) {
            value = out;
            break;
        }
    }
    return out;
}

double SignalGenerator::next_value(const std::string& field, double base) {
    double seasonal = kSeasonalAmplitude * std::sin(clock::now_seconds() / kSeasonalPeriodSeconds);
    std::lock_guard<std::mutex> lk(m_);
    return next_value_locked(field, base, seasonal);
}

DataPoint SignalGenerator::generate_data_point() {
    DataPoint p;
    p.timestamp = clock::iso_timestamp();
    p.source = source_;
    p.sequence = clock::now_ms() % 1000000;
    // one seasonal phase for the whole point
    double seasonal = kSeasonalAmplitude * std::sin(clock::now_seconds() / kSeasonalPeriodSeconds);

    std::lock_guard<std::mutex> lk(m_);
    std::bernoulli_distribution anomaly(anomaly_probability_);
    p.is_anomaly = anomaly(rng_);

    p.values.reserve(fields_.size());
    for (size_t i = 0; i < fields_.size(); ++i) {
        const std::string field = fields_[i].first;
        double value = next_value_locked(field, fields_[i].second, seasonal);
        if (p.is_anomaly) {
            // spike is emitted only, the stored base keeps the un-spiked value
            value = round2(clamp_field(field, value * (1.0 + kAnomalySpike), value));
        }
        p.values.emplace_back(field, value);
    }

    std::uniform_real_distribution<double> quality(0.95, 1.0);
    std::uniform_real_distribution<double> anomaly_score(0.0, 0.1);
    p.quality = quality(rng_);
    p.anomaly_score = anomaly_score(rng_);
    return p;
}

double SignalGenerator::trend() const {
    std::lock_guard<std::mutex> lk(m_);
    return trend_;
}

std::vector<std::string> SignalGenerator::field_names() const {
    std::lock_guard<std::mutex> lk(m_);
    std::vector<std::string> out;
    out.reserve(fields_.size());
    for (const auto& f : fields_) out.push_back(f.first);
    return out;
}

double SignalGenerator::field_value(const std::string& field) const {
    std::lock_guard<std::mutex> lk(m_);
    for (const auto& [name, value] : fields_) {
        if (name == field) return value;
    }
    return std::numeric_limits<double>::quiet_NaN();
}

} // namespace tickflow
