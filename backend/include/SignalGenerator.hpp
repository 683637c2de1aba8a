#pragma once
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace tickflow {

enum class SourceKind { Stock, Sensor, Network, Crypto, Weather, Generic };

std::string to_string(SourceKind kind);
// Unknown names map to SourceKind::Generic
SourceKind source_kind_from_name(const std::string& name);
// Kinds advertised to clients; generic is only a fallback and is not listed
const std::vector<std::string>& available_source_names();

/**
 * @brief One generated sample. Transient: built per tick and serialized.
 */
struct DataPoint {
    std::string timestamp;
    std::string source;
    std::vector<std::pair<std::string, double>> values;
    int64_t sequence = 0;
    double quality = 1.0;
    double anomaly_score = 0.0;
    bool is_anomaly = false;
};

void to_json(nlohmann::json& j, const DataPoint& p);

/**
 * @brief Bounded random-walk generator for one named source.
 *
 * The field set is fixed by the source kind at construction. Each update
 * multiplies the stored value by (1 + trend + seasonal + noise) and then
 * applies the clamp policy of clamp_field(). All public methods are
 * thread-safe; clients subscribed to the same source share one instance.
 */
class SignalGenerator {
public:
    static constexpr double kVolatility = 0.02;
    static constexpr double kTrendLimit = 0.005;
    static constexpr double kTrendStep = 0.0001;
    static constexpr double kInitialTrendRange = 0.001;
    static constexpr double kSeasonalAmplitude = 0.1;
    static constexpr double kSeasonalPeriodSeconds = 3600.0;
    static constexpr double kPriceFloorRatio = 0.1;
    static constexpr double kAnomalySpike = 0.25;
    static constexpr double kDefaultAnomalyProbability = 0.05;

    // seed == 0 seeds from the clock
    explicit SignalGenerator(const std::string& source, uint64_t seed = 0,
                             double anomaly_probability = kDefaultAnomalyProbability);

    const std::string& source() const { return source_; }
    SourceKind kind() const { return kind_; }

    /** @brief Advance every field once and package the result with metadata. */
    DataPoint generate_data_point();

    /**
     * @brief Advance a single field from `base`. Walks the shared trend,
     * clamps, rounds to 2 decimals and stores the result as the field's
     * new base (when the field belongs to this generator).
     */
    double next_value(const std::string& field, double base);

    double trend() const;
    std::vector<std::string> field_names() const;
    // Current stored value; NaN when the field does not exist
    double field_value(const std::string& field) const;

    static double clamp_field(const std::string& field, double value, double prior);
    static double round2(double v);

private:
    double next_value_locked(const std::string& field, double base, double seasonal);
    void walk_trend_locked();
    void init_fields();

    std::string source_;
    SourceKind kind_;
    std::vector<std::pair<std::string, double>> fields_;
    double trend_ = 0.0;
    double anomaly_probability_;
    std::mt19937_64 rng_;
    mutable std::mutex m_;
};

} // namespace tickflow
