#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tickflow {

class SignalGenerator;

// Owns one SignalGenerator per source name. Generators are created on first
// use and live as long as the registry. Names outside the listed kinds get a
// generic generator; at most max_custom_sources of those exist at a time.
class SourceRegistry {
public:
    static constexpr size_t kMaxSourceNameLength = 64;
    static constexpr size_t kDefaultMaxCustomSources = 16;

    // seed == 0 gives every generator a clock seed; otherwise seed + hash(name)
    explicit SourceRegistry(uint64_t seed = 0, double anomaly_probability = 0.05,
                            size_t max_custom_sources = kDefaultMaxCustomSources);

    // First caller creates the generator, concurrent callers get the same one.
    // Throws ProtocolError (E1405) for an over-long name or when the custom
    // source limit is reached; nothing is created in that case.
    std::shared_ptr<SignalGenerator> get_or_create(const std::string& source);

    std::shared_ptr<SignalGenerator> find(const std::string& source) const;

    // Names with a live generator, sorted
    std::vector<std::string> active_sources() const;

    size_t size() const;

private:
    uint64_t seed_;
    double anomaly_probability_;
    size_t max_custom_sources_;
    size_t custom_sources_ = 0;
    std::map<std::string, std::shared_ptr<SignalGenerator>> generators_;
    mutable std::mutex registry_mutex_;
};

} // namespace tickflow
