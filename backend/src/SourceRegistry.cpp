#include "SourceRegistry.hpp"
#include "SignalGenerator.hpp"
#include "core/ErrorCatalog.hpp"
#include <functional>
#include <iostream>

namespace tickflow {

SourceRegistry::SourceRegistry(uint64_t seed, double anomaly_probability, size_t max_custom_sources)
: seed_(seed), anomaly_probability_(anomaly_probability), max_custom_sources_(max_custom_sources) {}

std::shared_ptr<SignalGenerator> SourceRegistry::get_or_create(const std::string& source) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = generators_.find(source);
    if (it != generators_.end()) return it->second;

    if (source.size() > kMaxSourceNameLength) {
        throw ProtocolError(errors::E1405_SOURCE_REJECTED,
                            errors::format_E1405_source_rejected(errors::D1405_NAME_TOO_LONG));
    }
    bool custom = source_kind_from_name(source) == SourceKind::Generic;
    if (custom && custom_sources_ >= max_custom_sources_) {
        throw ProtocolError(errors::E1405_SOURCE_REJECTED,
                            errors::format_E1405_source_rejected(errors::D1405_SOURCE_LIMIT));
    }

    uint64_t generator_seed = seed_ ? seed_ + std::hash<std::string>{}(source) : 0;
    auto gen = std::make_shared<SignalGenerator>(source, generator_seed, anomaly_probability_);
    generators_.emplace(source, gen);
    if (custom) ++custom_sources_;
    std::cout << "SourceRegistry: created generator '" << source << "' (kind="
              << to_string(gen->kind()) << ")" << std::endl;
    return gen;
}

std::shared_ptr<SignalGenerator> SourceRegistry::find(const std::string& source) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = generators_.find(source);
    if (it == generators_.end()) return nullptr;
    return it->second;
}

std::vector<std::string> SourceRegistry::active_sources() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::vector<std::string> out;
    out.reserve(generators_.size());
    for (const auto& [name, _] : generators_) out.push_back(name);
    return out;
}

size_t SourceRegistry::size() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return generators_.size();
}

} // namespace tickflow
