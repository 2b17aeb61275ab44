#include "common/settings.hpp"
#include "common/errors.hpp"
#include "common/text.hpp"

#include <cstdlib>
#include <string>

namespace linksim {

namespace {

const char* lookup(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

double readDouble(const char* name, double fallback) {
    const char* raw = lookup(name);
    if (!raw) return fallback;
    try {
        size_t used = 0;
        double v = std::stod(raw, &used);
        if (used != std::string(raw).size()) throw std::invalid_argument(raw);
        return v;
    } catch (const std::exception&) {
        throw ConfigError(std::string("Invalid number for ") + name + ": " + raw);
    }
}

long long readInt(const char* name, long long fallback) {
    const char* raw = lookup(name);
    if (!raw) return fallback;
    try {
        size_t used = 0;
        long long v = std::stoll(raw, &used);
        if (used != std::string(raw).size()) throw std::invalid_argument(raw);
        return v;
    } catch (const std::exception&) {
        throw ConfigError(std::string("Invalid integer for ") + name + ": " + raw);
    }
}

bool readBool(const char* name, bool fallback) {
    const char* raw = lookup(name);
    if (!raw) return fallback;
    std::string v = toLower(raw);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw ConfigError(std::string("Invalid boolean for ") + name + ": " + raw);
}

} // namespace

SimulationSettings SimulationSettings::fromEnvironment() {
    SimulationSettings s;
    s.damping = readDouble("LINKSIM_DAMPING", s.damping);
    s.max_iter = static_cast<int>(readInt("LINKSIM_MAX_ITER", s.max_iter));
    s.tolerance = readDouble("LINKSIM_TOLERANCE", s.tolerance);
    s.eta_protect = readDouble("LINKSIM_ETA_PROTECT", s.eta_protect);
    s.eta_boost = readDouble("LINKSIM_ETA_BOOST", s.eta_boost);
    s.use_semantic_weights = readBool("LINKSIM_USE_SEMANTIC_WEIGHTS", s.use_semantic_weights);
    s.semantic_threshold = readDouble("LINKSIM_SEMANTIC_THRESHOLD", s.semantic_threshold);
    s.num_threads = static_cast<int>(readInt("LINKSIM_NUM_THREADS", s.num_threads));
    if (lookup("LINKSIM_SEED")) {
        s.rng_seed = static_cast<uint64_t>(readInt("LINKSIM_SEED", 0));
    }
    return s;
}

} // namespace linksim
