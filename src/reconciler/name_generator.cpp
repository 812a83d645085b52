// EN: Random-suffix name generator
// FR: Générateur de noms à suffixe aléatoire

#include "reconciler/name_generator.hpp"

namespace PRR::Reconciler {

namespace {
constexpr const char SUFFIX_ALPHABET[] = "bcdfghjklmnpqrstvwxz2456789";
}

RandomNameGenerator::RandomNameGenerator() : generator_(std::random_device{}()) {}

RandomNameGenerator::RandomNameGenerator(uint32_t seed) : generator_(seed) {}

std::string RandomNameGenerator::restrictBase(const std::string& base) {
    const size_t max_base = MAX_NAME_LENGTH - RANDOM_SUFFIX_LENGTH - 1;
    if (base.size() <= max_base) {
        return base;
    }
    return base.substr(0, max_base);
}

std::string RandomNameGenerator::generate(const std::string& base) {
    std::uniform_int_distribution<size_t> pick(0, sizeof(SUFFIX_ALPHABET) - 2);

    std::string suffix;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < RANDOM_SUFFIX_LENGTH; ++i) {
            suffix.push_back(SUFFIX_ALPHABET[pick(generator_)]);
        }
    }
    return restrictBase(base) + "-" + suffix;
}

} // namespace PRR::Reconciler
