// EN: Generated object names with a random suffix, bounded to the 63-character name limit
// FR: Noms d'objets générés avec suffixe aléatoire, bornés à la limite de 63 caractères

#pragma once

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace PRR::Reconciler {

inline constexpr size_t MAX_NAME_LENGTH = 63;
inline constexpr size_t RANDOM_SUFFIX_LENGTH = 5;

namespace detail {

class INameGenerator {
public:
    virtual ~INameGenerator() = default;

    // EN: Return "<base>-<suffix>", never longer than MAX_NAME_LENGTH.
    // FR: Retourne "<base>-<suffixe>", jamais plus long que MAX_NAME_LENGTH.
    virtual std::string generate(const std::string& base) = 0;
};

} // namespace detail

class RandomNameGenerator : public detail::INameGenerator {
public:
    RandomNameGenerator();
    explicit RandomNameGenerator(uint32_t seed);

    std::string generate(const std::string& base) override;

    // EN: Cut the base so that base + "-" + suffix fits the limit.
    // FR: Coupe la base pour que base + "-" + suffixe tienne dans la limite.
    static std::string restrictBase(const std::string& base);

private:
    std::mutex mutex_;
    std::mt19937 generator_;
};

} // namespace PRR::Reconciler
