/**
 * @file incident_synthesizer.hpp
 * @brief Stochastic generation of synthetic incidents from intrusion-set profiles
 *
 * Produces plausible incidents (bags of semantic-id tokens) for an intrusion
 * set so that a classifier can be trained without labeled field data.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "attributor/model/entity.hpp"
#include "attributor/utils/discrete_sampler.hpp"

namespace attributor {
namespace generators {

/**
 * @brief Draw an incident size in [lbound, ubound]
 *
 * Beta-Binomial(ubound - lbound, alpha, beta) shifted by lbound, sampled
 * through an alias table. Builds a fresh table on every call; use
 * IncidentSynthesizer for repeated draws.
 *
 * @throws std::invalid_argument if lbound >= ubound
 */
int GenerateIncidentSize(int lbound, int ubound, std::mt19937_64& rng,
                         double alpha = 1.5, double beta = 10.0);

/**
 * @class IncidentSynthesizer
 * @brief Generates training incidents for one profile at a time
 *
 * **Algorithm**:
 * 1. Draw the incident size (right-skewed, mostly close to min_size) and cap
 *    it to the number of entities in the profile
 * 2. Split it into category shares: attack patterns 50%, tools 20%,
 *    malware 20%, other 10% (each rounded up)
 * 3. Attack patterns, tools and malware are drawn with replacement and then
 *    deduplicated, so fewer tokens than the share may come out. "Other"
 *    (indicators, vulnerabilities, identities, locations) is drawn without
 *    replacement.
 *
 * **Thread Safety**: NOT thread-safe (owns a random engine).
 *
 * **Usage Example**:
 * @code
 * IncidentSynthesizer synthesizer;
 * for (int i = 0; i < 100; ++i) {
 *     auto tokens = synthesizer.Generate(profile);
 *     corpus.push_back(StringUtils::Join(tokens, " "));
 * }
 * @endcode
 */
class IncidentSynthesizer {
public:
    /**
     * @struct Config
     * @brief Synthesizer configuration
     */
    struct Config {
        int min_size{10};                        ///< Smallest incident
        int max_size{50};                        ///< Largest incident
        double size_alpha{1.5};                  ///< Beta-Binomial alpha
        double size_beta{10.0};                  ///< Beta-Binomial beta
        double attack_pattern_fraction{0.5};     ///< Share of attack patterns
        double tool_fraction{0.2};               ///< Share of tools
        double malware_fraction{0.2};            ///< Share of malware
        double other_fraction{0.1};              ///< Share of all remaining kinds
        std::optional<std::uint64_t> seed;       ///< Fixed seed (random_device if unset)
    };

    IncidentSynthesizer();

    /**
     * @brief Construct synthesizer
     * @throws std::invalid_argument if min_size >= max_size or min_size < 0
     */
    explicit IncidentSynthesizer(const Config& config,
                                 std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @brief Generate one incident
     * @return Semantic ids in category order: attack patterns, tools, malware, other
     */
    std::vector<std::string> Generate(const model::IntrusionSetProfile& profile);

    /**
     * @brief Generate one incident with an explicit target size
     *
     * The size is still capped to the profile's entity count.
     */
    std::vector<std::string> GenerateWithSize(const model::IntrusionSetProfile& profile,
                                              int incident_size);

    /**
     * @brief Draw an incident size from the configured distribution
     */
    int DrawIncidentSize();

    const Config& GetConfig() const { return config_; }

private:
    /**
     * @brief ceil(incident_size * fraction) draws with replacement, deduplicated
     */
    std::vector<std::string> SampleWithReplacement(const std::vector<model::Entity>& source,
                                                   int incident_size, double fraction);

    /**
     * @brief min(available, ceil(incident_size * fraction)) draws without replacement
     */
    std::vector<std::string> SampleWithoutReplacement(const std::vector<const model::Entity*>& source,
                                                      int incident_size, double fraction);

    Config config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::mt19937_64 rng_;
    utils::AliasSampler size_sampler_;
};

} // namespace generators
} // namespace attributor
