#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace nudge {

// PersonalizationEngine renders a template into concrete title/body/subtitle
// text. Rendering is pure except for the quote/tip draw for motivation and
// educational templates, which comes from a seedable generator.
class PersonalizationEngine {
public:
    explicit PersonalizationEngine(uint64_t seed = std::random_device{}());

    // Substitution order: explicit values, then profile fields ({userName},
    // {preferredTime}, {duration}), then type-specific dynamic content.
    // Placeholders with no value are left verbatim.
    RenderedContent render(const NotificationTemplate &tmpl,
                           const std::map<std::string, std::string> &values,
                           const std::optional<PersonalizationProfile> &profile);

    static const std::vector<std::string> &motivationalQuotes();
    static const std::vector<std::string> &wellnessTips();

private:
    const std::string &draw(const std::vector<std::string> &choices);

    std::mt19937_64 m_rng;
};

// Replaces every literal occurrence of `placeholder` in `text`.
void replaceAll(std::string &text, const std::string &placeholder, const std::string &value);

} // namespace nudge
