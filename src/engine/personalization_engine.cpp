#include "engine/personalization_engine.hpp"

namespace nudge {

namespace {

void replaceInContent(RenderedContent &content,
                      const std::string &placeholder,
                      const std::string &value)
{
    replaceAll(content.title, placeholder, value);
    replaceAll(content.body, placeholder, value);
    if (content.subtitle.has_value()) {
        replaceAll(*content.subtitle, placeholder, value);
    }
}

} // namespace

void replaceAll(std::string &text, const std::string &placeholder, const std::string &value)
{
    if (placeholder.empty()) {
        return;
    }
    std::string::size_type pos = 0;
    while ((pos = text.find(placeholder, pos)) != std::string::npos) {
        text.replace(pos, placeholder.size(), value);
        pos += value.size();
    }
}

PersonalizationEngine::PersonalizationEngine(uint64_t seed)
    : m_rng(seed)
{
}

const std::vector<std::string> &PersonalizationEngine::motivationalQuotes()
{
    static const std::vector<std::string> quotes = {
        "Every moment is a fresh beginning.",
        "Peace comes from within. Do not seek it without.",
        "The present moment is the only time over which we have dominion.",
        "Meditation is not evasion; it is a serene encounter with reality.",
        "Your mind is a garden. Your thoughts are the seeds."
    };
    return quotes;
}

const std::vector<std::string> &PersonalizationEngine::wellnessTips()
{
    static const std::vector<std::string> tips = {
        "Take three deep breaths before starting any important task",
        "Practice gratitude by writing down three things you're thankful for",
        "Step outside for fresh air and natural light",
        "Stay hydrated by drinking water regularly throughout the day",
        "Take short breaks every hour to stretch and reset"
    };
    return tips;
}

RenderedContent PersonalizationEngine::render(
    const NotificationTemplate &tmpl,
    const std::map<std::string, std::string> &values,
    const std::optional<PersonalizationProfile> &profile)
{
    RenderedContent content{tmpl.title, tmpl.body, tmpl.subtitle};

    for (const auto &entry : values) {
        replaceInContent(content, "{" + entry.first + "}", entry.second);
    }

    // Runs after explicit values so those win on shared keys.
    if (profile.has_value()) {
        if (profile->userName.has_value()) {
            replaceInContent(content, "{userName}", *profile->userName);
        }
        replaceInContent(content, "{preferredTime}", profile->preferredReminderTime);
        replaceInContent(content, "{duration}",
                         std::to_string(profile->preferredSessionDuration));
    }

    switch (tmpl.type) {
    case NotificationType::Motivation:
        replaceInContent(content, "{motivationalQuote}", draw(motivationalQuotes()));
        break;
    case NotificationType::Educational:
        replaceInContent(content, "{tip}", draw(wellnessTips()));
        break;
    default:
        break;
    }

    return content;
}

const std::string &PersonalizationEngine::draw(const std::vector<std::string> &choices)
{
    std::uniform_int_distribution<std::size_t> dist(0, choices.size() - 1);
    return choices[dist(m_rng)];
}

} // namespace nudge
