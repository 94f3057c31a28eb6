#include "engine/template_catalog.hpp"

#include <string>
#include <utility>

namespace nudge {

namespace {

NotificationTemplate makeTemplate(std::string id,
                                  NotificationType type,
                                  std::string title,
                                  std::string body,
                                  std::string category,
                                  NotificationPriority priority,
                                  std::vector<std::string> tags,
                                  std::vector<std::string> fields)
{
    NotificationTemplate tmpl;
    tmpl.id = std::move(id);
    tmpl.type = type;
    tmpl.title = std::move(title);
    tmpl.body = std::move(body);
    tmpl.category = std::move(category);
    tmpl.priority = priority;
    tmpl.tags = std::move(tags);
    tmpl.personalizationFields = std::move(fields);
    return tmpl;
}

} // namespace

std::vector<NotificationTemplate> defaultTemplates()
{
    return {
        // Welcome series
        makeTemplate("welcome_day1",
                     NotificationType::Welcome,
                     "Welcome to your practice! \xF0\x9F\x8C\x9F",
                     "Start your wellness journey with personalized meditation and "
                     "mindfulness practices.",
                     "GENERAL",
                     NotificationPriority::High,
                     {"welcome", "onboarding"},
                     {"userName"}),
        makeTemplate("welcome_day3",
                     NotificationType::Welcome,
                     "Ready to explore? \xF0\x9F\xA7\xAD",
                     "Discover guided meditations, breathing exercises, and mindfulness "
                     "techniques tailored just for you.",
                     "GENERAL",
                     NotificationPriority::Medium,
                     {"welcome", "exploration"},
                     {}),

        // Daily reminders
        makeTemplate("daily_meditation",
                     NotificationType::Reminder,
                     "Time for mindfulness \xF0\x9F\xA7\x98",
                     "Take {duration} minutes to center yourself with today's guided "
                     "meditation.",
                     "REMINDER",
                     NotificationPriority::Medium,
                     {"daily", "meditation"},
                     {"duration", "preferredTime"}),
        makeTemplate("breathing_reminder",
                     NotificationType::Reminder,
                     "Breathe and reset \xF0\x9F\x92\xA8",
                     "A quick 2-minute breathing exercise can help you refocus and "
                     "energize.",
                     "REMINDER",
                     NotificationPriority::Low,
                     {"breathing", "quick"},
                     {}),

        // Achievements
        makeTemplate("streak_milestone",
                     NotificationType::Achievement,
                     "Amazing streak! \xF0\x9F\x94\xA5",
                     "Congratulations! You've maintained your {streakType} practice for "
                     "{days} days straight!",
                     "ACHIEVEMENT",
                     NotificationPriority::High,
                     {"streak", "milestone"},
                     {"streakType", "days"}),
        makeTemplate("session_completion",
                     NotificationType::Achievement,
                     "Session complete! \xE2\x9C\xA8",
                     "Great job finishing your {sessionType} session. You're {percentage}% "
                     "closer to your weekly goal!",
                     "ACHIEVEMENT",
                     NotificationPriority::Medium,
                     {"completion", "progress"},
                     {"sessionType", "percentage"}),

        makeTemplate("weekly_motivation",
                     NotificationType::Motivation,
                     "Your weekly insight \xF0\x9F\x92\xA1",
                     "{motivationalQuote} - Take a moment to reflect on your wellness "
                     "journey.",
                     "GENERAL",
                     NotificationPriority::Low,
                     {"motivation", "weekly"},
                     {"motivationalQuote"}),

        makeTemplate("wellness_tip",
                     NotificationType::Educational,
                     "Wellness tip of the day \xF0\x9F\x8C\xB1",
                     "{tip} Try incorporating this into your daily routine for better "
                     "well-being.",
                     "GENERAL",
                     NotificationPriority::Low,
                     {"tip", "education"},
                     {"tip"}),

        makeTemplate("friend_achievement",
                     NotificationType::Social,
                     "Friend's milestone! \xF0\x9F\x91\xA5",
                     "{friendName} just completed their {milestone}. Send them some "
                     "encouragement!",
                     "SOCIAL",
                     NotificationPriority::Medium,
                     {"social", "friend", "milestone"},
                     {"friendName", "milestone"}),

        makeTemplate("update_available",
                     NotificationType::System,
                     "App update available \xF0\x9F\x93\xB1",
                     "New features and improvements are ready. Update now for the best "
                     "experience.",
                     "SYSTEM",
                     NotificationPriority::Medium,
                     {"update", "system"},
                     {}),
    };
}

} // namespace nudge
