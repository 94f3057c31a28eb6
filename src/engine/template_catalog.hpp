#pragma once

#include <vector>

#include "common/models.hpp"

namespace nudge {

// Built-in catalog installed when no persisted catalog exists.
std::vector<NotificationTemplate> defaultTemplates();

} // namespace nudge
