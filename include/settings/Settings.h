#pragma once

#include <QSettings>
#include "version.h"

namespace ScreenCatch {

inline constexpr const char* kOrganizationName = SCREENCATCH_ORGANIZATION;
inline constexpr const char* kApplicationName = SCREENCATCH_APP_NAME;

inline QSettings getSettings()
{
    return QSettings(kOrganizationName, kApplicationName);
}

} // namespace ScreenCatch
