#pragma once

#include <QSettings>
#include "version.h"

namespace LayerKit {

inline constexpr const char* kOrganizationName = "LayerKit";
inline constexpr const char* kApplicationName = LAYERKIT_APP_NAME;

inline QSettings getSettings()
{
    return QSettings(kOrganizationName, kApplicationName);
}

} // namespace LayerKit
