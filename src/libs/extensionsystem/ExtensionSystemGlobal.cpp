// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/ExtensionSystemGlobal.hpp"

// doc: https://doc.qt.io/qt-6/qloggingcategory.html#creating-category-objects
Q_LOGGING_CATEGORY(aicsExtensionSystemLog, "aics.extensionsystem")
Q_LOGGING_CATEGORY(aicsHostApiLog, "aics.hostapi")
