// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QtGlobal>

#if defined(AICS_EXTENSIONSYSTEM_SHARED_LIBRARY)
#	define AICS_EXTENSIONSYSTEM_EXPORT Q_DECL_EXPORT
#elif defined(AICS_EXTENSIONSYSTEM_STATIC_LIBRARY)
#	define AICS_EXTENSIONSYSTEM_EXPORT
#else
#	define AICS_EXTENSIONSYSTEM_EXPORT Q_DECL_IMPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(aicsExtensionSystemLog)
Q_DECLARE_LOGGING_CATEGORY(aicsHostApiLog)
