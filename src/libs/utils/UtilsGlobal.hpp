// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>

#if defined(AICS_UTILS_BUILD_SHARED) && (AICS_UTILS_BUILD_SHARED == 1)
#	if defined(AICS_UTILS_LIBRARY)
#		define AICS_UTILS_EXPORT Q_DECL_EXPORT
#	else
#		define AICS_UTILS_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define AICS_UTILS_EXPORT
#endif
