// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/Qt>
#include <QtCore/QString>
#include <QtCore/QStringView>

namespace Utils::PathUtils {

AICS_UTILS_EXPORT QString normalizePath(QStringView path);
AICS_UTILS_EXPORT QString basename(QStringView path);
AICS_UTILS_EXPORT QString extension(QStringView path);

AICS_UTILS_EXPORT bool hasExtension(QStringView path,
                                    QStringView ext,
                                    Qt::CaseSensitivity cs = Qt::CaseInsensitive);

// True for relative paths that stay below their base once cleaned
// ("a/b", "a/../b"), false for absolute paths or anything climbing out ("../x").
AICS_UTILS_EXPORT bool isContainedRelativePath(QStringView relativePath);

// Resolves `relativePath` against `root` and reports whether the result lies
// inside `root`. Both are compared through the canonical form of their deepest
// existing ancestor, so symlinks leading out of the root are rejected even for
// files that do not exist yet. Returns an empty string when the path escapes.
AICS_UTILS_EXPORT QString resolveWithinRoot(const QString& root, const QString& relativePath);

// True when `path` is `root` itself or lies below it.
AICS_UTILS_EXPORT bool isWithinRoot(const QString& root, const QString& path);

} // namespace Utils::PathUtils
