// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Result.hpp"
#include "utils/UtilsGlobal.hpp"

#include <QtCore/QDir>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include <functional>

namespace Utils::FileSystemUtils {

AICS_UTILS_EXPORT QString uniqueChildName(const QDir& dir, const QString& baseName, const QString& ext);

// Regular files below `root`, as '/'-separated relative paths in byte order.
// Symlinks are not followed.
AICS_UTILS_EXPORT QStringList relativeFilesRecursively(const QString& root);

// Copies the tree below `source` into `destination` (created if missing).
// `shouldStop` is polled between files; a stop request fails the copy.
AICS_UTILS_EXPORT Result copyDirectoryRecursively(const QString& source,
                                                  const QString& destination,
                                                  const std::function<bool()>& shouldStop = {});

// Removes a directory tree. Succeeds when nothing exists at `path`.
AICS_UTILS_EXPORT Result removeDirectoryRecursively(const QString& path);

} // namespace Utils::FileSystemUtils
