// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/filesystem/JsonFileUtils.hpp"

#include <QtCore/QFile>
#include <QtCore/QJsonParseError>
#include <QtCore/QSaveFile>

namespace Utils::JsonFileUtils {

Result writeObjectAtomic(const QString& path, const QJsonObject& object, QJsonDocument::JsonFormat format)
{
    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty())
        return Result::failure(QStringLiteral("JSON output path is empty."));

    QSaveFile file(cleanedPath);
    if (!file.open(QIODevice::WriteOnly))
        return Result::failure(QStringLiteral("Failed to open file for writing: %1 (%2)")
                                   .arg(cleanedPath, file.errorString()));

    if (file.write(QJsonDocument(object).toJson(format)) < 0) {
        const QString error = file.errorString();
        file.cancelWriting();
        return Result::failure(QStringLiteral("Failed to write JSON file: %1 (%2)").arg(cleanedPath, error));
    }

    if (!file.commit())
        return Result::failure(QStringLiteral("Failed to commit JSON file: %1 (%2)")
                                   .arg(cleanedPath, file.errorString()));
    return Result::success();
}

QJsonObject parseObject(const QByteArray& bytes, QString* error)
{
    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error) {
            *error = QStringLiteral("Malformed JSON at offset %1: %2")
                         .arg(parseError.offset)
                         .arg(parseError.errorString());
        }
        return {};
    }

    if (!doc.isObject()) {
        if (error)
            *error = QStringLiteral("JSON document root is not an object.");
        return {};
    }

    if (error)
        error->clear();
    return doc.object();
}

QJsonObject readObject(const QString& path, QString* error)
{
    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty()) {
        if (error)
            *error = QStringLiteral("JSON input path is empty.");
        return {};
    }

    QFile file(cleanedPath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = QStringLiteral("Failed to open JSON file: %1 (%2)")
                         .arg(cleanedPath, file.errorString());
        }
        return {};
    }

    QString parseError;
    const QJsonObject object = parseObject(file.readAll(), &parseError);
    if (!parseError.isEmpty()) {
        if (error)
            *error = QStringLiteral("%1: %2").arg(cleanedPath, parseError);
        return {};
    }

    if (error)
        error->clear();
    return object;
}

} // namespace Utils::JsonFileUtils
