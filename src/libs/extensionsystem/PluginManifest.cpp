// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/PluginManifest.hpp"

#include <utils/PathUtils.hpp>
#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonValue>

#include <utility>

namespace aics {

namespace {

using namespace Qt::StringLiterals;

const QString kId = u"id"_s;
const QString kName = u"name"_s;
const QString kVersion = u"version"_s;
const QString kAuthor = u"author"_s;
const QString kDescription = u"description"_s;
const QString kIcon = u"icon"_s;
const QString kHomepage = u"homepage"_s;
const QString kCapabilities = u"capabilities"_s;
const QString kPermissions = u"permissions"_s;
const QString kDependencies = u"dependencies"_s;
const QString kEntryPoint = u"entryPoint"_s;
const QString kMinimumAppVersion = u"minimumAppVersion"_s;

PluginError requireString(const QJsonObject& object, const QString& key, QString& out, bool allowEmpty)
{
    const QJsonValue value = object.value(key);
    if (value.isUndefined())
        return PluginError::parse(QStringLiteral("Manifest is missing required field '%1'.").arg(key));
    if (!value.isString())
        return PluginError::parse(QStringLiteral("Manifest field '%1' must be a string.").arg(key));

    const QString text = value.toString().trimmed();
    if (!allowEmpty && text.isEmpty())
        return PluginError::parse(QStringLiteral("Manifest field '%1' must not be empty.").arg(key));

    out = text;
    return PluginError::none();
}

PluginError optionalString(const QJsonObject& object, const QString& key, QString& out)
{
    const QJsonValue value = object.value(key);
    if (value.isUndefined() || value.isNull()) {
        out.clear();
        return PluginError::none();
    }
    if (!value.isString())
        return PluginError::parse(QStringLiteral("Manifest field '%1' must be a string.").arg(key));

    out = value.toString().trimmed();
    return PluginError::none();
}

PluginError stringArray(const QJsonObject& object, const QString& key, bool required, QStringList& out)
{
    out.clear();
    const QJsonValue value = object.value(key);
    if (value.isUndefined() || (!required && value.isNull())) {
        if (required)
            return PluginError::parse(QStringLiteral("Manifest is missing required field '%1'.").arg(key));
        return PluginError::none();
    }
    if (!value.isArray())
        return PluginError::parse(QStringLiteral("Manifest field '%1' must be an array.").arg(key));

    const QJsonArray array = value.toArray();
    for (const QJsonValue& entry : array) {
        if (!entry.isString())
            return PluginError::parse(QStringLiteral("Manifest field '%1' must only contain strings.").arg(key));
        out.push_back(entry.toString().trimmed());
    }
    return PluginError::none();
}

QJsonArray toJsonArray(const QStringList& list)
{
    QJsonArray array;
    for (const QString& s : list)
        array.append(s);
    return array;
}

} // namespace

bool PluginManifest::isValidId(QStringView id)
{
    if (id.isEmpty())
        return false;

    for (QChar c : id) {
        if (!(c.isLetterOrNumber() || c == u'_' || c == u'-' || c == u'.'))
            return false;
    }
    return true;
}

bool PluginManifest::isValidVersion(QStringView version)
{
    qsizetype suffixIndex = -1;
    const QVersionNumber number = QVersionNumber::fromString(version, &suffixIndex);
    if (number.isNull())
        return false;
    if (suffixIndex == version.size())
        return true;

    const QChar next = version.at(suffixIndex);
    return (next == u'-' || next == u'+') && suffixIndex + 1 < version.size();
}

PluginError PluginManifest::parse(const QByteArray& bytes, PluginManifest& out)
{
    QString jsonError;
    const QJsonObject root = Utils::JsonFileUtils::parseObject(bytes, &jsonError);
    if (!jsonError.isEmpty())
        return PluginError::parse(QStringLiteral("Manifest is not valid JSON: %1").arg(jsonError));

    return fromJson(root, out);
}

PluginError PluginManifest::fromJson(const QJsonObject& object, PluginManifest& out)
{
    PluginManifest m;

    for (const auto& field : {std::pair{&kId, &m.id},
                              std::pair{&kName, &m.name},
                              std::pair{&kVersion, &m.version},
                              std::pair{&kEntryPoint, &m.entryPoint},
                              std::pair{&kMinimumAppVersion, &m.minimumAppVersion}}) {
        if (auto err = requireString(object, *field.first, *field.second, false); !err.ok())
            return err;
    }
    if (auto err = requireString(object, kAuthor, m.author, true); !err.ok())
        return err;
    if (auto err = requireString(object, kDescription, m.description, true); !err.ok())
        return err;
    if (auto err = optionalString(object, kIcon, m.icon); !err.ok())
        return err;
    if (auto err = optionalString(object, kHomepage, m.homepage); !err.ok())
        return err;

    if (!isValidId(m.id))
        return PluginError::parse(QStringLiteral("Invalid plugin id '%1'.").arg(m.id));
    if (!isValidVersion(m.version))
        return PluginError::parse(QStringLiteral("Invalid version '%1' in plugin %2.").arg(m.version, m.id));
    if (!isValidVersion(m.minimumAppVersion)) {
        return PluginError::parse(QStringLiteral("Invalid minimumAppVersion '%1' in plugin %2.")
                                      .arg(m.minimumAppVersion, m.id));
    }

    if (!Utils::PathUtils::isContainedRelativePath(m.entryPoint)) {
        return PluginError::parse(QStringLiteral("Entry point '%1' of plugin %2 must be a path inside the bundle.")
                                      .arg(m.entryPoint, m.id));
    }
    m.entryPoint = Utils::PathUtils::normalizePath(m.entryPoint);

    QStringList names;
    if (auto err = stringArray(object, kCapabilities, true, names); !err.ok())
        return err;
    for (const QString& name : names) {
        const auto capability = capabilityFromString(name);
        if (!capability)
            return PluginError::parse(QStringLiteral("Unknown capability '%1' in plugin %2.").arg(name, m.id));
        m.capabilities |= *capability;
    }

    if (auto err = stringArray(object, kPermissions, true, names); !err.ok())
        return err;
    for (const QString& name : names) {
        const auto permission = permissionFromString(name);
        if (!permission)
            return PluginError::parse(QStringLiteral("Unknown permission '%1' in plugin %2.").arg(name, m.id));
        m.permissions |= *permission;
    }

    if (auto err = stringArray(object, kDependencies, false, names); !err.ok())
        return err;
    for (const QString& dep : names) {
        if (!isValidId(dep))
            return PluginError::parse(QStringLiteral("Invalid dependency id '%1' in plugin %2.").arg(dep, m.id));
        if (dep == m.id)
            return PluginError::parse(QStringLiteral("Plugin %1 depends on itself.").arg(m.id));
        if (!m.dependencies.contains(dep))
            m.dependencies.push_back(dep);
    }

    out = std::move(m);
    return PluginError::none();
}

QJsonObject PluginManifest::toJson() const
{
    QJsonObject o;
    o.insert(kId, id);
    o.insert(kName, name);
    o.insert(kVersion, version);
    o.insert(kAuthor, author);
    o.insert(kDescription, description);
    if (!icon.isEmpty())
        o.insert(kIcon, icon);
    if (!homepage.isEmpty())
        o.insert(kHomepage, homepage);
    o.insert(kCapabilities, toJsonArray(toStringList(capabilities)));
    o.insert(kPermissions, toJsonArray(toStringList(permissions)));
    if (!dependencies.isEmpty())
        o.insert(kDependencies, toJsonArray(dependencies));
    o.insert(kEntryPoint, entryPoint);
    o.insert(kMinimumAppVersion, minimumAppVersion);
    return o;
}

QByteArray PluginManifest::serialize() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Indented);
}

QVersionNumber PluginManifest::versionNumber() const
{
    return QVersionNumber::fromString(version);
}

QVersionNumber PluginManifest::minimumAppVersionNumber() const
{
    return QVersionNumber::fromString(minimumAppVersion);
}

bool PluginManifest::requiresNewerHost(const QVersionNumber& hostVersion) const
{
    return QVersionNumber::compare(minimumAppVersionNumber(), hostVersion) > 0;
}

} // namespace aics
