// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/PluginCatalog.hpp"

#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonArray>
#include <QtCore/QReadLocker>
#include <QtCore/QSet>
#include <QtCore/QUrl>
#include <QtCore/QWriteLocker>

namespace aics {

namespace {

using namespace Qt::StringLiterals;

const QString kPluginsKey = u"plugins"_s;
const QString kManifestKey = u"manifest"_s;
const QString kSourceKey = u"source"_s;

struct CategoryName {
    PluginCategory category;
    QString name;
};

const QList<CategoryName>& categoryNames()
{
    static const QList<CategoryName> names = {
        {PluginCategory::All, u"all"_s},
        {PluginCategory::Languages, u"languages"_s},
        {PluginCategory::Themes, u"themes"_s},
        {PluginCategory::Tools, u"tools"_s},
        {PluginCategory::Ai, u"ai"_s},
        {PluginCategory::Ui, u"ui"_s},
    };
    return names;
}

QString resolveSource(const QString& source, const QString& baseDirectory)
{
    const QUrl url(source);
    if (!url.scheme().isEmpty() && url.scheme().size() > 1)
        return source;
    if (baseDirectory.isEmpty() || QDir::isAbsolutePath(source))
        return source;
    return QDir::cleanPath(QDir(baseDirectory).absoluteFilePath(source));
}

} // namespace

QString toString(PluginCategory category)
{
    for (const CategoryName& entry : categoryNames()) {
        if (entry.category == category)
            return entry.name;
    }
    return {};
}

std::optional<PluginCategory> categoryFromString(QStringView text)
{
    for (const CategoryName& entry : categoryNames()) {
        if (text.compare(entry.name, Qt::CaseInsensitive) == 0)
            return entry.category;
    }
    return std::nullopt;
}

PluginCapability capabilityFor(PluginCategory category)
{
    switch (category) {
    case PluginCategory::All:
    case PluginCategory::Tools:
        return PluginCapability::Commands;
    case PluginCategory::Languages:
        return PluginCapability::LanguageSupport;
    case PluginCategory::Themes:
        return PluginCapability::Theme;
    case PluginCategory::Ai:
        return PluginCapability::Ai;
    case PluginCategory::Ui:
        return PluginCapability::Ui;
    }
    return PluginCapability::Commands;
}

Utils::Result PluginCatalog::loadFile(const QString& path)
{
    QString error;
    const QJsonObject root = Utils::JsonFileUtils::readObject(path, &error);
    if (!error.isEmpty())
        return Utils::Result::failure(error);
    return load(root, QFileInfo(path).absolutePath());
}

Utils::Result PluginCatalog::load(const QJsonObject& root, const QString& baseDirectory)
{
    const QJsonValue plugins = root.value(kPluginsKey);
    if (!plugins.isArray())
        return Utils::Result::failure(QStringLiteral("Catalog has no '%1' array.").arg(kPluginsKey));

    QList<CatalogEntry> loaded;
    QSet<QString> seen;
    const QJsonArray array = plugins.toArray();
    for (qsizetype i = 0; i < array.size(); ++i) {
        const QJsonObject object = array.at(i).toObject();

        CatalogEntry entry;
        if (const PluginError err = PluginManifest::fromJson(object.value(kManifestKey).toObject(), entry.manifest);
            !err.ok()) {
            qCWarning(aicsExtensionSystemLog).noquote() << "Skipping catalog entry" << i << "-" << err.message();
            continue;
        }

        const QString source = object.value(kSourceKey).toString().trimmed();
        if (source.isEmpty()) {
            qCWarning(aicsExtensionSystemLog) << "Skipping catalog entry" << entry.manifest.id << "- no source";
            continue;
        }
        if (seen.contains(entry.manifest.id)) {
            qCWarning(aicsExtensionSystemLog) << "Skipping duplicate catalog entry" << entry.manifest.id;
            continue;
        }

        seen.insert(entry.manifest.id);
        entry.source = resolveSource(source, baseDirectory);
        loaded.push_back(std::move(entry));
    }

    QWriteLocker locker(&m_lock);
    m_entries = std::move(loaded);
    return Utils::Result::success();
}

void PluginCatalog::clear()
{
    QWriteLocker locker(&m_lock);
    m_entries.clear();
}

QList<CatalogEntry> PluginCatalog::entries() const
{
    QReadLocker locker(&m_lock);
    return m_entries;
}

std::optional<CatalogEntry> PluginCatalog::entry(const QString& pluginId) const
{
    QReadLocker locker(&m_lock);
    for (const CatalogEntry& entry : m_entries) {
        if (entry.manifest.id == pluginId)
            return entry;
    }
    return std::nullopt;
}

int PluginCatalog::size() const
{
    QReadLocker locker(&m_lock);
    return int(m_entries.size());
}

QList<CatalogEntry> PluginCatalog::search(const QString& query, PluginCategory category) const
{
    const QString needle = query.trimmed();
    const PluginCapability capability = capabilityFor(category);

    QList<CatalogEntry> matches;
    QReadLocker locker(&m_lock);
    for (const CatalogEntry& entry : m_entries) {
        if (category != PluginCategory::All && !entry.manifest.capabilities.testFlag(capability))
            continue;
        if (!needle.isEmpty()
            && !entry.manifest.name.contains(needle, Qt::CaseInsensitive)
            && !entry.manifest.description.contains(needle, Qt::CaseInsensitive)) {
            continue;
        }
        matches.push_back(entry);
    }
    return matches;
}

} // namespace aics
