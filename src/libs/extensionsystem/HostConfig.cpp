// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/HostConfig.hpp"

#include "extensionsystem/HostRequest.hpp"
#include "extensionsystem/PluginManifest.hpp"

#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QStandardPaths>

namespace aics {

namespace {

using namespace Qt::StringLiterals;

const QString kPluginsDirectory = u"pluginsDirectory"_s;
const QString kHostVersion = u"hostVersion"_s;
const QString kApiVersion = u"apiVersion"_s;
const QString kEnvironment = u"environment"_s;
const QString kActivationTimeout = u"activationTimeoutMs"_s;
const QString kCleanupTimeout = u"cleanupTimeoutMs"_s;
const QString kCommandTimeout = u"commandTimeoutMs"_s;
const QString kInstallTimeout = u"installTimeoutMs"_s;
const QString kWorkspaceRoot = u"workspaceRoot"_s;
const QString kCatalog = u"catalog"_s;
const QString kTrust = u"trust"_s;
const QString kRequireSignature = u"requireSignature"_s;
const QString kPublishers = u"publishers"_s;

// Each reader leaves `out` untouched when the key is absent.
class Reader
{
public:
    Reader(const QJsonObject& object, QString baseDirectory, Utils::Result& result)
        : m_object(object), m_baseDirectory(std::move(baseDirectory)), m_result(result)
    {}

    void string(const QString& key, QString& out)
    {
        const QJsonValue value = m_object.value(key);
        if (value.isUndefined())
            return;
        if (!value.isString()) {
            m_result.addError(QStringLiteral("'%1' must be a string.").arg(key));
            return;
        }
        out = value.toString();
    }

    void path(const QString& key, QString& out)
    {
        QString raw;
        string(key, raw);
        if (raw.isEmpty())
            return;
        out = QDir::isAbsolutePath(raw) || m_baseDirectory.isEmpty()
                  ? QDir::cleanPath(raw)
                  : QDir::cleanPath(QDir(m_baseDirectory).absoluteFilePath(raw));
    }

    void version(const QString& key, QString& out)
    {
        QString raw;
        string(key, raw);
        if (raw.isEmpty())
            return;
        if (!PluginManifest::isValidVersion(raw)) {
            m_result.addError(QStringLiteral("'%1' is not a version number: %2").arg(key, raw));
            return;
        }
        out = raw;
    }

    void timeout(const QString& key, int& out)
    {
        const QJsonValue value = m_object.value(key);
        if (value.isUndefined())
            return;
        const double number = value.toDouble(-1);
        if (!value.isDouble() || number <= 0 || number != double(int(number))) {
            m_result.addError(QStringLiteral("'%1' must be a positive integer.").arg(key));
            return;
        }
        out = int(number);
    }

private:
    const QJsonObject& m_object;
    const QString m_baseDirectory;
    Utils::Result& m_result;
};

void readTrust(const QJsonObject& object, TrustPolicy& trust, Utils::Result& result)
{
    const QJsonValue require = object.value(kRequireSignature);
    if (!require.isUndefined()) {
        if (require.isBool())
            trust.requireSignature = require.toBool();
        else
            result.addError(QStringLiteral("'%1.%2' must be a boolean.").arg(kTrust, kRequireSignature));
    }

    const QJsonValue publishers = object.value(kPublishers);
    if (publishers.isUndefined())
        return;
    if (!publishers.isObject()) {
        result.addError(QStringLiteral("'%1.%2' must be an object.").arg(kTrust, kPublishers));
        return;
    }

    const QJsonObject keys = publishers.toObject();
    for (auto it = keys.begin(); it != keys.end(); ++it) {
        const QByteArray secret = QByteArray::fromHex(it.value().toString().toLatin1());
        if (!it.value().isString() || secret.isEmpty()) {
            result.addError(QStringLiteral("'%1.%2.%3' must be a hex encoded secret.")
                                .arg(kTrust, kPublishers, it.key()));
            continue;
        }
        trust.publisherKeys.insert(it.key(), secret);
    }
}

} // namespace

HostConfig HostConfig::defaults()
{
    HostConfig config;
    const QString appData = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    config.pluginsDirectory = QDir(appData.isEmpty() ? QDir::homePath() : appData).filePath(u"Plugins"_s);
    config.hostVersion = u"1.0.0"_s;
    config.apiVersion = hostApiVersion();
    config.environment = RuntimeEnvironment::Development;
    config.workspaceRoot = QDir::currentPath();
    config.trust.requireSignature = false;
    return config;
}

Utils::Result HostConfig::loadFile(const QString& path, HostConfig& out)
{
    QString error;
    const QJsonObject object = Utils::JsonFileUtils::readObject(path, &error);
    if (!error.isEmpty())
        return Utils::Result::failure(error);
    return fromJson(object, out, QFileInfo(path).absolutePath());
}

Utils::Result HostConfig::fromJson(const QJsonObject& object, HostConfig& out, const QString& baseDirectory)
{
    Utils::Result result;
    HostConfig config = out;
    Reader reader(object, baseDirectory, result);

    reader.path(kPluginsDirectory, config.pluginsDirectory);
    reader.version(kHostVersion, config.hostVersion);
    reader.version(kApiVersion, config.apiVersion);
    reader.timeout(kActivationTimeout, config.activationTimeoutMs);
    reader.timeout(kCleanupTimeout, config.cleanupTimeoutMs);
    reader.timeout(kCommandTimeout, config.commandTimeoutMs);
    reader.timeout(kInstallTimeout, config.installTimeoutMs);
    reader.path(kWorkspaceRoot, config.workspaceRoot);
    reader.path(kCatalog, config.catalogPath);

    QString environment;
    reader.string(kEnvironment, environment);
    if (!environment.isEmpty()) {
        if (const auto parsed = environmentFromString(environment)) {
            config.environment = *parsed;
            config.trust.requireSignature = *parsed == RuntimeEnvironment::Production;
        } else {
            result.addError(QStringLiteral("'%1' must be 'development' or 'production'.").arg(kEnvironment));
        }
    }

    const QJsonValue trust = object.value(kTrust);
    if (!trust.isUndefined()) {
        if (trust.isObject())
            readTrust(trust.toObject(), config.trust, result);
        else
            result.addError(QStringLiteral("'%1' must be an object.").arg(kTrust));
    }

    if (result)
        out = std::move(config);
    return result;
}

QVersionNumber HostConfig::hostVersionNumber() const
{
    return QVersionNumber::fromString(hostVersion);
}

PluginContext HostConfig::context() const
{
    return PluginContext(apiVersion, hostVersion, environment);
}

} // namespace aics
