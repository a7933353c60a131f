// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/BundleVerifier.hpp"

#include "extensionsystem/PluginBundle.hpp"

#include <utils/filesystem/FileSystemUtils.hpp>
#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QCryptographicHash>
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonObject>
#include <QtCore/QMessageAuthenticationCode>

namespace aics {

namespace {

using namespace Qt::StringLiterals;

const QString kAlgorithm = u"hmac-sha256"_s;
const QString kAlgorithmKey = u"algorithm"_s;
const QString kKeyIdKey = u"keyId"_s;
const QString kDigestKey = u"digest"_s;
const QString kSignatureKey = u"signature"_s;

constexpr qint64 kChunkSize = 64 * 1024;

} // namespace

QString BundleVerifier::algorithm()
{
    return kAlgorithm;
}

QByteArray BundleVerifier::digest(const QString& bundleDir, QString* error)
{
    if (!QFileInfo(bundleDir).isDir()) {
        if (error)
            *error = QStringLiteral("Bundle directory does not exist: %1").arg(bundleDir);
        return {};
    }

    const QDir root(bundleDir);
    const QString signatureFile = PluginBundle::signatureFileName();

    QCryptographicHash hash(QCryptographicHash::Sha256);
    for (const QString& relative : Utils::FileSystemUtils::relativeFilesRecursively(bundleDir)) {
        if (relative == signatureFile)
            continue;

        QFile file(root.filePath(relative));
        if (!file.open(QIODevice::ReadOnly)) {
            if (error)
                *error = QStringLiteral("Failed to read %1 (%2)").arg(file.fileName(), file.errorString());
            return {};
        }

        hash.addData(relative.toUtf8());
        hash.addData(QByteArrayView("\0", 1));
        hash.addData(QByteArray::number(file.size()));
        hash.addData(QByteArrayView("\0", 1));
        while (!file.atEnd()) {
            const QByteArray chunk = file.read(kChunkSize);
            if (chunk.isEmpty() && file.error() != QFileDevice::NoError) {
                if (error)
                    *error = QStringLiteral("Failed to read %1 (%2)").arg(file.fileName(), file.errorString());
                return {};
            }
            hash.addData(chunk);
        }
    }

    if (error)
        error->clear();
    return hash.result();
}

QByteArray BundleVerifier::hmac(const QByteArray& digest, const QByteArray& secret)
{
    return QMessageAuthenticationCode::hash(digest, secret, QCryptographicHash::Sha256);
}

bool BundleVerifier::constantTimeEquals(const QByteArray& a, const QByteArray& b)
{
    if (a.size() != b.size())
        return false;

    unsigned char diff = 0;
    for (qsizetype i = 0; i < a.size(); ++i)
        diff |= static_cast<unsigned char>(a.at(i) ^ b.at(i));
    return diff == 0;
}

PluginError BundleVerifier::verify(const QString& bundleDir, const TrustPolicy& policy)
{
    const QString signaturePath = PluginBundle::signaturePath(bundleDir);
    if (!QFileInfo::exists(signaturePath)) {
        if (policy.requireSignature)
            return PluginError::install(QStringLiteral("Bundle %1 is not signed.").arg(bundleDir));

        qCWarning(aicsExtensionSystemLog) << "Accepting unsigned plugin bundle" << bundleDir;
        return PluginError::none();
    }

    QString readError;
    const QJsonObject signature = Utils::JsonFileUtils::readObject(signaturePath, &readError);
    if (!readError.isEmpty())
        return PluginError::install(QStringLiteral("Unreadable bundle signature: %1").arg(readError));

    if (signature.value(kAlgorithmKey).toString() != kAlgorithm) {
        return PluginError::install(QStringLiteral("Unsupported signature algorithm '%1'.")
                                        .arg(signature.value(kAlgorithmKey).toString()));
    }

    QString digestError;
    const QByteArray actualDigest = digest(bundleDir, &digestError);
    if (actualDigest.isEmpty())
        return PluginError::install(digestError);

    const QByteArray declaredDigest = QByteArray::fromHex(signature.value(kDigestKey).toString().toLatin1());
    if (!constantTimeEquals(actualDigest, declaredDigest))
        return PluginError::install(QStringLiteral("Bundle contents do not match their signed digest."));

    const QString keyId = signature.value(kKeyIdKey).toString();
    const auto key = policy.publisherKeys.constFind(keyId);
    if (key == policy.publisherKeys.cend())
        return PluginError::install(QStringLiteral("Bundle is signed by untrusted key '%1'.").arg(keyId));

    const QByteArray declaredSignature = QByteArray::fromHex(signature.value(kSignatureKey).toString().toLatin1());
    if (!constantTimeEquals(hmac(actualDigest, key.value()), declaredSignature))
        return PluginError::install(QStringLiteral("Bundle signature does not verify with key '%1'.").arg(keyId));

    qCDebug(aicsExtensionSystemLog) << "Verified bundle" << bundleDir << "signed by" << keyId;
    return PluginError::none();
}

Utils::Result BundleVerifier::sign(const QString& bundleDir, const QString& keyId, const QByteArray& secret)
{
    if (keyId.trimmed().isEmpty())
        return Utils::Result::failure(QStringLiteral("Signing key id is empty."));
    if (secret.isEmpty())
        return Utils::Result::failure(QStringLiteral("Signing secret is empty."));

    QString digestError;
    const QByteArray bundleDigest = digest(bundleDir, &digestError);
    if (bundleDigest.isEmpty())
        return Utils::Result::failure(digestError);

    QJsonObject signature;
    signature.insert(kAlgorithmKey, kAlgorithm);
    signature.insert(kKeyIdKey, keyId.trimmed());
    signature.insert(kDigestKey, QString::fromLatin1(bundleDigest.toHex()));
    signature.insert(kSignatureKey, QString::fromLatin1(hmac(bundleDigest, secret).toHex()));
    return Utils::JsonFileUtils::writeObjectAtomic(PluginBundle::signaturePath(bundleDir), signature);
}

} // namespace aics
