// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/ExtensionSystemGlobal.hpp"
#include "extensionsystem/PluginError.hpp"

#include <utils/Result.hpp>

#include <QtCore/QByteArray>
#include <QtCore/QHash>
#include <QtCore/QString>

namespace aics {

// Which publishers the host trusts and whether unsigned bundles are accepted.
struct TrustPolicy {
	bool requireSignature = true;
	QHash<QString, QByteArray> publisherKeys; // keyId -> shared secret
};

// Integrity and publisher checks for plugin bundles.
//
// The digest is SHA-256 over every regular file of the bundle except
// signature.json, visited in byte order of their relative paths; for each
// file the relative path, its size and its contents are hashed. The
// signature is HMAC-SHA256 of that digest under the publisher's key:
//
//   { "algorithm": "hmac-sha256", "keyId": "...", "digest": "<hex>", "signature": "<hex>" }
//
class AICS_EXTENSIONSYSTEM_EXPORT BundleVerifier final
{
public:
	static QString algorithm();

	// Empty on I/O failure, with `error` set.
	static QByteArray digest(const QString& bundleDir, QString* error = nullptr);

	// InstallError on digest mismatch, unknown key, bad signature or a missing
	// signature the policy requires.
	static PluginError verify(const QString& bundleDir, const TrustPolicy& policy);

	// Writes signature.json for `bundleDir`.
	static Utils::Result sign(const QString& bundleDir, const QString& keyId, const QByteArray& secret);

private:
	static QByteArray hmac(const QByteArray& digest, const QByteArray& secret);
	static bool constantTimeEquals(const QByteArray& a, const QByteArray& b);
};

} // namespace aics
