// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "extensionsystem/ExtensionSystemGlobal.hpp"

#include <QtCore/QMetaType>
#include <QtCore/QString>

#include <utility>

namespace aics {

enum class PluginErrorCode : quint8 {
	None = 0,
	ParseError,          // Malformed or incomplete manifest.
	InstallError,        // Fetch, extraction, integrity or registration failure.
	NotFound,            // Unknown or no longer reachable plugin id.
	LoadError,           // Entry point failed to load or initialize.
	IncompatibleVersion, // Manifest needs a newer host.
	MissingPermission,   // Host API call without the declared permission.
	InvalidRequest,      // Host API request failed validation.
	ServiceUnavailable,  // No host service configured for the request.
	CommandFailed        // Plugin command reported or raised a failure.
};

AICS_EXTENSIONSYSTEM_EXPORT QString toString(PluginErrorCode code);

class AICS_EXTENSIONSYSTEM_EXPORT PluginError final {
public:
	PluginError() = default;
	PluginError(PluginErrorCode code, QString message)
		: m_code(code), m_message(std::move(message)) {}

	bool ok() const noexcept { return m_code == PluginErrorCode::None; }
	PluginErrorCode code() const noexcept { return m_code; }
	const QString& message() const noexcept { return m_message; }

	// "<Kind>: <message>", for logs and the command line.
	QString toString() const;

	static PluginError none() { return {}; }

	static PluginError parse(QString msg) { return {PluginErrorCode::ParseError, std::move(msg)}; }
	static PluginError install(QString msg) { return {PluginErrorCode::InstallError, std::move(msg)}; }
	static PluginError notFound(QString msg) { return {PluginErrorCode::NotFound, std::move(msg)}; }
	static PluginError load(QString msg) { return {PluginErrorCode::LoadError, std::move(msg)}; }
	static PluginError incompatible(QString msg) { return {PluginErrorCode::IncompatibleVersion, std::move(msg)}; }
	static PluginError missingPermission(QString msg) { return {PluginErrorCode::MissingPermission, std::move(msg)}; }
	static PluginError invalidRequest(QString msg) { return {PluginErrorCode::InvalidRequest, std::move(msg)}; }
	static PluginError unavailable(QString msg) { return {PluginErrorCode::ServiceUnavailable, std::move(msg)}; }
	static PluginError commandFailed(QString msg) { return {PluginErrorCode::CommandFailed, std::move(msg)}; }

private:
	PluginErrorCode m_code{PluginErrorCode::None};
	QString m_message;
};

} // namespace aics

Q_DECLARE_METATYPE(aics::PluginError)
