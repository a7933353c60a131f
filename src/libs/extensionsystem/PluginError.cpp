// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "extensionsystem/PluginError.hpp"

namespace aics {

QString toString(PluginErrorCode code)
{
    switch (code) {
    case PluginErrorCode::None: return QStringLiteral("None");
    case PluginErrorCode::ParseError: return QStringLiteral("ParseError");
    case PluginErrorCode::InstallError: return QStringLiteral("InstallError");
    case PluginErrorCode::NotFound: return QStringLiteral("NotFoundError");
    case PluginErrorCode::LoadError: return QStringLiteral("LoadError");
    case PluginErrorCode::IncompatibleVersion: return QStringLiteral("IncompatibleVersionError");
    case PluginErrorCode::MissingPermission: return QStringLiteral("MissingPermissionError");
    case PluginErrorCode::InvalidRequest: return QStringLiteral("InvalidRequestError");
    case PluginErrorCode::ServiceUnavailable: return QStringLiteral("ServiceUnavailableError");
    case PluginErrorCode::CommandFailed: return QStringLiteral("CommandFailedError");
    }
    return QStringLiteral("UnknownError");
}

QString PluginError::toString() const
{
    if (ok())
        return QStringLiteral("OK");
    if (m_message.isEmpty())
        return aics::toString(m_code);
    return QStringLiteral("%1: %2").arg(aics::toString(m_code), m_message);
}

} // namespace aics
