// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QTextStream>

#include "extensionsystem/BundleVerifier.hpp"
#include "extensionsystem/HostConfig.hpp"
#include "extensionsystem/HostServices.hpp"
#include "extensionsystem/PluginManager.hpp"

using namespace aics;
using namespace Qt::StringLiterals;

namespace {

QTextStream& out()
{
	static QTextStream stream(stdout);
	return stream;
}

int fail(const QString& message)
{
	qCritical().noquote() << message;
	return 1;
}

int fail(const PluginError& error)
{
	return fail(error.toString());
}

void printPlugin(const Plugin& plugin, bool active = false)
{
	out() << plugin.id() << "  " << plugin.manifest.version << "  " << plugin.manifest.name
	      << (active ? "  [active]" : "") << "\n"
	      << "    " << plugin.bundlePath << "\n";
}

QString argumentAt(const QStringList& args, int index)
{
	return index < args.size() ? args.at(index) : QString();
}

int listPlugins(PluginManager& manager, bool rescan)
{
	const PluginList plugins = rescan ? manager.discover() : manager.restore();
	for (const Plugin& plugin : plugins)
		printPlugin(plugin, manager.engine().isActive(plugin.id()));
	out() << plugins.size() << " plugin(s) in " << manager.config().pluginsDirectory << "\n";
	return 0;
}

int installPlugin(PluginManager& manager, const QString& source, bool replace)
{
	manager.restore();

	InstallOptions options;
	options.replaceExisting = replace;

	Plugin installed;
	if (const PluginError err = manager.install(source, options, installed); !err.ok())
		return fail(err);

	out() << "Installed ";
	printPlugin(installed);
	return 0;
}

int activatePlugin(PluginManager& manager, const QString& pluginId, const QString& commandId, const QString& argsJson)
{
	manager.restore();

	if (const PluginError err = manager.activate(pluginId); !err.ok())
		return fail(err);
	out() << "Activated " << pluginId << "\n";

	int status = 0;
	if (!commandId.isEmpty()) {
		PluginCommand command{commandId, {}};
		if (!argsJson.isEmpty()) {
			QJsonParseError parseError{};
			const QJsonDocument doc = QJsonDocument::fromJson(argsJson.toUtf8(), &parseError);
			if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
				manager.shutdown();
				return fail(QStringLiteral("--args must be a JSON object: %1").arg(parseError.errorString()));
			}
			command.arguments = doc.object();
		}

		const PluginCommandResult result = manager.executeCommand(pluginId, command);
		if (result.isEmpty()) {
			status = fail(QStringLiteral("Plugin %1 does not handle command %2.").arg(pluginId, commandId));
		} else if (!result.ok()) {
			status = fail(result.error);
		} else {
			out() << QJsonDocument(result.output).toJson(QJsonDocument::Indented);
		}
	}

	manager.shutdown();
	return status;
}

int showCatalog(PluginManager& manager, const QString& query, const QString& categoryName)
{
	PluginCategory category = PluginCategory::All;
	if (!categoryName.isEmpty()) {
		const auto parsed = categoryFromString(categoryName);
		if (!parsed)
			return fail(QStringLiteral("Unknown category '%1'.").arg(categoryName));
		category = *parsed;
	}

	if (const Utils::Result loaded = manager.loadCatalog(); !loaded)
		return fail(loaded.errorString());

	manager.restore();
	const QList<CatalogEntry> matches = manager.catalog().search(query, category);
	for (const CatalogEntry& entry : matches) {
		const bool installed = manager.installer().isInstalled(entry.manifest.id);
		out() << entry.manifest.id << "  " << entry.manifest.version << "  " << entry.manifest.name
		      << (installed ? "  [installed]" : "") << "\n"
		      << "    " << entry.manifest.description << "\n";
	}
	out() << matches.size() << " match(es)\n";
	return 0;
}

int verifyBundle(PluginManager& manager, const QString& bundle)
{
	PluginManifest manifest;
	if (const PluginError err = manager.manifestStore().loadFromBundle(bundle, manifest); !err.ok())
		return fail(err);
	if (manifest.requiresNewerHost(manager.config().hostVersionNumber())) {
		return fail(PluginError::incompatible(QStringLiteral("%1 requires host version %2.")
		                                          .arg(manifest.id, manifest.minimumAppVersion)));
	}
	if (const PluginError err = BundleVerifier::verify(bundle, manager.config().trust); !err.ok())
		return fail(err);

	out() << "OK " << manifest.id << " " << manifest.version << "\n";
	return 0;
}

int signBundle(const QString& bundle, const QString& keyId, const QString& secretHex)
{
	const QByteArray secret = QByteArray::fromHex(secretHex.toLatin1());
	if (secret.isEmpty())
		return fail(u"--secret must be a hex encoded key."_s);

	if (const Utils::Result signedBundle = BundleVerifier::sign(bundle, keyId, secret); !signedBundle)
		return fail(signedBundle.errorString());

	out() << "Signed " << bundle << " with key " << keyId << "\n";
	return 0;
}

} // namespace

int main(int argc, char** argv)
{
	QCoreApplication app(argc, argv);
	QCoreApplication::setOrganizationName(u"aics"_s);
	QCoreApplication::setApplicationName(u"aicsctl"_s);
	QCoreApplication::setApplicationVersion(u"1.0.0"_s);

	QCommandLineParser parser;
	parser.setApplicationDescription(u"Manage plugins of the AI coding suite."_s);
	parser.addHelpOption();
	parser.addVersionOption();

	const QCommandLineOption configOption(u"config"_s, u"Host configuration file."_s, u"file"_s);
	const QCommandLineOption pluginsDirOption(u"plugins-dir"_s, u"Managed plugins directory."_s, u"dir"_s);
	const QCommandLineOption replaceOption(u"replace"_s, u"Replace an installed plugin with the same id."_s);
	const QCommandLineOption categoryOption(u"category"_s, u"Catalog category (all, languages, themes, tools, ai, ui)."_s,
	                                        u"name"_s);
	const QCommandLineOption argsOption(u"args"_s, u"Command arguments as a JSON object."_s, u"json"_s);
	const QCommandLineOption keyIdOption(u"key-id"_s, u"Signing key id."_s, u"id"_s);
	const QCommandLineOption secretOption(u"secret"_s, u"Signing secret, hex encoded."_s, u"hex"_s);
	parser.addOptions({configOption, pluginsDirOption, replaceOption, categoryOption, argsOption, keyIdOption,
	                   secretOption});

	parser.addPositionalArgument(u"command"_s,
	                             u"list | discover | install <source> | uninstall <id> | activate <id> [command] | "
	                             u"catalog [query] | verify <bundle> | sign <bundle>"_s);
	parser.process(app);

	const QStringList args = parser.positionalArguments();
	if (args.isEmpty()) {
		parser.showHelp(1);
	}
	const QString command = args.front();

	HostConfig config = HostConfig::defaults();
	if (parser.isSet(configOption)) {
		if (const Utils::Result loaded = HostConfig::loadFile(parser.value(configOption), config); !loaded)
			return fail(QStringLiteral("Invalid configuration: %1").arg(loaded.errorString()));
	}
	if (parser.isSet(pluginsDirOption))
		config.pluginsDirectory = QFileInfo(parser.value(pluginsDirOption)).absoluteFilePath();

	if (command == u"sign"_s) {
		const QString bundle = argumentAt(args, 1);
		if (bundle.isEmpty() || !parser.isSet(keyIdOption) || !parser.isSet(secretOption))
			return fail(u"Usage: aicsctl sign <bundle> --key-id ID --secret HEX"_s);
		return signBundle(bundle, parser.value(keyIdOption), parser.value(secretOption));
	}

	PluginManager manager(config, HostServices::createDefaults(config.workspaceRoot));

	if (command == u"list"_s)
		return listPlugins(manager, false);
	if (command == u"discover"_s)
		return listPlugins(manager, true);

	if (command == u"install"_s) {
		const QString source = argumentAt(args, 1);
		if (source.isEmpty())
			return fail(u"Usage: aicsctl install <source> [--replace]"_s);
		return installPlugin(manager, source, parser.isSet(replaceOption));
	}

	if (command == u"uninstall"_s) {
		const QString pluginId = argumentAt(args, 1);
		if (pluginId.isEmpty())
			return fail(u"Usage: aicsctl uninstall <id>"_s);
		manager.restore();
		if (const PluginError err = manager.uninstall(pluginId); !err.ok())
			return fail(err);
		out() << "Uninstalled " << pluginId << "\n";
		return 0;
	}

	if (command == u"activate"_s) {
		const QString pluginId = argumentAt(args, 1);
		if (pluginId.isEmpty())
			return fail(u"Usage: aicsctl activate <id> [command] [--args JSON]"_s);
		return activatePlugin(manager, pluginId, argumentAt(args, 2), parser.value(argsOption));
	}

	if (command == u"catalog"_s)
		return showCatalog(manager, argumentAt(args, 1), parser.value(categoryOption));

	if (command == u"verify"_s) {
		const QString bundle = argumentAt(args, 1);
		if (bundle.isEmpty())
			return fail(u"Usage: aicsctl verify <bundle>"_s);
		return verifyBundle(manager, bundle);
	}

	return fail(QStringLiteral("Unknown command '%1'.").arg(command));
}
