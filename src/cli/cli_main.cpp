#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>
#include <cstdio>

#include "cli/cli_commands.h"
#include "config/config_store.h"
#include "core/log_manager.h"

namespace {

const char* const kUsage =
    "Commands:\n"
    "  cooldown list\n"
    "  cooldown set <provider-id> <hours>\n"
    "  cooldown clear <provider-id>\n"
    "  providers list [--family F]\n"
    "  providers batch-add --family F --group G --url U [--url U ...] --key K [--key K ...]\n"
    "                      [--cooldown-hours H] [--tier T] [--group-priority P]\n"
    "  providers remove <provider-id>\n"
    "  providers reset-usage <provider-id>\n";

int usage(QTextStream& err, const QString& message)
{
    if (!message.isEmpty())
        err << "error: " << message << "\n";
    err << kUsage;
    err.flush();
    return 2;
}

bool parseInt(const QString& text, int& value)
{
    bool ok = false;
    value = text.toInt(&ok);
    return ok;
}

}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("switchboard"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));
    app.setOrganizationName(QStringLiteral("Switchboard"));

    QTextStream out(stdout);
    QTextStream err(stderr);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Manage switchboard providers and cooldowns\n\n")
                                     + QString::fromLatin1(kUsage));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption({QStringLiteral("c"), QStringLiteral("config")},
                                          QStringLiteral("Configuration file."), QStringLiteral("path"));
    const QCommandLineOption portOption({QStringLiteral("p"), QStringLiteral("port")},
                                        QStringLiteral("Port of the running proxy."), QStringLiteral("port"));
    const QCommandLineOption familyOption(QStringLiteral("family"),
                                          QStringLiteral("claude, codex or gemini."), QStringLiteral("family"));
    const QCommandLineOption groupOption(QStringLiteral("group"), QStringLiteral("Provider group."),
                                         QStringLiteral("group"));
    const QCommandLineOption urlOption(QStringLiteral("url"), QStringLiteral("Base URL, repeatable."),
                                       QStringLiteral("url"));
    const QCommandLineOption keyOption(QStringLiteral("key"), QStringLiteral("API key, repeatable."),
                                       QStringLiteral("key"));
    const QCommandLineOption cooldownOption(QStringLiteral("cooldown-hours"),
                                            QStringLiteral("Cooldown duration for the new providers."),
                                            QStringLiteral("hours"));
    const QCommandLineOption tierOption(QStringLiteral("tier"), QStringLiteral("Rotation tier."),
                                        QStringLiteral("tier"));
    const QCommandLineOption groupPriorityOption(QStringLiteral("group-priority"),
                                                 QStringLiteral("Group priority."), QStringLiteral("priority"));
    parser.addOptions({configOption, portOption, familyOption, groupOption, urlOption, keyOption,
                       cooldownOption, tierOption, groupPriorityOption});
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("cooldown or providers."));
    parser.addPositionalArgument(QStringLiteral("action"), QStringLiteral("Subcommand."));
    parser.process(app);

    LogManager::instance().setConsoleEcho(true);
    LogManager::instance().setMinimumLevel(LogManager::Warning);

    const QStringList args = parser.positionalArguments();
    if (args.size() < 2)
        return usage(err, QString());

    ConfigStore configStore;
    const QString configPath = parser.isSet(configOption) ? parser.value(configOption) : ConfigStore::defaultPath();
    if (!configStore.load(configPath)) {
        err << "error: cannot load configuration from " << configPath << Qt::endl;
        return 1;
    }

    CliCommands commands(configStore, out, err);
    int port = configStore.runtimeConfig().proxyPort;
    if (parser.isSet(portOption) && !parseInt(parser.value(portOption), port))
        return usage(err, QStringLiteral("invalid port '%1'").arg(parser.value(portOption)));
    commands.setAdminBaseUrl(QStringLiteral("http://127.0.0.1:%1").arg(port));

    const QString command = args.at(0);
    const QString action = args.at(1);

    if (command == QLatin1String("cooldown")) {
        if (action == QLatin1String("list") && args.size() == 2)
            return commands.cooldownList();
        if (action == QLatin1String("set") && args.size() == 4) {
            const auto hours = CliCommands::parseHours(args.at(3));
            if (!hours)
                return usage(err, QStringLiteral("hours must be a positive number up to %1").arg(kMaxCooldownHours));
            return commands.cooldownSet(args.at(2), *hours);
        }
        if (action == QLatin1String("clear") && args.size() == 3)
            return commands.cooldownClear(args.at(2));
        return usage(err, QStringLiteral("unknown cooldown command"));
    }

    if (command == QLatin1String("providers")) {
        if (action == QLatin1String("list") && args.size() == 2)
            return commands.providersList(parser.value(familyOption));
        if (action == QLatin1String("remove") && args.size() == 3)
            return commands.providersRemove(args.at(2));
        if (action == QLatin1String("reset-usage") && args.size() == 3)
            return commands.providersResetUsage(args.at(2));
        if (action == QLatin1String("batch-add") && args.size() == 2) {
            const auto family = app_family::fromName(parser.value(familyOption));
            if (!family)
                return usage(err, QStringLiteral("--family must be claude, codex or gemini"));
            ProviderBatch batch;
            batch.family = *family;
            batch.group = parser.value(groupOption);
            batch.urls = parser.values(urlOption);
            batch.keys = parser.values(keyOption);
            if (parser.isSet(cooldownOption)) {
                const auto hours = CliCommands::parseHours(parser.value(cooldownOption));
                if (!hours)
                    return usage(err, QStringLiteral("--cooldown-hours must be a positive number up to %1")
                                          .arg(kMaxCooldownHours));
                batch.cooldownDurationSecs = static_cast<qint64>(*hours * 3600);
            }
            if (parser.isSet(tierOption) && !parseInt(parser.value(tierOption), batch.rotationTier))
                return usage(err, QStringLiteral("--tier must be an integer"));
            if (parser.isSet(groupPriorityOption)
                && !parseInt(parser.value(groupPriorityOption), batch.groupPriority))
                return usage(err, QStringLiteral("--group-priority must be an integer"));
            return commands.providersBatchAdd(batch);
        }
        return usage(err, QStringLiteral("unknown providers command"));
    }

    return usage(err, QStringLiteral("unknown command '%1'").arg(command));
}
