#include "monitor_runner.h"

#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("readtune-monitor"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Replays listener scenarios through the reading agent and reports training status."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption episodesOption(QStringLiteral("episodes"),
                                            QStringLiteral("Number of scenario replays."),
                                            QStringLiteral("N"),
                                            QStringLiteral("3"));
    const QCommandLineOption dataDirOption(QStringLiteral("data-dir"),
                                           QStringLiteral("Directory for the training database and weights."),
                                           QStringLiteral("PATH"));
    const QCommandLineOption noTrainOption(QStringLiteral("no-train"),
                                           QStringLiteral("Collect experience without a training pass."));
    parser.addOption(episodesOption);
    parser.addOption(dataDirOption);
    parser.addOption(noTrainOption);
    parser.process(app);

    rt::Settings settings = rt::SettingsManager::load().value_or(rt::Settings());
    if (parser.isSet(dataDirOption)) {
        settings.dataDir = parser.value(dataDirOption);
    }
    if (settings.dataDir.isEmpty()) {
        settings.dataDir = rt::SettingsManager::defaultDataDir();
    }

    QString settingsError;
    if (!settings.validate(&settingsError)) {
        LOG_ERROR(rtCore, "Invalid settings: %s", qUtf8Printable(settingsError));
        return 2;
    }

    bool episodesOk = false;
    rt::MonitorRunner::Options options;
    options.episodes = parser.value(episodesOption).toInt(&episodesOk);
    if (!episodesOk || options.episodes < 1) {
        LOG_ERROR(rtCore, "--episodes expects a positive integer");
        return 2;
    }
    options.train = !parser.isSet(noTrainOption);

    rt::MonitorRunner runner(settings, options);
    return runner.run();
}
