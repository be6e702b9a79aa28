#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace rt {

std::optional<Settings> SettingsManager::load()
{
    return load(settingsFilePath());
}

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(rtCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(rtCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings)
{
    return save(settings, settingsFilePath());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(rtCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(rtCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(rtCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    return QDir(defaultDataDir()).filePath(QStringLiteral("settings.json"));
}

QString SettingsManager::defaultDataDir()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/readtune");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dataDir"), settings.dataDir);
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("modelPath"), settings.modelPath);
    json.insert(QStringLiteral("stateDim"), settings.stateDim);
    json.insert(QStringLiteral("actionDim"), settings.actionDim);
    json.insert(QStringLiteral("hiddenDim"), settings.hiddenDim);
    json.insert(QStringLiteral("actorLearningRate"), settings.actorLearningRate);
    json.insert(QStringLiteral("criticLearningRate"), settings.criticLearningRate);
    json.insert(QStringLiteral("gamma"), settings.gamma);
    json.insert(QStringLiteral("nStep"), settings.nStep);
    json.insert(QStringLiteral("explorationNoise"), settings.explorationNoise);
    json.insert(QStringLiteral("seed"), static_cast<qint64>(settings.seed));
    json.insert(QStringLiteral("trainingIntervalSec"), settings.trainingIntervalSec);
    json.insert(QStringLiteral("maxEpisodeLength"), settings.maxEpisodeLength);
    json.insert(QStringLiteral("maxRetainedEpisodes"), settings.maxRetainedEpisodes);
    json.insert(QStringLiteral("minEpisodesForTraining"), settings.minEpisodesForTraining);
    json.insert(QStringLiteral("rewardWindow"), settings.rewardWindow);
    json.insert(QStringLiteral("persistedEpisodeSample"), settings.persistedEpisodeSample);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dataDir = json.value(QStringLiteral("dataDir")).toString(settings.dataDir);
    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.modelPath = json.value(QStringLiteral("modelPath")).toString(settings.modelPath);

    settings.stateDim = json.value(QStringLiteral("stateDim")).toInt(settings.stateDim);
    settings.actionDim = json.value(QStringLiteral("actionDim")).toInt(settings.actionDim);
    settings.hiddenDim = json.value(QStringLiteral("hiddenDim")).toInt(settings.hiddenDim);
    settings.actorLearningRate = json.value(QStringLiteral("actorLearningRate"))
                                     .toDouble(settings.actorLearningRate);
    settings.criticLearningRate = json.value(QStringLiteral("criticLearningRate"))
                                      .toDouble(settings.criticLearningRate);
    settings.gamma = json.value(QStringLiteral("gamma")).toDouble(settings.gamma);
    settings.nStep = json.value(QStringLiteral("nStep")).toInt(settings.nStep);
    settings.explorationNoise = json.value(QStringLiteral("explorationNoise"))
                                    .toDouble(settings.explorationNoise);

    if (json.contains(QStringLiteral("seed"))) {
        settings.seed = static_cast<uint32_t>(
            json.value(QStringLiteral("seed")).toVariant().toUInt());
    }

    settings.trainingIntervalSec = json.value(QStringLiteral("trainingIntervalSec"))
                                       .toInt(settings.trainingIntervalSec);
    settings.maxEpisodeLength = json.value(QStringLiteral("maxEpisodeLength"))
                                    .toInt(settings.maxEpisodeLength);
    settings.maxRetainedEpisodes = json.value(QStringLiteral("maxRetainedEpisodes"))
                                       .toInt(settings.maxRetainedEpisodes);
    settings.minEpisodesForTraining = json.value(QStringLiteral("minEpisodesForTraining"))
                                          .toInt(settings.minEpisodesForTraining);
    settings.rewardWindow = json.value(QStringLiteral("rewardWindow")).toInt(settings.rewardWindow);
    settings.persistedEpisodeSample = json.value(QStringLiteral("persistedEpisodeSample"))
                                          .toInt(settings.persistedEpisodeSample);

    return settings;
}

} // namespace rt
