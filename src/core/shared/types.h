#pragma once

#include <QJsonObject>
#include <QString>
#include <QVector>

#include <algorithm>
#include <optional>

namespace rt {

using StateVector = QVector<double>;
using ActionVector = QVector<double>;

constexpr int kDefaultStateDim = 20;
constexpr int kDefaultActionDim = 8;
constexpr int kSemanticFeatureCount = 12;

struct ValueRange {
    double min = 0.0;
    double max = 1.0;

    bool contains(double value) const { return value >= min && value <= max; }
    double clamp(double value) const { return std::clamp(value, min, max); }
};

constexpr ValueRange kUnitRange{0.0, 1.0};
constexpr ValueRange kReadingSpeedRange{0.5, 1.5};
constexpr ValueRange kPauseFrequencyRange{0.1, 0.8};
constexpr ValueRange kHighlightIntensityRange{0.0, 1.0};
constexpr ValueRange kChunkSizeRange{0.1, 1.0};

// Live delivery controls owned by ReadingEnvironment.
enum class ControlSetting {
    ReadingSpeed,
    PauseFrequency,
    HighlightIntensity,
    ChunkSize,
};

QString controlSettingToString(ControlSetting setting);
std::optional<ControlSetting> controlSettingFromString(const QString& str);
ValueRange controlSettingRange(ControlSetting setting);

struct ControlSettings {
    double readingSpeed = 1.0;
    double pauseFrequency = 0.3;
    double highlightIntensity = 0.5;
    double chunkSize = 0.5;

    double value(ControlSetting setting) const;
    void setValue(ControlSetting setting, double value);

    QJsonObject toJson() const;
    static ControlSettings fromJson(const QJsonObject& json);
};

// Affine action -> physical setting maps. Action components are expected in
// [-1, 1] but any magnitude is clamped into the physical bound.
double readingSpeedFromAction(double component);
double pauseFrequencyFromAction(double component);
double highlightIntensityFromAction(double component);
double chunkSizeFromAction(double component);

// Missing components map as 0.0 (the neutral setting).
ControlSettings controlSettingsFromAction(const ActionVector& action);

} // namespace rt
