#pragma once

#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>

namespace rt {

struct ValidationError {
    QString field;
    double value = 0.0;
    ValueRange range;
    bool unbounded = false;  // lower bound only (durations, counts)

    QString message() const;
};

// Per-request input from the voice/tool layer. Build it, then call validate()
// before handing it to anything that mutates state.
struct QueryRecord {
    // Text analysis
    double textDifficulty = 0.5;
    double textType = 0.4;
    double textLength = 0.5;

    // Listener behaviour
    double userEngagement = 0.5;
    double userComprehension = 0.5;
    QStringList recentCommands;
    double textProgress = 0.0;

    // Current delivery settings
    double currentReadingSpeed = 1.0;
    double currentPauseFrequency = 0.3;
    double currentHighlightIntensity = 0.5;
    double currentChunkSize = 0.5;

    // Optional session data
    double sessionDuration = 0.0;
    int actionCount = 0;
    std::optional<double> preferredSpeed;
    std::optional<double> preferredPauses;
    std::optional<double> preferredHighlighting;

    bool validate(ValidationError* errorOut = nullptr) const;
    bool hasPreferences() const;

    ControlSettings currentSettings() const;
    QJsonObject toJson() const;
};

} // namespace rt
