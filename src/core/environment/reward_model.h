#pragma once

#include "core/shared/types.h"

#include <QDateTime>
#include <QJsonObject>
#include <QVector>

#include <optional>

namespace rt {

struct UserFeedback {
    std::optional<double> comprehension;
    std::optional<double> engagement;
    std::optional<double> preferredSpeed;
    std::optional<double> preferredPauses;
    std::optional<double> preferredHighlighting;
    QDateTime timestamp;

    QJsonObject toJson() const;
};

// Everything the reward terms read. Built by ReadingEnvironment from its live
// controls and tracked listener signals.
struct RewardInputs {
    ControlSettings controls;
    double textDifficulty = 0.5;
    double userEngagement = 0.5;
    double userComprehension = 0.5;
    double textProgress = 0.0;
    int sessionLength = 0;
    QVector<UserFeedback> feedbackHistory;
};

struct RewardBreakdown {
    double speedReward = 0.0;
    double pauseReward = 0.0;
    double highlightReward = 0.0;
    double engagementReward = 0.0;
    double comprehensionReward = 0.0;
    double difficultyAdaptationReward = 0.0;
    double continuityReward = 0.0;
    double preferenceReward = 0.0;
    double efficiencyReward = 0.0;
    double extremePenalty = 0.0;
    double totalReward = 0.0;

    // Sum of the ten terms before clipping.
    double unclippedSum() const;
    QJsonObject toJson() const;
};

class RewardModel {
public:
    static constexpr double kMinReward = -1.0;
    static constexpr double kMaxReward = 5.0;
    static constexpr int kPreferenceWindow = 5;

    static RewardBreakdown breakdown(const RewardInputs& inputs);
    static double total(const RewardInputs& inputs);

    static double speedReward(double speed, double difficulty);
    static double pauseReward(double pause, double difficulty, double comprehension);
    static double highlightReward(double highlight, double difficulty, double engagement);
    static double engagementReward(double engagement);
    static double comprehensionReward(double comprehension);
    static double difficultyAdaptationReward(const ControlSettings& controls, double difficulty);
    static double continuityReward(int sessionLength);
    static double preferenceReward(const ControlSettings& controls,
                                   const QVector<UserFeedback>& feedbackHistory);
    static double efficiencyReward(double progress, double comprehension);
    static double extremePenalty(const ControlSettings& controls);
};

} // namespace rt
