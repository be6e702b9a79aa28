#include "core/environment/reward_model.h"

#include <algorithm>
#include <cmath>

namespace rt {

namespace {

constexpr double kPreferenceTolerance = 0.1;
constexpr double kPreferenceStep = 0.2;
constexpr double kPreferenceCap = 0.6;
constexpr double kAdaptationCap = 0.8;

} // namespace

QJsonObject UserFeedback::toJson() const
{
    QJsonObject json;
    if (comprehension) {
        json[QStringLiteral("comprehension")] = *comprehension;
    }
    if (engagement) {
        json[QStringLiteral("engagement")] = *engagement;
    }
    if (preferredSpeed) {
        json[QStringLiteral("preferred_speed")] = *preferredSpeed;
    }
    if (preferredPauses) {
        json[QStringLiteral("preferred_pauses")] = *preferredPauses;
    }
    if (preferredHighlighting) {
        json[QStringLiteral("preferred_highlighting")] = *preferredHighlighting;
    }
    if (timestamp.isValid()) {
        json[QStringLiteral("timestamp")] = timestamp.toString(Qt::ISODateWithMs);
    }
    return json;
}

double RewardBreakdown::unclippedSum() const
{
    return speedReward
        + pauseReward
        + highlightReward
        + engagementReward
        + comprehensionReward
        + difficultyAdaptationReward
        + continuityReward
        + preferenceReward
        + efficiencyReward
        + extremePenalty;
}

QJsonObject RewardBreakdown::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("speed_reward")] = speedReward;
    json[QStringLiteral("pause_reward")] = pauseReward;
    json[QStringLiteral("highlight_reward")] = highlightReward;
    json[QStringLiteral("engagement_reward")] = engagementReward;
    json[QStringLiteral("comprehension_reward")] = comprehensionReward;
    json[QStringLiteral("difficulty_adaptation_reward")] = difficultyAdaptationReward;
    json[QStringLiteral("continuity_reward")] = continuityReward;
    json[QStringLiteral("preference_reward")] = preferenceReward;
    json[QStringLiteral("efficiency_reward")] = efficiencyReward;
    json[QStringLiteral("extreme_penalty")] = extremePenalty;
    json[QStringLiteral("total_reward")] = totalReward;
    return json;
}

RewardBreakdown RewardModel::breakdown(const RewardInputs& inputs)
{
    const ControlSettings& c = inputs.controls;

    RewardBreakdown out;
    out.speedReward = speedReward(c.readingSpeed, inputs.textDifficulty);
    out.pauseReward = pauseReward(c.pauseFrequency, inputs.textDifficulty, inputs.userComprehension);
    out.highlightReward = highlightReward(c.highlightIntensity, inputs.textDifficulty,
                                          inputs.userEngagement);
    out.engagementReward = engagementReward(inputs.userEngagement);
    out.comprehensionReward = comprehensionReward(inputs.userComprehension);
    out.difficultyAdaptationReward = difficultyAdaptationReward(c, inputs.textDifficulty);
    out.continuityReward = continuityReward(inputs.sessionLength);
    out.preferenceReward = preferenceReward(c, inputs.feedbackHistory);
    out.efficiencyReward = efficiencyReward(inputs.textProgress, inputs.userComprehension);
    out.extremePenalty = extremePenalty(c);
    out.totalReward = std::clamp(out.unclippedSum(), kMinReward, kMaxReward);
    return out;
}

double RewardModel::total(const RewardInputs& inputs)
{
    return breakdown(inputs).totalReward;
}

double RewardModel::speedReward(double speed, double difficulty)
{
    // Harder text reads slower: optimum spans 1.2 (easy) down to 0.8 (hard).
    const double optimal = 1.2 - difficulty * 0.4;
    const double diff = std::abs(speed - optimal);
    if (diff <= 0.1) {
        return 1.0;
    }
    if (diff <= 0.2) {
        return 0.8;
    }
    if (diff <= 0.3) {
        return 0.5;
    }
    return std::max(0.0, 0.5 - diff);
}

double RewardModel::pauseReward(double pause, double difficulty, double comprehension)
{
    const double optimal = std::min(0.7, 0.2 + difficulty * 0.3 + (1.0 - comprehension) * 0.2);
    const double diff = std::abs(pause - optimal);
    if (diff <= 0.1) {
        return 0.8;
    }
    if (diff <= 0.2) {
        return 0.6;
    }
    if (diff <= 0.3) {
        return 0.3;
    }
    return std::max(0.0, 0.3 - diff);
}

double RewardModel::highlightReward(double highlight, double difficulty, double engagement)
{
    const double optimal = std::min(0.9, 0.3 + difficulty * 0.4 + (1.0 - engagement) * 0.2);
    const double diff = std::abs(highlight - optimal);
    if (diff <= 0.15) {
        return 0.6;
    }
    if (diff <= 0.25) {
        return 0.4;
    }
    if (diff <= 0.35) {
        return 0.2;
    }
    return std::max(0.0, 0.2 - diff);
}

double RewardModel::engagementReward(double engagement)
{
    if (engagement >= 0.9) {
        return 1.2;
    }
    if (engagement >= 0.8) {
        return 1.0;
    }
    if (engagement >= 0.7) {
        return 0.8;
    }
    if (engagement >= 0.6) {
        return 0.5;
    }
    if (engagement >= 0.4) {
        return 0.2;
    }
    return 0.0;
}

double RewardModel::comprehensionReward(double comprehension)
{
    if (comprehension >= 0.9) {
        return 1.5;
    }
    if (comprehension >= 0.8) {
        return 1.2;
    }
    if (comprehension >= 0.7) {
        return 1.0;
    }
    if (comprehension >= 0.6) {
        return 0.7;
    }
    if (comprehension >= 0.5) {
        return 0.4;
    }
    if (comprehension >= 0.3) {
        return 0.1;
    }
    return -0.5;
}

double RewardModel::difficultyAdaptationReward(const ControlSettings& controls, double difficulty)
{
    const bool hard = difficulty > 0.7;
    const bool easy = difficulty < 0.3;
    if (!hard && !easy) {
        return 0.0;
    }

    double score = 0.0;
    if ((hard && controls.readingSpeed < 1.0) || (easy && controls.readingSpeed > 1.0)) {
        score += 0.3;
    }
    if ((hard && controls.pauseFrequency > 0.4) || (easy && controls.pauseFrequency < 0.4)) {
        score += 0.3;
    }
    if ((hard && controls.highlightIntensity > 0.6) || (easy && controls.highlightIntensity < 0.6)) {
        score += 0.2;
    }
    return std::min(kAdaptationCap, score);
}

double RewardModel::continuityReward(int sessionLength)
{
    if (sessionLength >= 20) {
        return 0.5;
    }
    if (sessionLength >= 10) {
        return 0.3;
    }
    if (sessionLength >= 5) {
        return 0.1;
    }
    return 0.0;
}

double RewardModel::preferenceReward(const ControlSettings& controls,
                                     const QVector<UserFeedback>& feedbackHistory)
{
    if (feedbackHistory.isEmpty()) {
        return 0.0;
    }

    auto within = [](const std::optional<double>& preferred, double current) {
        return preferred.has_value() && std::abs(current - *preferred) <= kPreferenceTolerance;
    };

    const int first = std::max(0, static_cast<int>(feedbackHistory.size()) - kPreferenceWindow);
    double score = 0.0;
    for (int i = first; i < feedbackHistory.size(); ++i) {
        const UserFeedback& feedback = feedbackHistory.at(i);
        if (within(feedback.preferredSpeed, controls.readingSpeed)) {
            score += kPreferenceStep;
        }
        if (within(feedback.preferredPauses, controls.pauseFrequency)) {
            score += kPreferenceStep;
        }
        if (within(feedback.preferredHighlighting, controls.highlightIntensity)) {
            score += kPreferenceStep;
        }
    }
    return std::min(kPreferenceCap, score);
}

double RewardModel::efficiencyReward(double progress, double comprehension)
{
    const double efficiency = progress * comprehension;
    if (efficiency >= 0.8) {
        return 0.4;
    }
    if (efficiency >= 0.6) {
        return 0.3;
    }
    if (efficiency >= 0.4) {
        return 0.2;
    }
    if (efficiency >= 0.2) {
        return 0.1;
    }
    return 0.0;
}

double RewardModel::extremePenalty(const ControlSettings& controls)
{
    double penalty = 0.0;
    if (controls.readingSpeed < 0.6 || controls.readingSpeed > 1.4) {
        penalty -= 0.1;
    }
    if (controls.pauseFrequency < 0.05 || controls.pauseFrequency > 0.9) {
        penalty -= 0.1;
    }
    if (controls.highlightIntensity < 0.05 || controls.highlightIntensity > 0.95) {
        penalty -= 0.1;
    }
    return penalty;
}

} // namespace rt
