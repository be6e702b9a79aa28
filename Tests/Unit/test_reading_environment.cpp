#include <QtTest/QtTest>

#include "core/environment/reading_environment.h"

class TestReadingEnvironment : public QObject {
    Q_OBJECT

private slots:
    void testResetRestoresDefaults();
    void testStepMapsActionToSettings();
    void testStepClampsSaturatedActions();
    void testStepIgnoresReservedComponents();
    void testDoneAfterMaxSteps();
    void testApplySettingsClamps();
    void testRecentCommandsAreBounded();
    void testFeedbackUpdatesSignals();
    void testFeedbackHistoryIsBounded();
    void testSessionLifecycle();
    void testTextContentDrivesFeatures();
    void testRewardUsesLiveState();
};

void TestReadingEnvironment::testResetRestoresDefaults()
{
    rt::ReadingEnvironment env;
    rt::ControlSettings custom;
    custom.readingSpeed = 1.3;
    env.applySettings(custom);
    env.updateTextProgress(0.7);
    env.step(rt::ActionVector(rt::kDefaultActionDim, 0.2));

    const rt::ResetResult result = env.reset();
    QCOMPARE(int(result.state.size()), rt::kDefaultStateDim);
    QCOMPARE(env.stepCount(), 0);
    QCOMPARE(env.textProgress(), 0.0);
    QCOMPARE(env.currentSettings().readingSpeed, 1.0);
    QCOMPARE(result.state.at(3), 1.0);
    QCOMPARE(result.state.at(10), 0.0);
    QVERIFY(result.info.contains(QStringLiteral("settings")));
}

void TestReadingEnvironment::testStepMapsActionToSettings()
{
    rt::ReadingEnvironment env;
    env.reset();

    const rt::StepResult result = env.step(rt::ActionVector(rt::kDefaultActionDim, 0.0));
    QCOMPARE(env.currentSettings().readingSpeed, 1.0);
    QCOMPARE(env.currentSettings().pauseFrequency, 0.3);
    QCOMPARE(env.currentSettings().highlightIntensity, 0.5);
    QCOMPARE(env.currentSettings().chunkSize, 0.5);
    QCOMPARE(env.stepCount(), 1);
    QCOMPARE(result.reward, result.breakdown.totalReward);
    QVERIFY(!result.done);
    QVERIFY(!result.truncated);
    QCOMPARE(int(result.nextState.size()), rt::kDefaultStateDim);
    QCOMPARE(result.nextState.at(10), 1.0);

    rt::ActionVector action(rt::kDefaultActionDim, 0.0);
    action[0] = 0.4;
    action[1] = -0.2;
    env.step(action);
    QVERIFY(qAbs(env.currentSettings().readingSpeed - 1.2) < 1e-12);
    QVERIFY(qAbs(env.currentSettings().pauseFrequency - 0.2) < 1e-12);
}

void TestReadingEnvironment::testStepClampsSaturatedActions()
{
    rt::ReadingEnvironment env;
    env.reset();

    env.step(rt::ActionVector(rt::kDefaultActionDim, 1.0));
    QCOMPARE(env.currentSettings().readingSpeed, 1.5);
    QCOMPARE(env.currentSettings().pauseFrequency, 0.8);
    QCOMPARE(env.currentSettings().highlightIntensity, 1.0);
    QCOMPARE(env.currentSettings().chunkSize, 1.0);

    env.step(rt::ActionVector(rt::kDefaultActionDim, -1.0));
    QCOMPARE(env.currentSettings().readingSpeed, 0.5);
    QCOMPARE(env.currentSettings().pauseFrequency, 0.1);
    QCOMPARE(env.currentSettings().highlightIntensity, 0.0);
    QCOMPARE(env.currentSettings().chunkSize, 0.1);

    env.step(rt::ActionVector(rt::kDefaultActionDim, 25.0));
    QCOMPARE(env.currentSettings().readingSpeed, 1.5);
}

void TestReadingEnvironment::testStepIgnoresReservedComponents()
{
    rt::ReadingEnvironment env;
    env.reset();

    rt::ActionVector action(rt::kDefaultActionDim, 0.0);
    for (int i = 4; i < action.size(); ++i) {
        action[i] = 0.9;
    }
    env.step(action);
    const rt::ControlSettings settings = env.currentSettings();
    QCOMPARE(settings.readingSpeed, 1.0);
    QCOMPARE(settings.pauseFrequency, 0.3);
    QCOMPARE(settings.highlightIntensity, 0.5);
    QCOMPARE(settings.chunkSize, 0.5);

    // A short action only touches the components it has.
    env.step({1.0});
    QCOMPARE(env.currentSettings().readingSpeed, 1.5);
    QCOMPARE(env.currentSettings().pauseFrequency, 0.3);
}

void TestReadingEnvironment::testDoneAfterMaxSteps()
{
    rt::ReadingEnvironment env(rt::kDefaultStateDim, 3);
    env.reset();
    const rt::ActionVector action(rt::kDefaultActionDim, 0.0);
    QVERIFY(!env.step(action).done);
    QVERIFY(!env.step(action).done);
    QVERIFY(!env.step(action).done);
    QVERIFY(env.step(action).done);
    QVERIFY(env.isSessionComplete());

    env.reset();
    QVERIFY(!env.isSessionComplete());
}

void TestReadingEnvironment::testApplySettingsClamps()
{
    rt::ReadingEnvironment env;
    rt::ControlSettings wild;
    wild.readingSpeed = 3.0;
    wild.pauseFrequency = 0.0;
    wild.highlightIntensity = -1.0;
    wild.chunkSize = 2.0;
    env.applySettings(wild);

    const rt::ControlSettings settings = env.currentSettings();
    QCOMPARE(settings.readingSpeed, 1.5);
    QCOMPARE(settings.pauseFrequency, 0.1);
    QCOMPARE(settings.highlightIntensity, 0.0);
    QCOMPARE(settings.chunkSize, 1.0);
}

void TestReadingEnvironment::testRecentCommandsAreBounded()
{
    rt::ReadingEnvironment env;
    QStringList commands;
    for (int i = 0; i < 12; ++i) {
        commands << QStringLiteral("cmd%1").arg(i);
    }
    env.setRecentCommands(commands);
    QCOMPARE(int(env.recentCommands().size()), rt::ReadingEnvironment::kMaxRecentCommands);
    QCOMPARE(env.recentCommands().first(), QStringLiteral("cmd2"));

    env.addCommand(QStringLiteral("latest"));
    QCOMPARE(int(env.recentCommands().size()), rt::ReadingEnvironment::kMaxRecentCommands);
    QCOMPARE(env.recentCommands().last(), QStringLiteral("latest"));
    QCOMPARE(env.currentFeatures().recentCommands, 1.0);
}

void TestReadingEnvironment::testFeedbackUpdatesSignals()
{
    rt::ReadingEnvironment env;
    rt::UserFeedback feedback;
    feedback.comprehension = 0.9;
    feedback.preferredSpeed = 1.2;
    env.updateUserFeedback(feedback);

    QCOMPARE(env.userComprehension(), 0.9);
    QCOMPARE(env.userEngagement(), 0.5);
    QCOMPARE(int(env.feedbackHistory().size()), 1);
    QVERIFY(env.feedbackHistory().first().timestamp.isValid());

    rt::ControlSettings preferred;
    preferred.readingSpeed = 1.2;
    env.applySettings(preferred);
    QCOMPARE(env.rewardBreakdown().preferenceReward, 0.2);
}

void TestReadingEnvironment::testFeedbackHistoryIsBounded()
{
    rt::ReadingEnvironment env;
    for (int i = 0; i < rt::ReadingEnvironment::kMaxFeedbackHistory + 25; ++i) {
        rt::UserFeedback feedback;
        feedback.preferredSpeed = 0.5 + 0.01 * i;
        env.updateUserFeedback(feedback);
    }

    const QVector<rt::UserFeedback> history = env.feedbackHistory();
    QCOMPARE(int(history.size()), rt::ReadingEnvironment::kMaxFeedbackHistory);
    QCOMPARE(*history.first().preferredSpeed, 0.5 + 0.01 * 25);
    QCOMPARE(*history.last().preferredSpeed, 0.5 + 0.01 * 74);
}

void TestReadingEnvironment::testSessionLifecycle()
{
    rt::ReadingEnvironment env;
    QVERIFY(!env.endSession());

    QCOMPARE(env.startSession(), 1);
    env.step(rt::ActionVector(rt::kDefaultActionDim, 0.0));

    // Starting again closes the open session first.
    QCOMPARE(env.startSession(), 2);
    QCOMPARE(env.sessionCount(), 2);
    QVERIFY(!env.sessions().first().isOpen());
    QCOMPARE(env.sessions().first().steps, 1);

    rt::SessionRecord record;
    QVERIFY(env.endSession(&record));
    QCOMPARE(record.sessionId, 2);
    QVERIFY(record.durationSeconds >= 0.0);
    QVERIFY(!env.endSession());
    QVERIFY(record.toJson().contains(QStringLiteral("end_time")));
}

void TestReadingEnvironment::testTextContentDrivesFeatures()
{
    rt::ReadingEnvironment env;
    env.setTextContent(QStringLiteral("Section 2 extends the results of Chapter 1."));

    const rt::StateFeatures features = env.currentFeatures();
    QCOMPARE(features.textType, rt::TextAnalyzer::kAcademicType);
    QVERIFY(features.textDifficulty > 0.0);
    QCOMPARE(env.textDifficulty(), features.textDifficulty);
    QCOMPARE(env.currentState().at(2), rt::TextAnalyzer::kAcademicType);
}

void TestReadingEnvironment::testRewardUsesLiveState()
{
    rt::ReadingEnvironment env;
    env.setTextFeatures(0.9, 0.8, 0.5);
    env.setUserSignals(0.95, 0.95);

    rt::ControlSettings tuned;
    tuned.readingSpeed = 0.84;
    tuned.pauseFrequency = 0.48;
    tuned.highlightIntensity = 0.67;
    env.applySettings(tuned);

    const rt::RewardBreakdown b = env.rewardBreakdown();
    QCOMPARE(b.speedReward, 1.0);
    QCOMPARE(b.engagementReward, 1.2);
    QCOMPARE(b.comprehensionReward, 1.5);
    QVERIFY(qAbs(b.difficultyAdaptationReward - 0.8) < 1e-9);
    QCOMPARE(b.continuityReward, 0.0);
    QCOMPARE(env.computeReward(), b.totalReward);

    for (int i = 0; i < 5; ++i) {
        env.recordInteraction();
    }
    QCOMPARE(env.rewardBreakdown().continuityReward, 0.1);
}

QTEST_MAIN(TestReadingEnvironment)
#include "test_reading_environment.moc"
