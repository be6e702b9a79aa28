#include <QtTest/QtTest>

#include "core/session/session_tracker.h"

class TestSessionTracker : public QObject {
    Q_OBJECT

private slots:
    void testStartSessionResetsState();
    void testCommandHistoryIsBounded();
    void testProgressIsClamped();
    void testCreateQueryRecordFillsTrackerFields();
    void testOverridesWin();
    void testCreateQueryRecordValidates();
};

void TestSessionTracker::testStartSessionResetsState()
{
    rt::SessionTracker tracker;
    QVERIFY(!tracker.isActive());
    QCOMPARE(tracker.sessionDurationSeconds(), 0.0);

    tracker.startSession();
    QVERIFY(tracker.isActive());
    tracker.addCommand(QStringLiteral("faster"));
    tracker.updateProgress(0.4);

    tracker.startSession();
    QCOMPARE(tracker.sessionCount(), 2);
    QVERIFY(tracker.commandHistory().isEmpty());
    QCOMPARE(tracker.progress(), 0.0);

    tracker.endSession();
    QVERIFY(!tracker.isActive());
}

void TestSessionTracker::testCommandHistoryIsBounded()
{
    rt::SessionTracker tracker;
    tracker.startSession();
    for (int i = 0; i < 15; ++i) {
        tracker.addCommand(QStringLiteral("cmd%1").arg(i));
    }
    QCOMPARE(int(tracker.commandHistory().size()), rt::SessionTracker::kMaxCommands);
    QCOMPARE(tracker.commandHistory().first(), QStringLiteral("cmd5"));
    QCOMPARE(tracker.commandHistory().last(), QStringLiteral("cmd14"));
}

void TestSessionTracker::testProgressIsClamped()
{
    rt::SessionTracker tracker;
    tracker.updateProgress(1.7);
    QCOMPARE(tracker.progress(), 1.0);
    tracker.updateProgress(-0.2);
    QCOMPARE(tracker.progress(), 0.0);
}

void TestSessionTracker::testCreateQueryRecordFillsTrackerFields()
{
    rt::SessionTracker tracker;
    tracker.startSession();
    tracker.addCommand(QStringLiteral("slower"));
    tracker.addCommand(QStringLiteral("repeat"));

    rt::QueryRecord observed;
    observed.textDifficulty = 0.8;

    const std::optional<rt::QueryRecord> record = tracker.createQueryRecord(observed);
    QVERIFY(record.has_value());
    QCOMPARE(record->textDifficulty, 0.8);
    QCOMPARE(record->recentCommands,
             (QStringList{QStringLiteral("slower"), QStringLiteral("repeat")}));
    QCOMPARE(record->actionCount, 2);
    QVERIFY(record->sessionDuration >= 0.0);
}

void TestSessionTracker::testOverridesWin()
{
    rt::SessionTracker tracker;
    tracker.startSession();
    tracker.addCommand(QStringLiteral("slower"));

    rt::QueryOverrides overrides;
    overrides.recentCommands = QStringList{QStringLiteral("continue")};
    overrides.sessionDuration = 120.0;
    overrides.actionCount = 9;

    const std::optional<rt::QueryRecord> record =
        tracker.createQueryRecord(rt::QueryRecord(), overrides);
    QVERIFY(record.has_value());
    QCOMPARE(record->recentCommands, QStringList{QStringLiteral("continue")});
    QCOMPARE(record->sessionDuration, 120.0);
    QCOMPARE(record->actionCount, 9);
}

void TestSessionTracker::testCreateQueryRecordValidates()
{
    rt::SessionTracker tracker;
    tracker.startSession();

    rt::QueryRecord observed;
    observed.currentChunkSize = 0.05;
    rt::ValidationError error;
    QVERIFY(!tracker.createQueryRecord(observed, rt::QueryOverrides(), &error).has_value());
    QCOMPARE(error.field, QStringLiteral("current_chunk_size"));

    rt::QueryOverrides overrides;
    overrides.sessionDuration = -5.0;
    QVERIFY(!tracker.createQueryRecord(rt::QueryRecord(), overrides, &error).has_value());
    QCOMPARE(error.field, QStringLiteral("session_duration"));
}

QTEST_MAIN(TestSessionTracker)
#include "test_session_tracker.moc"
