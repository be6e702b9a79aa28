#include <QtTest/QtTest>

#include "core/shared/query_record.h"

#include <QJsonArray>

#include <limits>

class TestQueryRecord : public QObject {
    Q_OBJECT

private slots:
    void testDefaultsAreValid();
    void testReadingSpeedBounds_data();
    void testReadingSpeedBounds();
    void testUnitFieldsRejectOutOfRange();
    void testSessionFieldsAreLowerBounded();
    void testPreferencesAreRangeChecked();
    void testErrorMessage();
    void testJsonOmitsUnsetPreferences();
};

void TestQueryRecord::testDefaultsAreValid()
{
    rt::QueryRecord record;
    QVERIFY(record.validate());
    QVERIFY(!record.hasPreferences());

    const rt::ControlSettings current = record.currentSettings();
    QCOMPARE(current.readingSpeed, 1.0);
    QCOMPARE(current.pauseFrequency, 0.3);
    QCOMPARE(current.highlightIntensity, 0.5);
    QCOMPARE(current.chunkSize, 0.5);
}

void TestQueryRecord::testReadingSpeedBounds_data()
{
    QTest::addColumn<double>("speed");
    QTest::addColumn<bool>("valid");

    QTest::newRow("below") << 0.49 << false;
    QTest::newRow("lower_edge") << 0.5 << true;
    QTest::newRow("nominal") << 1.0 << true;
    QTest::newRow("upper_edge") << 1.5 << true;
    QTest::newRow("above") << 1.51 << false;
}

void TestQueryRecord::testReadingSpeedBounds()
{
    QFETCH(double, speed);
    QFETCH(bool, valid);

    rt::QueryRecord record;
    record.currentReadingSpeed = speed;
    rt::ValidationError error;
    QCOMPARE(record.validate(&error), valid);
    if (!valid) {
        QCOMPARE(error.field, QStringLiteral("current_reading_speed"));
        QCOMPARE(error.value, speed);
        QCOMPARE(error.range.min, 0.5);
        QCOMPARE(error.range.max, 1.5);
    }
}

void TestQueryRecord::testUnitFieldsRejectOutOfRange()
{
    rt::QueryRecord record;
    record.userComprehension = 1.2;
    rt::ValidationError error;
    QVERIFY(!record.validate(&error));
    QCOMPARE(error.field, QStringLiteral("user_comprehension"));

    record = rt::QueryRecord();
    record.currentPauseFrequency = 0.05;
    QVERIFY(!record.validate(&error));
    QCOMPARE(error.field, QStringLiteral("current_pause_frequency"));

    record = rt::QueryRecord();
    record.textDifficulty = std::numeric_limits<double>::quiet_NaN();
    QVERIFY(!record.validate(&error));
    QCOMPARE(error.field, QStringLiteral("text_difficulty"));
}

void TestQueryRecord::testSessionFieldsAreLowerBounded()
{
    rt::QueryRecord record;
    record.sessionDuration = -1.0;
    rt::ValidationError error;
    QVERIFY(!record.validate(&error));
    QCOMPARE(error.field, QStringLiteral("session_duration"));
    QVERIFY(error.unbounded);

    record = rt::QueryRecord();
    record.actionCount = -1;
    QVERIFY(!record.validate(&error));
    QCOMPARE(error.field, QStringLiteral("action_count"));

    record = rt::QueryRecord();
    record.sessionDuration = 86400.0;
    record.actionCount = 5000;
    QVERIFY(record.validate());
}

void TestQueryRecord::testPreferencesAreRangeChecked()
{
    rt::QueryRecord record;
    record.preferredSpeed = 2.0;
    QVERIFY(record.hasPreferences());
    rt::ValidationError error;
    QVERIFY(!record.validate(&error));
    QCOMPARE(error.field, QStringLiteral("preferred_speed"));

    record.preferredSpeed = 1.2;
    record.preferredPauses = 0.9;
    QVERIFY(!record.validate(&error));
    QCOMPARE(error.field, QStringLiteral("preferred_pauses"));

    record.preferredPauses = 0.4;
    record.preferredHighlighting = 0.7;
    QVERIFY(record.validate());
}

void TestQueryRecord::testErrorMessage()
{
    rt::QueryRecord record;
    record.currentReadingSpeed = 0.49;
    rt::ValidationError error;
    QVERIFY(!record.validate(&error));
    QCOMPARE(error.message(), QStringLiteral("current_reading_speed must be in [0.5, 1.5] (got 0.49)"));

    record = rt::QueryRecord();
    record.actionCount = -3;
    QVERIFY(!record.validate(&error));
    QCOMPARE(error.message(), QStringLiteral("action_count must be >= 0 (got -3)"));
}

void TestQueryRecord::testJsonOmitsUnsetPreferences()
{
    rt::QueryRecord record;
    record.recentCommands = {QStringLiteral("faster")};
    QJsonObject json = record.toJson();
    QVERIFY(!json.contains(QStringLiteral("preferred_speed")));
    QCOMPARE(int(json.value(QStringLiteral("recent_commands")).toArray().size()), 1);

    record.preferredSpeed = 1.1;
    json = record.toJson();
    QCOMPARE(json.value(QStringLiteral("preferred_speed")).toDouble(), 1.1);
}

QTEST_MAIN(TestQueryRecord)
#include "test_query_record.moc"
