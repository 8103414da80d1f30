#include <QtTest/QtTest>

#include "planner/scheduling/DesiredTimeParser.hpp"

using namespace planner::scheduling;

namespace {

const QDateTime NOW(QDate(2024, 5, 6), QTime(8, 0));

QDateTime parsed(const QString &text)
{
    return parseDesiredTime(text, NOW).value_or(QDateTime());
}

QDateTime today(int hour, int minute)
{
    return QDateTime(QDate(2024, 5, 6), QTime(hour, minute));
}

} // namespace

class DesiredTimeParserTest : public QObject
{
    Q_OBJECT

private slots:
    void parsesIsoTimes();
    void parsesRelativePhrases();
    void parsesClockTimes();
    void rejectsEverythingElse();
};

void DesiredTimeParserTest::parsesIsoTimes()
{
    QCOMPARE(parsed(QStringLiteral("2024-05-07T14:30:00")), QDateTime(QDate(2024, 5, 7), QTime(14, 30)));
    QCOMPARE(parsed(QStringLiteral("2024-05-07 09:15")), QDateTime(QDate(2024, 5, 7), QTime(9, 15)));
}

void DesiredTimeParserTest::parsesRelativePhrases()
{
    QCOMPARE(parsed(QStringLiteral("in 30 minutes")), today(8, 30));
    QCOMPARE(parsed(QStringLiteral("In 2 hours")), today(10, 0));
    QCOMPARE(parsed(QStringLiteral("tomorrow")), QDateTime(QDate(2024, 5, 7), QTime(9, 0)));
    QCOMPARE(parsed(QStringLiteral("today in the evening")), today(18, 0));
}

void DesiredTimeParserTest::parsesClockTimes()
{
    QCOMPARE(parsed(QStringLiteral("3pm")), today(15, 0));
    QCOMPARE(parsed(QStringLiteral("at 9:30 am")), today(9, 30));
    QCOMPARE(parsed(QStringLiteral("12 pm")), today(12, 0));
    QCOMPARE(parsed(QStringLiteral("12am")), today(0, 0));
}

void DesiredTimeParserTest::rejectsEverythingElse()
{
    QVERIFY(!parseDesiredTime(QString(), NOW));
    QVERIFY(!parseDesiredTime(QStringLiteral("   "), NOW));
    QVERIFY(!parseDesiredTime(QStringLiteral("unscheduled"), NOW));
    QVERIFY(!parseDesiredTime(QStringLiteral("whenever"), NOW));
    QVERIFY(!parseDesiredTime(QStringLiteral("13pm"), NOW));
    QVERIFY(!parseDesiredTime(QStringLiteral("9:75 am"), NOW));
}

QTEST_GUILESS_MAIN(DesiredTimeParserTest)
#include "DesiredTimeParserTest.moc"
