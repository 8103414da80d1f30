#include <QtTest/QtTest>

#include "planner/scheduling/SlotFinder.hpp"

using namespace planner::scheduling;

namespace {

QDateTime at(int hour, int minute, int second = 0)
{
    return QDateTime(QDate(2024, 5, 6), QTime(hour, minute, second));
}

BusyInterval busy(const QDateTime &start, const QDateTime &end, const QString &label = QStringLiteral("Busy"))
{
    return BusyInterval{start, end, label, std::nullopt};
}

} // namespace

class SlotFinderTest : public QObject
{
    Q_OBJECT

private slots:
    void roundsUpToBlock();
    void roundsAcrossMidnight();
    void emptyCalendarTakesNextBlock();
    void skipsPastBlockingIntervals();
    void landsOnBlockingEnd();
    void keepsClearOfMeetingBuffers();
    void ignoresBuffersForOtherLabels();
    void ignoresExcludedTask();
    void fallsBackAtHorizon();
    void resultIsAlwaysAlignedAndLater();
};

void SlotFinderTest::roundsUpToBlock()
{
    QCOMPARE(roundUpToBlock(at(9, 0), 15), at(9, 0));
    QCOMPARE(roundUpToBlock(at(9, 1), 15), at(9, 15));
    QCOMPARE(roundUpToBlock(at(9, 14, 30), 15), at(9, 15));
    QCOMPARE(roundUpToBlock(at(9, 0, 30), 15), at(9, 15));
    QCOMPARE(roundUpToBlock(at(9, 7), 5), at(9, 10));
    QCOMPARE(roundUpToBlock(at(9, 7, 10), 1), at(9, 8));
}

void SlotFinderTest::roundsAcrossMidnight()
{
    const QDateTime lateEvening(QDate(2024, 5, 6), QTime(23, 50));
    QCOMPARE(roundUpToBlock(lateEvening, 15), QDateTime(QDate(2024, 5, 7), QTime(0, 0)));
}

void SlotFinderTest::emptyCalendarTakesNextBlock()
{
    const SlotResult slot = findNextSlot({}, at(9, 0));
    QCOMPARE(slot.start, at(9, 15));
    QVERIFY(!slot.degraded);
}

void SlotFinderTest::skipsPastBlockingIntervals()
{
    const std::vector<BusyInterval> intervals = {
        busy(at(9, 15), at(9, 45)),
        busy(at(9, 45), at(10, 30)),
    };
    const SlotResult slot = findNextSlot(intervals, at(9, 0));
    QCOMPARE(slot.start, at(10, 30));
    QVERIFY(!slot.degraded);
}

void SlotFinderTest::landsOnBlockingEnd()
{
    const std::vector<BusyInterval> intervals = {busy(at(9, 0), at(9, 30), QStringLiteral("Daily standup"))};
    QCOMPARE(findNextSlot(intervals, at(9, 10)).start, at(9, 30));
}

void SlotFinderTest::keepsClearOfMeetingBuffers()
{
    const std::vector<BusyInterval> intervals = {busy(at(10, 0), at(10, 30), QStringLiteral("Team meeting"))};
    SlotSearchOptions options;
    options.durationMinutes = 10;
    options.avoidNaps = true;

    const SlotResult slot = findNextSlot(intervals, at(10, 10), options);
    QVERIFY(slot.start >= at(10, 50));
    QCOMPARE(slot.start, at(10, 50));

    options.avoidNaps = false;
    QCOMPARE(findNextSlot(intervals, at(10, 10), options).start, at(10, 30));
}

void SlotFinderTest::ignoresBuffersForOtherLabels()
{
    const std::vector<BusyInterval> intervals = {busy(at(10, 0), at(10, 30), QStringLiteral("Lunch"))};
    SlotSearchOptions options;
    options.durationMinutes = 10;
    options.avoidNaps = true;
    QCOMPARE(findNextSlot(intervals, at(10, 10), options).start, at(10, 30));
}

void SlotFinderTest::ignoresExcludedTask()
{
    std::vector<BusyInterval> intervals = {busy(at(9, 15), at(9, 45), QStringLiteral("Task#7 (30m): Report"))};
    intervals.front().taskId = 7;

    SlotSearchOptions options;
    QCOMPARE(findNextSlot(intervals, at(9, 0), options).start, at(9, 45));

    options.excludeTaskId = 7;
    QCOMPARE(findNextSlot(intervals, at(9, 0), options).start, at(9, 15));
}

void SlotFinderTest::fallsBackAtHorizon()
{
    const std::vector<BusyInterval> intervals = {busy(at(9, 0), at(22, 0))};
    SlotSearchOptions options;
    options.horizonHours = 12;

    const SlotResult slot = findNextSlot(intervals, at(9, 0), options);
    QVERIFY(slot.degraded);
    QCOMPARE(slot.start, at(21, 0));
}

void SlotFinderTest::resultIsAlwaysAlignedAndLater()
{
    const std::vector<BusyInterval> intervals = {
        busy(at(8, 7), at(8, 52)),
        busy(at(9, 3, 20), at(9, 41, 10)),
        busy(at(11, 0), at(11, 5)),
    };
    for (int minute = 0; minute < 240; minute += 7) {
        const QDateTime after = at(8, 0).addSecs(minute * 60);
        const SlotResult slot = findNextSlot(intervals, after);
        QVERIFY(slot.start > after);
        QCOMPARE(slot.start.time().second(), 0);
        QCOMPARE((slot.start.time().hour() * 60 + slot.start.time().minute()) % 15, 0);
        const QDateTime end = slot.start.addSecs(30 * 60);
        for (const auto &interval : intervals) {
            QVERIFY(!overlaps(slot.start, end, interval));
        }
    }
}

QTEST_GUILESS_MAIN(SlotFinderTest)
#include "SlotFinderTest.moc"
