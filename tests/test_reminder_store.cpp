#include <QtTest/QtTest>

#include "storage/reminder_store.hpp"

using namespace tickler;

namespace {

constexpr int64_t kDay = 86400000LL;
constexpr int64_t kT0 = 1706711400000LL;

QString qs(const std::string& value) {
    return QString::fromStdString(value);
}

Reminder makeReminder(int64_t epoch_ms, const std::string& message) {
    Reminder reminder;
    reminder.trigger_time = ZonedTime(epoch_ms, TimeZone::utc());
    reminder.message = message;
    return reminder;
}

} // namespace

class ReminderStoreTests : public QObject {
    Q_OBJECT

private slots:
    void listStaysSortedByTriggerTime();
    void equalTimesKeepInsertionOrder();
    void idsArePositional();
    void addAllReportsFinalPositions();
    void addAllPlacesTiesAfterExistingReminders();
    void invalidIdsAreRejected();
    void intervalsCanBeSetAndCleared();
    void takeDueFiresOnlyDueReminders();
    void takeDueCatchesUpRecurringReminder();
    void failedRecurrenceIsDropped();
    void nonAdvancingRecurrenceIsDropped();
    void snapshotAndReplaceAll();
};

void ReminderStoreTests::listStaysSortedByTriggerTime() {
    ReminderStore store;
    QCOMPARE(store.add("u1", makeReminder(300, "c")), size_t(0));
    QCOMPARE(store.add("u1", makeReminder(100, "a")), size_t(0));
    QCOMPARE(store.add("u1", makeReminder(200, "b")), size_t(1));

    const auto list = store.list("u1");
    QCOMPARE(list.size(), size_t(3));
    QCOMPARE(qs(list[0].message), QString("a"));
    QCOMPARE(qs(list[1].message), QString("b"));
    QCOMPARE(qs(list[2].message), QString("c"));
    QVERIFY(store.list("someone-else").empty());
}

void ReminderStoreTests::equalTimesKeepInsertionOrder() {
    ReminderStore store;
    store.add("u1", makeReminder(100, "first"));
    QCOMPARE(store.add("u1", makeReminder(100, "second")), size_t(1));

    const auto list = store.list("u1");
    QCOMPARE(qs(list[0].message), QString("first"));
    QCOMPARE(qs(list[1].message), QString("second"));
}

void ReminderStoreTests::idsArePositional() {
    ReminderStore store;
    store.add("u1", makeReminder(100, "A"));
    store.add("u1", makeReminder(200, "B"));

    Reminder removed;
    QVERIFY(store.removeAt("u1", 0, removed));
    QCOMPARE(qs(removed.message), QString("A"));

    // B moved up to id 0.
    const auto list = store.list("u1");
    QCOMPARE(list.size(), size_t(1));
    QCOMPARE(qs(list[0].message), QString("B"));

    QVERIFY(store.removeAt("u1", 0, removed));
    QCOMPARE(store.userCount(), size_t(0));
}

void ReminderStoreTests::addAllReportsFinalPositions() {
    ReminderStore store;
    store.add("u1", makeReminder(100, "a"));
    store.add("u1", makeReminder(300, "c"));

    const auto positions = store.addAll("u1", {
        makeReminder(400, "d"), makeReminder(200, "b"), makeReminder(50, "z")
    });
    QCOMPARE(positions.size(), size_t(3));
    QCOMPARE(positions[0], size_t(4));
    QCOMPARE(positions[1], size_t(2));
    QCOMPARE(positions[2], size_t(0));

    const auto list = store.list("u1");
    QCOMPARE(qs(list[positions[0]].message), QString("d"));
    QCOMPARE(qs(list[positions[1]].message), QString("b"));
    QCOMPARE(qs(list[positions[2]].message), QString("z"));
}

void ReminderStoreTests::addAllPlacesTiesAfterExistingReminders() {
    ReminderStore store;
    store.add("u1", makeReminder(100, "a"));
    store.add("u1", makeReminder(100, "b"));

    std::vector<Reminder> batch;
    for (int i = 0; i < 64; ++i) {
        batch.push_back(makeReminder(i % 2 == 0 ? 100 : 50, "n" + std::to_string(i)));
    }
    const auto positions = store.addAll("u1", batch);
    QCOMPARE(positions.size(), size_t(64));

    const auto list = store.list("u1");
    QCOMPARE(list.size(), size_t(66));
    QCOMPARE(qs(list[0].message), QString("n1"));
    QCOMPARE(qs(list[31].message), QString("n63"));
    QCOMPARE(qs(list[32].message), QString("a"));
    QCOMPARE(qs(list[33].message), QString("b"));
    QCOMPARE(qs(list[34].message), QString("n0"));
    QCOMPARE(qs(list[65].message), QString("n62"));
    for (size_t i = 0; i < positions.size(); ++i) {
        QCOMPARE(qs(list[positions[i]].message), qs("n" + std::to_string(i)));
    }
}

void ReminderStoreTests::invalidIdsAreRejected() {
    ReminderStore store;
    Reminder out;
    QVERIFY(!store.removeAt("u1", 0, out));
    QVERIFY(!store.clearInterval("u1", 0, out));

    store.add("u1", makeReminder(100, "a"));
    QVERIFY(!store.removeAt("u1", 1, out));
    QVERIFY(!store.setInterval("u1", 7, {TimeModifier::delay(kDay)}, out));
    QVERIFY(!store.removeAt("u2", 0, out));
    QCOMPARE(store.list("u1").size(), size_t(1));
}

void ReminderStoreTests::intervalsCanBeSetAndCleared() {
    ReminderStore store;
    store.add("u1", makeReminder(100, "a"));

    Reminder out;
    QVERIFY(store.setInterval("u1", 0, {TimeModifier::delay(kDay)}, out));
    QCOMPARE(qs(out.message), QString("a"));
    QVERIFY(out.interval.has_value());
    QVERIFY(store.list("u1")[0].interval.has_value());

    QVERIFY(store.clearInterval("u1", 0, out));
    QVERIFY(!out.interval.has_value());
    QVERIFY(!store.list("u1")[0].interval.has_value());
}

void ReminderStoreTests::takeDueFiresOnlyDueReminders() {
    ReminderStore store;
    store.add("u1", makeReminder(kT0, "due"));
    store.add("u1", makeReminder(kT0 + 1, "later"));
    store.add("u2", makeReminder(kT0 - 5, "overdue"));

    const auto fired = store.takeDue(ZonedTime(kT0, TimeZone::utc()));
    QCOMPARE(fired.size(), size_t(2));

    QStringList messages;
    for (const auto& item : fired) {
        messages << qs(item.reminder.message);
        QVERIFY(!item.rescheduled);
    }
    messages.sort();
    QCOMPARE(messages, QStringList({"due", "overdue"}));

    QCOMPARE(store.list("u1").size(), size_t(1));
    QCOMPARE(store.userCount(), size_t(1));
    QVERIFY(store.takeDue(ZonedTime(kT0, TimeZone::utc())).empty());
}

void ReminderStoreTests::takeDueCatchesUpRecurringReminder() {
    ReminderStore store;
    Reminder daily = makeReminder(kT0, "standup");
    daily.interval = std::vector<TimeModifier>{TimeModifier::delay(kDay)};
    store.add("u1", daily);

    const auto fired = store.takeDue(ZonedTime(kT0 + 3 * kDay, TimeZone::utc()));
    QCOMPARE(fired.size(), size_t(4));
    for (size_t i = 0; i < fired.size(); ++i) {
        QCOMPARE(qint64(fired[i].reminder.trigger_time.epochMillis()), qint64(kT0 + static_cast<int64_t>(i) * kDay));
        QVERIFY(fired[i].rescheduled);
    }

    const auto remaining = store.list("u1");
    QCOMPARE(remaining.size(), size_t(1));
    QCOMPARE(qint64(remaining[0].trigger_time.epochMillis()), qint64(kT0 + 4 * kDay));
    QVERIFY(remaining[0].interval.has_value());
}

void ReminderStoreTests::failedRecurrenceIsDropped() {
    ReminderStore store;
    Reminder broken = makeReminder(kT0, "never again");
    broken.interval = std::vector<TimeModifier>{TimeModifier::date(std::nullopt, 2, 30)};
    store.add("u1", broken);

    const auto fired = store.takeDue(ZonedTime(kT0, TimeZone::utc()));
    QCOMPARE(fired.size(), size_t(1));
    QVERIFY(!fired[0].rescheduled);
    QVERIFY(!fired[0].reschedule_error.empty());
    QVERIFY(store.list("u1").empty());
}

void ReminderStoreTests::nonAdvancingRecurrenceIsDropped() {
    ReminderStore store;
    Reminder stuck = makeReminder(kT0, "stuck");
    stuck.interval = std::vector<TimeModifier>{TimeModifier::delay(0)};
    store.add("u1", stuck);

    const auto fired = store.takeDue(ZonedTime(kT0 + kDay, TimeZone::utc()));
    QCOMPARE(fired.size(), size_t(1));
    QVERIFY(!fired[0].rescheduled);
    QVERIFY(store.list("u1").empty());
}

void ReminderStoreTests::snapshotAndReplaceAll() {
    ReminderStore store;
    store.add("u1", makeReminder(500, "old"));

    std::vector<UserReminder> loaded = {
        {"u2", makeReminder(300, "late")},
        {"u2", makeReminder(100, "early")},
        {"u3", makeReminder(200, "other")}
    };
    store.replaceAll(loaded);

    QVERIFY(store.list("u1").empty());
    QCOMPARE(store.userCount(), size_t(2));
    QCOMPARE(qs(store.list("u2")[0].message), QString("early"));

    const auto snapshot = store.snapshot();
    QCOMPARE(snapshot.size(), size_t(3));
    QCOMPARE(qs(snapshot[0].user_id), QString("u2"));
    QCOMPARE(qs(snapshot[0].reminder.message), QString("early"));
    QCOMPARE(qs(snapshot[2].user_id), QString("u3"));
}

QTEST_APPLESS_MAIN(ReminderStoreTests)
#include "test_reminder_store.moc"
