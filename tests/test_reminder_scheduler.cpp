#include <QtTest/QtTest>

#include "bots/reminder_scheduler.hpp"

#include <mutex>
#include <thread>
#include <utility>

using namespace tickler;

namespace {

constexpr int64_t kDay = 86400000LL;
constexpr int64_t kT0 = 1706711400000LL;

QString qs(const std::string& value) {
    return QString::fromStdString(value);
}

class RecordingPlatform : public ChatPlatform {
public:
    bool sendDirectMessage(const std::string& user_id, const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        direct_.emplace_back(user_id, text);
        return !fail_;
    }

    bool replyInChannel(const std::string& channel_id, const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        channel_.emplace_back(channel_id, text);
        return !fail_;
    }

    std::vector<std::pair<std::string, std::string>> direct() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return direct_;
    }

    void setFailing(bool fail) { fail_ = fail; }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, std::string>> direct_;
    std::vector<std::pair<std::string, std::string>> channel_;
    bool fail_ = false;
};

Reminder makeReminder(int64_t epoch_ms, const std::string& message) {
    Reminder reminder;
    reminder.trigger_time = ZonedTime(epoch_ms, TimeZone::utc());
    reminder.message = message;
    return reminder;
}

} // namespace

class ReminderSchedulerTests : public QObject {
    Q_OBJECT

private slots:
    void tickDeliversDueReminders();
    void tickReschedulesRecurringReminders();
    void deliveryFailureStillConsumesReminder();
    void nothingDueRequestsNoSave();
    void backgroundLoopDelivers();
};

void ReminderSchedulerTests::tickDeliversDueReminders() {
    ReminderStore store;
    RecordingPlatform platform;
    int saves = 0;
    ReminderScheduler scheduler(store, platform, std::chrono::milliseconds(1000), [&saves]() { saves++; });

    store.add("u1", makeReminder(kT0 - 1000, "pay rent"));
    store.add("u1", makeReminder(kT0 + 1000, "not yet"));
    store.add("u2", makeReminder(kT0, "exactly now"));

    QCOMPARE(scheduler.tick(ZonedTime(kT0, TimeZone::utc())), size_t(2));
    QCOMPARE(saves, 1);

    const auto sent = platform.direct();
    QCOMPARE(sent.size(), size_t(2));
    QCOMPARE(qs(sent[0].first), QString("u1"));
    QCOMPARE(qs(sent[0].second), QString("Reminder: pay rent"));
    QCOMPARE(qs(sent[1].first), QString("u2"));
    QCOMPARE(qs(sent[1].second), QString("Reminder: exactly now"));

    QCOMPARE(store.list("u1").size(), size_t(1));
    QCOMPARE(qs(store.list("u1")[0].message), QString("not yet"));
}

void ReminderSchedulerTests::tickReschedulesRecurringReminders() {
    ReminderStore store;
    RecordingPlatform platform;
    ReminderScheduler scheduler(store, platform);

    Reminder daily = makeReminder(kT0, "standup");
    daily.interval = std::vector<TimeModifier>{TimeModifier::delay(kDay)};
    store.add("u1", daily);

    // Three days late: every missed occurrence fires in this one tick.
    QCOMPARE(scheduler.tick(ZonedTime(kT0 + 2 * kDay + 5, TimeZone::utc())), size_t(3));
    QCOMPARE(platform.direct().size(), size_t(3));

    const auto list = store.list("u1");
    QCOMPARE(list.size(), size_t(1));
    QCOMPARE(qint64(list[0].trigger_time.epochMillis()), qint64(kT0 + 3 * kDay));
}

void ReminderSchedulerTests::deliveryFailureStillConsumesReminder() {
    ReminderStore store;
    RecordingPlatform platform;
    platform.setFailing(true);
    ReminderScheduler scheduler(store, platform);

    store.add("u1", makeReminder(kT0, "lost"));
    QCOMPARE(scheduler.tick(ZonedTime(kT0, TimeZone::utc())), size_t(1));
    QVERIFY(store.list("u1").empty());
}

void ReminderSchedulerTests::nothingDueRequestsNoSave() {
    ReminderStore store;
    RecordingPlatform platform;
    int saves = 0;
    ReminderScheduler scheduler(store, platform, std::chrono::milliseconds(1000), [&saves]() { saves++; });

    store.add("u1", makeReminder(kT0 + 1, "later"));
    QCOMPARE(scheduler.tick(ZonedTime(kT0, TimeZone::utc())), size_t(0));
    QCOMPARE(saves, 0);
    QVERIFY(platform.direct().empty());
}

void ReminderSchedulerTests::backgroundLoopDelivers() {
    ReminderStore store;
    RecordingPlatform platform;
    ReminderScheduler scheduler(store, platform, std::chrono::milliseconds(20));

    store.add("u1", makeReminder(1000, "long overdue"));
    scheduler.start();

    for (int i = 0; i < 100 && platform.direct().empty(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    scheduler.stop();

    const auto sent = platform.direct();
    QCOMPARE(sent.size(), size_t(1));
    QCOMPARE(qs(sent[0].second), QString("Reminder: long overdue"));
}

QTEST_APPLESS_MAIN(ReminderSchedulerTests)
#include "test_reminder_scheduler.moc"
