#include <QtTest/QtTest>
#include <QTemporaryDir>

#include "storage/snapshot_persistence.hpp"

#include <fstream>
#include <sstream>

using namespace tickler;

namespace {

constexpr int64_t kDay = 86400000LL;

QString qs(const std::string& value) {
    return QString::fromStdString(value);
}

void writeText(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << content;
}

std::string readText(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream buf;
    buf << file.rdbuf();
    return buf.str();
}

TimeZone zoneNamed(const std::string& name) {
    auto zone = TimeZone::locate(name);
    return zone ? *zone : TimeZone::utc();
}

} // namespace

class PersistenceTests : public QObject {
    Q_OBJECT

private slots:
    void missingFilesStartEmpty();
    void snapshotSurvivesRestart();
    void messagesWithQuotesAndNewlines();
    void malformedSnapshotIsFatal();
    void incompleteRecordIsFatal();
    void unknownZoneIsFatal();
    void legacyTimezonesAreMigrated();
    void writerFlushesOnStop();
};

void PersistenceTests::missingFilesStartEmpty() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    SnapshotPersistence persistence(dir.path().toStdString());
    ReminderStore reminders;
    PreferenceStore preferences("America/New_York");
    persistence.load(reminders, preferences);

    QCOMPARE(reminders.userCount(), size_t(0));
    QVERIFY(preferences.snapshot().empty());
}

void PersistenceTests::snapshotSurvivesRestart() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const std::string data_dir = dir.path().toStdString();

    {
        SnapshotPersistence persistence(data_dir);
        ReminderStore reminders;
        PreferenceStore preferences("America/New_York");

        Reminder rent;
        rent.trigger_time = ZonedTime(983908800000LL, zoneNamed("America/New_York"));
        rent.message = "pay rent";
        rent.interval = std::vector<TimeModifier>{TimeModifier::months(1)};
        reminders.add("u1", rent);

        Reminder call;
        call.trigger_time = ZonedTime(983908800000LL - kDay, zoneNamed("Europe/Berlin"));
        call.message = "call mom";
        reminders.add("u1", call);

        preferences.update("u1", [](Preferences& p) {
            p.timezone = "Europe/Berlin";
            p.display_format = TimeFormat::H24;
        });

        std::string error;
        QVERIFY2(persistence.save(reminders, preferences, &error), error.c_str());
        QVERIFY(!QFile::exists(qs(persistence.pathFor(SnapshotPersistence::kRemindersFile) + ".tmp")));
    }

    SnapshotPersistence persistence(data_dir);
    ReminderStore reminders;
    PreferenceStore preferences("America/New_York");
    persistence.load(reminders, preferences);

    const auto list = reminders.list("u1");
    QCOMPARE(list.size(), size_t(2));
    QCOMPARE(qs(list[0].message), QString("call mom"));
    QCOMPARE(qs(list[0].trigger_time.zone().name()), QString("Europe/Berlin"));
    QVERIFY(!list[0].interval.has_value());
    QCOMPARE(qs(list[1].message), QString("pay rent"));
    QCOMPARE(qint64(list[1].trigger_time.epochMillis()), qint64(983908800000LL));
    QVERIFY(list[1].interval.has_value());
    QVERIFY(*list[1].interval == std::vector<TimeModifier>{TimeModifier::months(1)});

    const Preferences prefs = preferences.get("u1");
    QCOMPARE(qs(prefs.timezone), QString("Europe/Berlin"));
    QVERIFY(prefs.display_format == TimeFormat::H24);
}

void PersistenceTests::messagesWithQuotesAndNewlines() {
    Reminder tricky;
    tricky.trigger_time = ZonedTime(1000, TimeZone::utc());
    tricky.message = "say \"hi\"\nthen\\leave\t;";

    const std::string json = SnapshotPersistence::encodeReminders({UserReminder{"u\"1", tricky}});
    const auto decoded = SnapshotPersistence::decodeReminders(json);
    QCOMPARE(decoded.size(), size_t(1));
    QCOMPARE(qs(decoded[0].user_id), QString("u\"1"));
    QCOMPARE(qs(decoded[0].reminder.message), qs(tricky.message));
}

void PersistenceTests::malformedSnapshotIsFatal() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    SnapshotPersistence persistence(dir.path().toStdString());
    writeText(persistence.pathFor(SnapshotPersistence::kRemindersFile), "{not json");

    ReminderStore reminders;
    PreferenceStore preferences("America/New_York");
    QVERIFY_EXCEPTION_THROWN(persistence.load(reminders, preferences), SnapshotError);

    QVERIFY_EXCEPTION_THROWN(SnapshotPersistence::decodePreferences("[{\"user\":\"u1\"}"), SnapshotError);
}

void PersistenceTests::incompleteRecordIsFatal() {
    QVERIFY_EXCEPTION_THROWN(
        SnapshotPersistence::decodeReminders("[{\"user\":\"u1\",\"timezone\":\"UTC\",\"message\":\"x\"}]"),
        SnapshotError);
    QVERIFY_EXCEPTION_THROWN(
        SnapshotPersistence::decodeReminders(
            "[{\"user\":\"u1\",\"time_ms\":\"12abc\",\"timezone\":\"UTC\",\"message\":\"x\"}]"),
        SnapshotError);
    QVERIFY_EXCEPTION_THROWN(
        SnapshotPersistence::decodeReminders(
            "[{\"user\":\"u1\",\"time_ms\":\"1\",\"timezone\":\"UTC\",\"message\":\"x\",\"interval\":\"hourly\"}]"),
        SnapshotError);
    QVERIFY_EXCEPTION_THROWN(
        SnapshotPersistence::decodePreferences("[{\"user\":\"u1\",\"timezone\":\"UTC\",\"time_format\":\"36h\"}]"),
        SnapshotError);

    const auto ok = SnapshotPersistence::decodeReminders(
        "[{\"user\":\"u1\",\"time_ms\":\"1\",\"timezone\":\"UTC\",\"message\":\"x\"}]");
    QCOMPARE(ok.size(), size_t(1));
    QVERIFY(SnapshotPersistence::decodeReminders("[]").empty());
}

void PersistenceTests::unknownZoneIsFatal() {
    QVERIFY_EXCEPTION_THROWN(
        SnapshotPersistence::decodeReminders(
            "[{\"user\":\"u1\",\"time_ms\":\"1\",\"timezone\":\"Mars/Base\",\"message\":\"x\"}]"),
        SnapshotError);
}

void PersistenceTests::legacyTimezonesAreMigrated() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    SnapshotPersistence persistence(dir.path().toStdString());
    const std::string legacy_path = persistence.pathFor(SnapshotPersistence::kLegacyTimezonesFile);
    writeText(legacy_path, "{\"u1\": \"Europe/Berlin\", \"u2\": \"Asia/Tokyo\"}");

    ReminderStore reminders;
    PreferenceStore preferences("America/New_York");
    persistence.load(reminders, preferences);

    QCOMPARE(qs(preferences.get("u1").timezone), QString("Europe/Berlin"));
    QCOMPARE(qs(preferences.get("u2").timezone), QString("Asia/Tokyo"));
    QVERIFY(preferences.get("u2").display_format == TimeFormat::H12);

    QVERIFY(!QFile::exists(qs(legacy_path)));
    const std::string saved = readText(persistence.pathFor(SnapshotPersistence::kPreferencesFile));
    QVERIFY(saved.find("Asia/Tokyo") != std::string::npos);

    // A second start finds nothing left to migrate.
    QVERIFY(!persistence.migrateLegacyTimezones(preferences));
}

void PersistenceTests::writerFlushesOnStop() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    SnapshotPersistence persistence(dir.path().toStdString() + "/nested");
    ReminderStore reminders;
    PreferenceStore preferences("America/New_York");

    Reminder reminder;
    reminder.trigger_time = ZonedTime(5000, TimeZone::utc());
    reminder.message = "water plants";
    reminders.add("u1", reminder);

    SnapshotWriter writer(persistence, reminders, preferences);
    writer.start();
    writer.requestSave();
    writer.requestSave();
    writer.stop();

    QVERIFY(writer.completedWrites() >= 1);
    QVERIFY(writer.completedWrites() <= 2);
    const std::string saved = readText(persistence.pathFor(SnapshotPersistence::kRemindersFile));
    QVERIFY(saved.find("water plants") != std::string::npos);
}

QTEST_APPLESS_MAIN(PersistenceTests)
#include "test_persistence.moc"
