#include "server/event_server.hpp"

#include <QtTest/QtTest>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <utility>

using namespace tickler;

namespace {

QString qs(const std::string& value) {
    return QString::fromStdString(value);
}

class RecordingPlatform : public ChatPlatform {
public:
    bool sendDirectMessage(const std::string& user_id, const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        direct.emplace_back(user_id, text);
        return true;
    }

    bool replyInChannel(const std::string& channel_id, const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        channel.emplace_back(channel_id, text);
        return true;
    }

    std::vector<std::pair<std::string, std::string>> direct;
    std::vector<std::pair<std::string, std::string>> channel;

private:
    std::mutex mutex_;
};

http::request<http::string_body> makeRequest(http::verb method, const std::string& target,
                                             const std::string& body = "") {
    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::content_type, "application/json");
    req.body() = body;
    req.prepare_payload();
    return req;
}

} // namespace

class EventServerTests : public QObject {
    Q_OBJECT

private slots:
    void healthCheck();
    void commandIsAnsweredInChannel();
    void botsAndChatterAreIgnored();
    void badRequestsAreRejected();
    void signatureIsEnforcedWhenConfigured();
    void signatureMatchesKnownVector();
};

void EventServerTests::healthCheck() {
    ReminderStore reminders;
    PreferenceStore preferences("America/New_York");
    CommandHandler handler(reminders, preferences);
    RecordingPlatform platform;
    EventServer server("127.0.0.1", 0, handler, platform);

    const auto res = server.handleRequest(makeRequest(http::verb::get, "/health"));
    QVERIFY(res.result() == http::status::ok);
    QVERIFY(qs(res.body()).contains("\"success\":true"));
}

void EventServerTests::commandIsAnsweredInChannel() {
    ReminderStore reminders;
    PreferenceStore preferences("America/New_York");
    CommandHandler handler(reminders, preferences);
    RecordingPlatform platform;
    EventServer server("127.0.0.1", 0, handler, platform);

    const std::string body =
        "{\"author_id\":\"42\",\"channel_id\":\"c7\",\"content\":\"$r 2001-03-06 3pm; pay rent\"}";
    const auto res = server.handleRequest(makeRequest(http::verb::post, "/events", body));
    QVERIFY(res.result() == http::status::ok);

    const QString expected("Scheduled reminder for Tuesday, March 06, 2001 at 3:00pm EST (#0)");
    QVERIFY(qs(res.body()).contains(expected));
    QCOMPARE(platform.channel.size(), size_t(1));
    QCOMPARE(qs(platform.channel[0].first), QString("c7"));
    QCOMPARE(qs(platform.channel[0].second), expected);
    QCOMPARE(reminders.list("42").size(), size_t(1));
}

void EventServerTests::botsAndChatterAreIgnored() {
    ReminderStore reminders;
    PreferenceStore preferences("America/New_York");
    CommandHandler handler(reminders, preferences);
    RecordingPlatform platform;
    EventServer server("127.0.0.1", 0, handler, platform);

    auto res = server.handleRequest(makeRequest(http::verb::post, "/events",
        "{\"author_id\":\"1\",\"channel_id\":\"c\",\"content\":\"$rs\",\"author_is_bot\":true}"));
    QVERIFY(res.result() == http::status::ok);

    res = server.handleRequest(makeRequest(http::verb::post, "/events",
        "{\"author_id\":\"1\",\"channel_id\":\"c\",\"content\":\"good morning\"}"));
    QVERIFY(res.result() == http::status::ok);

    QVERIFY(platform.channel.empty());
}

void EventServerTests::badRequestsAreRejected() {
    ReminderStore reminders;
    PreferenceStore preferences("America/New_York");
    CommandHandler handler(reminders, preferences);
    RecordingPlatform platform;
    EventServer server("127.0.0.1", 0, handler, platform);

    auto res = server.handleRequest(makeRequest(http::verb::post, "/events",
        "{\"author_id\":\"1\",\"content\":\"$rs\"}"));
    QVERIFY(res.result() == http::status::bad_request);
    QVERIFY(qs(res.body()).contains("\"success\":false"));

    res = server.handleRequest(makeRequest(http::verb::post, "/events",
        "{\"author_id\":\"1\",\"channel_id\":\"c\",\"content\":\"$rs\",\"member\":{\"author_id\":\"2\"}}"));
    QVERIFY(res.result() == http::status::bad_request);

    res = server.handleRequest(makeRequest(http::verb::post, "/events", "not json"));
    QVERIFY(res.result() == http::status::bad_request);

    res = server.handleRequest(makeRequest(http::verb::get, "/events"));
    QVERIFY(res.result() == http::status::method_not_allowed);

    res = server.handleRequest(makeRequest(http::verb::get, "/admin"));
    QVERIFY(res.result() == http::status::not_found);
    QVERIFY(platform.channel.empty());
}

void EventServerTests::signatureIsEnforcedWhenConfigured() {
    ReminderStore reminders;
    PreferenceStore preferences("America/New_York");
    CommandHandler handler(reminders, preferences);
    RecordingPlatform platform;
    EventServer server("127.0.0.1", 0, handler, platform, "s3cret");

    const std::string body = "{\"author_id\":\"1\",\"channel_id\":\"c\",\"content\":\"$rs\"}";

    auto unsigned_req = makeRequest(http::verb::post, "/events", body);
    QVERIFY(server.handleRequest(unsigned_req).result() == http::status::unauthorized);

    auto forged = makeRequest(http::verb::post, "/events", body);
    forged.set(EventServer::kSignatureHeader, EventServer::signBody("wrong", body));
    QVERIFY(server.handleRequest(forged).result() == http::status::unauthorized);
    QVERIFY(platform.channel.empty());

    auto signed_req = makeRequest(http::verb::post, "/events", body);
    std::string signature = EventServer::signBody("s3cret", body);
    std::transform(signature.begin(), signature.end(), signature.begin(), ::toupper);
    signed_req.set(EventServer::kSignatureHeader, signature);
    const auto res = server.handleRequest(signed_req);
    QVERIFY(res.result() == http::status::ok);
    QCOMPARE(platform.channel.size(), size_t(1));
    QCOMPARE(qs(platform.channel[0].second), QString("No reminders"));
}

void EventServerTests::signatureMatchesKnownVector() {
    QCOMPARE(qs(EventServer::signBody("key", "The quick brown fox jumps over the lazy dog")),
             QString("f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8"));
}

QTEST_APPLESS_MAIN(EventServerTests)
#include "test_event_server.moc"
