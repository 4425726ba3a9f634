/**
 * @file test_analytics.cpp
 * @brief 클릭 분석 단위 테스트
 *
 * 테스트 대상:
 *   - UserAgentParser: 브라우저/OS/모바일/봇 판별
 *   - BotSignatureMatcher: 크롤러, HTTP 클라이언트, 빈 UA
 *   - AnalyticsCollector: Referer 호스트, 보강, 버퍼 한도, 종료 시 플러시,
 *     주기 플러시, 봇/위협 IP 필터, 저장 실패 처리
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "analytics/analytics_collector.h"
#include "analytics/bot_signature_matcher.h"
#include "analytics/user_agent_parser.h"
#include "geo/geo_resolver.h"
#include "threat/threat_checker.h"

#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace shortline::analytics;
using ::testing::_;
using ::testing::Return;

namespace {

constexpr const char* kChromeWindows =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";
constexpr const char* kSafariIphone =
    "Mozilla/5.0 (iPhone; CPU iPhone OS 17_1 like Mac OS X) AppleWebKit/605.1.15 "
    "(KHTML, like Gecko) Version/17.1 Mobile/15E148 Safari/604.1";
constexpr const char* kGooglebot =
    "Mozilla/5.0 (compatible; Googlebot/2.1; +http://www.google.com/bot.html)";

/**
 * @brief 받은 레코드를 기록하는 가짜 저장소
 */
class RecordingSink : public ClickSink {
public:
    bool batchInsert(const std::vector<EnrichedClickRecord>& records) override {
        std::lock_guard lock(mutex_);
        batches_++;
        records_.insert(records_.end(), records.begin(), records.end());
        return true;
    }

    std::string lastError() const override { return {}; }

    std::vector<EnrichedClickRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    int batches() const {
        std::lock_guard lock(mutex_);
        return batches_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<EnrichedClickRecord> records_;
    int batches_{0};
};

class MockSink : public ClickSink {
public:
    MOCK_METHOD(bool, batchInsert, (const std::vector<EnrichedClickRecord>&), (override));
    MOCK_METHOD(std::string, lastError, (), (const, override));
};

RawClickEvent makeClick(int64_t link_id, const std::string& ua,
                        const std::string& ip = "198.51.100.20",
                        const std::string& referer = "") {
    RawClickEvent event;
    event.link_id = link_id;
    event.timestamp = std::chrono::system_clock::now();
    event.ip = ip;
    event.user_agent = ua;
    event.referer = referer;
    return event;
}

CollectorConfig quietConfig(size_t buffer_size = 100) {
    CollectorConfig config;
    config.buffer_size = buffer_size;
    config.flush_interval = std::chrono::hours(1);
    return config;
}

} // namespace

// ============================================================
// UserAgentParser / BotSignatureMatcher
// ============================================================

// 1. 데스크톱 Chrome
TEST(UserAgentParserTest, ParsesDesktopChrome) {
    auto info = UserAgentParser::parse(kChromeWindows);
    EXPECT_EQ(info.browser, "Chrome");
    EXPECT_EQ(info.browser_version, "120.0.0.0");
    EXPECT_EQ(info.os, "Windows 10");
    EXPECT_FALSE(info.mobile);
    EXPECT_FALSE(info.bot);
}

// 2. iPhone Safari는 모바일
TEST(UserAgentParserTest, ParsesMobileSafari) {
    auto info = UserAgentParser::parse(kSafariIphone);
    EXPECT_EQ(info.browser, "Safari");
    EXPECT_EQ(info.browser_version, "17.1");
    EXPECT_EQ(info.os, "iOS 17.1");
    EXPECT_TRUE(info.mobile);
}

// 3. Googlebot 제품 토큰
TEST(UserAgentParserTest, ParsesCrawlerProduct) {
    auto info = UserAgentParser::parse(kGooglebot);
    EXPECT_TRUE(info.bot);
    EXPECT_EQ(info.browser, "Googlebot");
    EXPECT_EQ(info.browser_version, "2.1");
}

// 4. 봇 판별
TEST(BotSignatureMatcherTest, DetectsAutomatedAgents) {
    EXPECT_TRUE(BotSignatureMatcher::isBot(kGooglebot));
    EXPECT_TRUE(BotSignatureMatcher::isBot("curl/8.4.0"));
    EXPECT_TRUE(BotSignatureMatcher::isBot("python-requests/2.31.0"));
    EXPECT_TRUE(BotSignatureMatcher::isBot("facebookexternalhit/1.1"));
    EXPECT_TRUE(BotSignatureMatcher::isBot(
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 HeadlessChrome/120.0.0.0"));

    EXPECT_FALSE(BotSignatureMatcher::isBot(kChromeWindows));
    EXPECT_FALSE(BotSignatureMatcher::isBot(kSafariIphone));
    EXPECT_FALSE(BotSignatureMatcher::isBot("")) << "빈 UA는 봇으로 보지 않음";
}

// ============================================================
// 보강
// ============================================================

// 5. Referer 호스트명
TEST(AnalyticsEnrichTest, RefererHostname) {
    EXPECT_EQ(AnalyticsCollector::refererHostname("https://news.ycombinator.com/item?id=1"),
              "news.ycombinator.com");
    EXPECT_EQ(AnalyticsCollector::refererHostname("http://User@Example.COM:8080/x"), "example.com");
    EXPECT_EQ(AnalyticsCollector::refererHostname("https://[2001:db8::1]:443/"), "2001:db8::1");
    EXPECT_EQ(AnalyticsCollector::refererHostname("//cdn.example.org/a"), "cdn.example.org");
    EXPECT_EQ(AnalyticsCollector::refererHostname(""), "");
    EXPECT_EQ(AnalyticsCollector::refererHostname("not a url"), "");
}

// 6. 장치 유형 우선순위와 지리 정보 없음
TEST(AnalyticsEnrichTest, DeviceTypeAndMissingGeo) {
    auto desktop = AnalyticsCollector::enrich(
        makeClick(1, kChromeWindows, "198.51.100.20", "https://t.co/abc"), nullptr);
    EXPECT_EQ(desktop.device_type, "desktop");
    EXPECT_EQ(desktop.referer_domain, "t.co");
    EXPECT_EQ(desktop.browser, "Chrome");
    EXPECT_EQ(desktop.country, "") << "지리 조회기가 없으면 빈 값";
    EXPECT_DOUBLE_EQ(desktop.latitude, 0.0);

    EXPECT_EQ(AnalyticsCollector::enrich(makeClick(1, kSafariIphone), nullptr).device_type, "mobile");

    const std::string mobile_bot =
        "Mozilla/5.0 (Linux; Android 6.0.1; Nexus 5X) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/120.0 Mobile Safari/537.36 (compatible; Googlebot/2.1; +http://www.google.com/bot.html)";
    EXPECT_EQ(AnalyticsCollector::enrich(makeClick(1, mobile_bot), nullptr).device_type, "bot")
        << "봇 판정이 모바일보다 우선";

    shortline::geo::GeoResolver disabled;
    auto with_disabled_geo = AnalyticsCollector::enrich(makeClick(1, kChromeWindows), &disabled);
    EXPECT_EQ(with_disabled_geo.country, "");
    EXPECT_EQ(with_disabled_geo.city, "");
}

// ============================================================
// AnalyticsCollector
// ============================================================

// 7. 종료 시 남은 이벤트 모두 저장
TEST(AnalyticsCollectorTest, ShutdownFlushesEverything) {
    auto sink = std::make_shared<RecordingSink>();
    AnalyticsCollector collector(sink, nullptr, nullptr, quietConfig());

    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(collector.push(makeClick(7, kChromeWindows)));
    }
    EXPECT_EQ(collector.pending(), 10u);

    collector.shutdown();

    EXPECT_EQ(sink->records().size(), 10u);
    EXPECT_EQ(sink->batches(), 1) << "한 번의 일괄 저장이어야 합니다";
    EXPECT_EQ(collector.stats().persisted, 10u);
    EXPECT_EQ(collector.pending(), 0u);
}

// 8. 버퍼가 가득 차면 버림
TEST(AnalyticsCollectorTest, FullBufferDropsEvents) {
    auto sink = std::make_shared<RecordingSink>();
    AnalyticsCollector collector(sink, nullptr, nullptr, quietConfig(1));

    EXPECT_TRUE(collector.push(makeClick(1, kChromeWindows)));
    for (int64_t id = 2; id <= 5; ++id) {
        EXPECT_FALSE(collector.push(makeClick(id, kChromeWindows))) << "용량 1 초과분은 버려져야 합니다";
    }

    collector.shutdown();

    auto records = sink->records();
    ASSERT_EQ(records.size(), 1u) << "5건 중 최대 1건만 저장";
    EXPECT_EQ(records[0].link_id, 1);
    EXPECT_EQ(collector.stats().pushed, 1u);
    EXPECT_EQ(collector.stats().dropped, 4u);
}

// 9. 주기 플러시는 종료 없이 저장
TEST(AnalyticsCollectorTest, PeriodicFlushPersistsWithoutShutdown) {
    auto sink = std::make_shared<RecordingSink>();
    CollectorConfig config;
    config.flush_interval = std::chrono::milliseconds(50);
    AnalyticsCollector collector(sink, nullptr, nullptr, config);

    collector.push(makeClick(3, kChromeWindows));

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (sink->records().empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(sink->records().size(), 1u) << "주기 플러시로 저장되어야 합니다";

    collector.shutdown();
    EXPECT_EQ(sink->records().size(), 1u);
}

// 10. 봇과 위협 IP는 저장 전에 제외
TEST(AnalyticsCollectorTest, FiltersBotsAndBlockedIps) {
    shortline::threat::ThreatCheckerConfig threat_config;
    threat_config.sources = {
        {"static", "", shortline::threat::FeedFormat::CidrLines, {"10.0.0.0/8"}}};
    auto threat = std::make_shared<shortline::threat::ThreatChecker>(threat_config);
    threat->refreshNow();

    auto sink = std::make_shared<RecordingSink>();
    AnalyticsCollector collector(sink, nullptr, threat, quietConfig());

    collector.push(makeClick(1, kChromeWindows, "198.51.100.20"));
    collector.push(makeClick(2, kGooglebot, "198.51.100.21"));
    collector.push(makeClick(3, kChromeWindows, "10.4.4.4"));
    collector.push(makeClick(4, "curl/8.4.0", "198.51.100.22"));
    collector.shutdown();

    auto records = sink->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].link_id, 1);
    EXPECT_EQ(collector.stats().filtered, 3u);
}

// 11. 필터를 끄면 봇도 저장
TEST(AnalyticsCollectorTest, FilterDisabledRecordsBots) {
    auto sink = std::make_shared<RecordingSink>();
    auto config = quietConfig();
    config.filter_automated_traffic = false;
    AnalyticsCollector collector(sink, nullptr, nullptr, config);

    collector.push(makeClick(1, kGooglebot));
    collector.shutdown();

    auto records = sink->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].device_type, "bot");
    EXPECT_EQ(collector.stats().filtered, 0u);
}

// 12. 저장 실패는 배치를 버리고 계속 동작
TEST(AnalyticsCollectorTest, SinkFailureIsCountedNotRetried) {
    auto sink = std::make_shared<MockSink>();
    EXPECT_CALL(*sink, batchInsert(_)).Times(1).WillOnce(Return(false));
    EXPECT_CALL(*sink, lastError()).WillRepeatedly(Return("database is locked"));

    AnalyticsCollector collector(sink, nullptr, nullptr, quietConfig());
    collector.push(makeClick(1, kChromeWindows));
    collector.push(makeClick(2, kChromeWindows));
    collector.shutdown();

    auto s = collector.stats();
    EXPECT_EQ(s.failed_batches, 1u);
    EXPECT_EQ(s.persisted, 0u);
}

// 13. 종료 후 push는 버려지고 shutdown은 중복 호출 안전
TEST(AnalyticsCollectorTest, PushAfterShutdownIsDropped) {
    auto sink = std::make_shared<RecordingSink>();
    AnalyticsCollector collector(sink, nullptr, nullptr, quietConfig());
    collector.shutdown();

    EXPECT_FALSE(collector.push(makeClick(1, kChromeWindows)));
    collector.shutdown();

    EXPECT_TRUE(sink->records().empty());
    EXPECT_EQ(sink->batches(), 0) << "빈 버퍼는 저장소를 호출하지 않음";
    EXPECT_EQ(collector.stats().dropped, 1u);
}
