/**
 * @file test_data.cpp
 * @brief 데이터 계층 단위 테스트
 *
 * 테스트 대상:
 *   - DataStore: 메모리 DB, 파라미터 바인딩, 트랜잭션 롤백, 구문 캐시, 마이그레이션
 *   - LinkStore: 생성/조회/수정/소프트 삭제, (slug, domain) 중복, 목록 검색
 *   - ClickStore: 일괄 저장 원자성, 링크별/전역 집계, 상위 링크
 *   - 연결 분리: 클릭 배치 저장 중 링크 조회
 */

#include <gtest/gtest.h>

#include "data/click_store.h"
#include "data/data_store.h"
#include "data/link_store.h"
#include "data/schema.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <system_error>
#include <thread>
#include <vector>

using namespace shortline::data;
using shortline::analytics::EnrichedClickRecord;

// ============================================================
// DataStore
// ============================================================

class DataStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<DataStore>();
        ASSERT_TRUE(store_->open(":memory:")) << store_->lastError();
    }

    std::shared_ptr<DataStore> store_;
};

// 1. 실행/조회와 파라미터 바인딩
TEST_F(DataStoreTest, ExecuteAndQueryWithParams) {
    ASSERT_GE(store_->execute("CREATE TABLE kv (k TEXT PRIMARY KEY, v INTEGER)"), 0);
    EXPECT_EQ(store_->execute("INSERT INTO kv (k, v) VALUES (?, ?)", {std::string("a"), int64_t{1}}), 1);
    EXPECT_EQ(store_->execute("INSERT INTO kv (k, v) VALUES (?, ?)", {std::string("b"), int64_t{2}}), 1);

    bool ok = false;
    auto rows = store_->query("SELECT k, v FROM kv WHERE v > ? ORDER BY k", {int64_t{1}}, &ok);
    EXPECT_TRUE(ok);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rowText(rows[0], "k"), "b");
    EXPECT_EQ(rowInt(rows[0], "v"), 2);
}

// 2. 잘못된 SQL은 오류 보고
TEST_F(DataStoreTest, ReportsErrors) {
    EXPECT_EQ(store_->execute("INSERT INTO missing_table VALUES (1)"), -1);
    EXPECT_FALSE(store_->lastError().empty());

    bool ok = true;
    store_->query("SELECT * FROM missing_table", {}, &ok);
    EXPECT_FALSE(ok);
}

// 3. 실패한 트랜잭션은 롤백
TEST_F(DataStoreTest, TransactionRollsBackOnFailure) {
    ASSERT_GE(store_->execute("CREATE TABLE t (v INTEGER)"), 0);

    bool ok = store_->transaction([&]() -> bool {
        store_->execute("INSERT INTO t (v) VALUES (1)");
        return false;
    });
    EXPECT_FALSE(ok);

    auto count = store_->queryScalar("SELECT COUNT(*) FROM t");
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(std::get<int64_t>(*count), 0) << "롤백되어 행이 없어야 합니다";
}

// 4. 같은 SQL은 준비 구문을 재사용
TEST_F(DataStoreTest, ReusesPreparedStatements) {
    ASSERT_GE(store_->execute("CREATE TABLE n (v INTEGER)"), 0);
    size_t before = store_->cachedStatementCount();

    for (int64_t i = 0; i < 5; ++i) {
        EXPECT_EQ(store_->execute("INSERT INTO n (v) VALUES (?)", {i}), 1);
    }
    EXPECT_EQ(store_->cachedStatementCount(), before + 1);

    auto sum = store_->queryScalar("SELECT SUM(v) FROM n");
    ASSERT_TRUE(sum.has_value());
    EXPECT_EQ(std::get<int64_t>(*sum), 10) << "바인딩이 매번 새 값으로 바뀌어야 합니다";

    store_->close();
    EXPECT_EQ(store_->cachedStatementCount(), 0u);
}

// 5. 마이그레이션은 한 번만 적용
TEST_F(DataStoreTest, MigrationsApplyOnce) {
    registerSchemaMigrations(*store_);
    EXPECT_EQ(store_->runMigrations(), 2);
    EXPECT_EQ(store_->currentSchemaVersion(), kSchemaVersionClicks);

    registerSchemaMigrations(*store_);
    EXPECT_EQ(store_->runMigrations(), 0) << "이미 적용된 버전은 건너뜀";
}

// ============================================================
// LinkStore
// ============================================================

class LinkStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = std::make_shared<DataStore>();
        ASSERT_TRUE(db_->open(":memory:"));
        links_ = std::make_unique<LinkStore>(db_);
        ASSERT_TRUE(links_->initialize()) << links_->lastError();
    }

    LinkRecord create(const std::string& domain, const std::string& slug,
                      const std::string& destination = "https://example.com/page") {
        LinkRecord link;
        link.domain = domain;
        link.slug = slug;
        link.destination = destination;
        EXPECT_TRUE(links_->createLink(link)) << links_->lastError();
        return link;
    }

    std::shared_ptr<DataStore> db_;
    std::unique_ptr<LinkStore> links_;
};

// 6. 생성 후 키/ID 조회
TEST_F(LinkStoreTest, CreateAndFind) {
    auto link = create("short.test", "abc123");
    EXPECT_GT(link.id, 0);
    EXPECT_TRUE(link.is_active);
    EXPECT_FALSE(link.created_at.empty()) << "기본 시각이 다시 읽혀야 합니다";

    auto by_key = links_->findByKey("short.test", "abc123");
    ASSERT_TRUE(by_key.found());
    EXPECT_EQ(by_key.link.id, link.id);
    EXPECT_EQ(by_key.link.destination, "https://example.com/page");
    EXPECT_EQ(by_key.link.shortUrl(), "https://short.test/abc123");

    EXPECT_TRUE(links_->findById(link.id).found());
    EXPECT_EQ(links_->findByKey("short.test", "ABC123").status, LookupStatus::NotFound)
        << "slug는 대소문자 구분";
    EXPECT_EQ(links_->findByKey("other.test", "abc123").status, LookupStatus::NotFound);
}

// 7. 같은 도메인의 중복 slug는 거부, 다른 도메인은 허용
TEST_F(LinkStoreTest, SlugUniquePerDomain) {
    create("short.test", "dup");

    LinkRecord clash;
    clash.domain = "short.test";
    clash.slug = "dup";
    clash.destination = "https://example.org/";
    EXPECT_FALSE(links_->createLink(clash));
    EXPECT_NE(links_->lastError().find("UNIQUE"), std::string::npos) << links_->lastError();

    create("other.test", "dup");

    EXPECT_EQ(links_->slugExists("dup", "short.test"), std::optional<bool>(true));
    EXPECT_EQ(links_->slugExists("nope", "short.test"), std::optional<bool>(false));
}

// 8. 수정과 소프트 삭제
TEST_F(LinkStoreTest, UpdateAndSoftDelete) {
    auto link = create("short.test", "old");

    link.slug = "new";
    link.destination = "https://example.com/updated";
    EXPECT_EQ(links_->updateLink(link), 1);
    EXPECT_EQ(links_->findByKey("short.test", "old").status, LookupStatus::NotFound);
    ASSERT_TRUE(links_->findByKey("short.test", "new").found());

    EXPECT_EQ(links_->softDeleteLink(link.id), 1);
    auto deleted = links_->findByKey("short.test", "new");
    ASSERT_TRUE(deleted.found()) << "소프트 삭제는 행을 남김";
    EXPECT_FALSE(deleted.link.is_active);
    EXPECT_EQ(links_->activeLinkCount(), 0);

    EXPECT_EQ(links_->softDeleteLink(9999), 0);

    LinkRecord ghost;
    ghost.id = 9999;
    ghost.slug = "ghost";
    ghost.domain = "short.test";
    ghost.destination = "https://example.com/";
    EXPECT_EQ(links_->updateLink(ghost), 0);
}

// 9. 목록은 최신순
TEST_F(LinkStoreTest, ListNewestFirst) {
    auto a = create("short.test", "a");
    auto b = create("short.test", "b");
    auto c = create("short.test", "c");

    auto all = links_->listLinks();
    EXPECT_EQ(all.total, 3);
    ASSERT_EQ(all.links.size(), 3u);
    EXPECT_EQ(all.links[0].id, c.id);
    EXPECT_EQ(all.links[2].id, a.id);

    auto page = links_->listLinks(1, 1);
    EXPECT_EQ(page.total, 3) << "전체 개수는 페이지 크기와 무관";
    ASSERT_EQ(page.links.size(), 1u);
    EXPECT_EQ(page.links[0].id, b.id);
}

// 10. 목록 검색 (slug, destination, title, tags 부분 일치)
TEST_F(LinkStoreTest, ListSearchesAcrossFields) {
    auto promo = create("short.test", "spring-promo", "https://shop.example.com/sale");
    create("short.test", "docs", "https://docs.example.com/");

    LinkRecord tagged;
    tagged.domain = "other.test";
    tagged.slug = "x1";
    tagged.destination = "https://example.org/";
    tagged.title = "Launch 100% off";
    tagged.tags = "campaign,promo";
    ASSERT_TRUE(links_->createLink(tagged)) << links_->lastError();

    auto result = links_->listLinks(50, 0, "promo");
    EXPECT_EQ(result.total, 2);
    ASSERT_EQ(result.links.size(), 2u);
    EXPECT_EQ(result.links[0].id, tagged.id);
    EXPECT_EQ(result.links[1].id, promo.id);

    EXPECT_EQ(links_->listLinks(50, 0, "SHOP.example").total, 1) << "ASCII 대소문자 무시";
    EXPECT_EQ(links_->listLinks(50, 0, "100%").total, 1) << "%는 문자 그대로 비교";
    EXPECT_EQ(links_->listLinks(50, 0, "_").total, 0) << "_는 와일드카드가 아님";
    EXPECT_EQ(links_->listLinks(50, 0, "nothing-here").links.size(), 0u);
}

// 11. 닫힌 저장소 조회는 StoreError
TEST(LinkStoreErrorTest, ClosedStoreReportsStoreError) {
    auto db = std::make_shared<DataStore>();
    LinkStore links(db);
    EXPECT_FALSE(links.initialize());

    auto result = links.findByKey("short.test", "abc");
    EXPECT_EQ(result.status, LookupStatus::StoreError);
    EXPECT_FALSE(result.error.empty());
}

// ============================================================
// ClickStore
// ============================================================

class ClickStoreTest : public LinkStoreTest {
protected:
    void SetUp() override {
        LinkStoreTest::SetUp();
        clicks_ = std::make_unique<ClickStore>(db_);
        ASSERT_TRUE(clicks_->initialize());
        link_ = create("short.test", "clicks");
    }

    EnrichedClickRecord click(const std::string& country, const std::string& browser,
                              const std::string& referer_domain = "",
                              std::chrono::system_clock::time_point when =
                                  std::chrono::system_clock::now()) {
        EnrichedClickRecord rec;
        rec.link_id = link_.id;
        rec.timestamp = when;
        rec.ip = "198.51.100.1";
        rec.country = country;
        rec.browser = browser;
        rec.referer_domain = referer_domain;
        rec.device_type = "desktop";
        return rec;
    }

    std::unique_ptr<ClickStore> clicks_;
    LinkRecord link_;
};

// 12. 일괄 저장과 집계
TEST_F(ClickStoreTest, BatchInsertAndBreakdowns) {
    auto old = std::chrono::system_clock::now() - std::chrono::hours(24 * 10);
    std::vector<EnrichedClickRecord> batch = {
        click("US", "Chrome", "t.co"),
        click("US", "Firefox", "t.co"),
        click("DE", "Chrome", ""),
        click("", "Chrome", "news.ycombinator.com", old),
    };
    ASSERT_TRUE(clicks_->batchInsert(batch)) << clicks_->lastError();

    EXPECT_EQ(clicks_->clickCount(link_.id), 4);
    EXPECT_EQ(clicks_->clickCountSince(link_.id, 7), 3);
    EXPECT_EQ(clicks_->totalClicks(), 4);

    auto countries = clicks_->topForLink(link_.id, Dimension::Country);
    ASSERT_EQ(countries.size(), 2u) << "빈 값은 집계에서 제외";
    EXPECT_EQ(countries[0].value, "US");
    EXPECT_EQ(countries[0].count, 2);
    EXPECT_EQ(countries[1].value, "DE");

    auto browsers = clicks_->topGlobal(Dimension::Browser, 1);
    ASSERT_EQ(browsers.size(), 1u);
    EXPECT_EQ(browsers[0].value, "Chrome");
    EXPECT_EQ(browsers[0].count, 3);

    auto referers = clicks_->topForLink(link_.id, Dimension::RefererDomain);
    ASSERT_EQ(referers.size(), 2u);
    EXPECT_EQ(referers[0].value, "t.co");
}

// 13. 존재하지 않는 링크가 섞인 배치는 전부 실패
TEST_F(ClickStoreTest, BatchIsAllOrNothing) {
    auto good = click("US", "Chrome");
    auto bad = click("US", "Chrome");
    bad.link_id = 424242;

    EXPECT_FALSE(clicks_->batchInsert({good, bad}));
    EXPECT_FALSE(clicks_->lastError().empty());
    EXPECT_EQ(clicks_->totalClicks(), 0) << "부분 저장이 남지 않아야 합니다";

    EXPECT_TRUE(clicks_->batchInsert({}));
}

// 14. 여러 링크 클릭 수를 한 번에 집계
TEST_F(ClickStoreTest, ClickCountsForManyLinks) {
    auto second = create("short.test", "second");
    auto silent = create("short.test", "silent");

    auto extra = click("US", "Chrome");
    extra.link_id = second.id;
    ASSERT_TRUE(clicks_->batchInsert({click("US", "Chrome"), click("DE", "Firefox"), extra}));

    auto counts = clicks_->clickCountsForLinks({link_.id, second.id, silent.id, 9999});
    EXPECT_EQ(counts.size(), 2u) << "클릭이 없는 링크는 결과에 없음";
    EXPECT_EQ(counts[link_.id], 2);
    EXPECT_EQ(counts[second.id], 1);
    EXPECT_EQ(counts.count(silent.id), 0u);

    EXPECT_TRUE(clicks_->clickCountsForLinks({}).empty());

    std::vector<int64_t> many(1200, second.id);
    many.push_back(link_.id);
    auto chunked = clicks_->clickCountsForLinks(many);
    EXPECT_EQ(chunked[link_.id], 2) << "IN 목록을 나눠도 결과는 같음";
    EXPECT_EQ(chunked[second.id], 1);
}

// 15. 클릭 수 상위 링크 (비활성 제외)
TEST_F(ClickStoreTest, TopLinksExcludesInactive) {
    auto popular = create("short.test", "popular");
    auto retired = create("short.test", "retired");

    auto on = [&](const LinkRecord& link) {
        auto rec = click("US", "Chrome");
        rec.link_id = link.id;
        return rec;
    };
    ASSERT_TRUE(clicks_->batchInsert({on(popular), on(popular), on(popular),
                                      on(link_), on(retired), on(retired),
                                      on(retired), on(retired)}));
    ASSERT_EQ(links_->softDeleteLink(retired.id), 1);

    auto top = clicks_->topLinks(5);
    ASSERT_EQ(top.size(), 2u) << "비활성 링크는 제외";
    EXPECT_EQ(top[0].link.id, popular.id);
    EXPECT_EQ(top[0].clicks, 3);
    EXPECT_EQ(top[0].link.slug, "popular");
    EXPECT_EQ(top[1].link.id, link_.id);
    EXPECT_EQ(top[1].clicks, 1);

    auto first = clicks_->topLinks(1);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].link.id, popular.id);
}

// ============================================================
// 연결 분리
// ============================================================

// 16. 클릭 배치 저장 중에도 별도 연결의 링크 조회는 기다리지 않음
TEST(SplitConnectionTest, LookupDoesNotWaitForClickFlush) {
    namespace fs = std::filesystem;
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const std::string path =
        (fs::temp_directory_path() / ("shortline-split-" + std::to_string(stamp) + ".db")).string();
    auto cleanup = [&path] {
        std::error_code ec;
        for (const char* suffix : {"", "-wal", "-shm"}) {
            fs::remove(path + suffix, ec);
        }
    };
    cleanup();

    {
        auto link_db = std::make_shared<DataStore>();
        ASSERT_TRUE(link_db->open(path)) << link_db->lastError();
        LinkStore links(link_db);
        ASSERT_TRUE(links.initialize()) << links.lastError();

        auto click_db = std::make_shared<DataStore>();
        ASSERT_TRUE(click_db->open(path)) << click_db->lastError();
        ClickStore clicks(click_db);
        ASSERT_TRUE(clicks.initialize()) << clicks.lastError();

        LinkRecord link;
        link.domain = "short.test";
        link.slug = "hot";
        link.destination = "https://example.com/hot";
        ASSERT_TRUE(links.createLink(link)) << links.lastError();

        EnrichedClickRecord rec;
        rec.link_id = link.id;
        rec.timestamp = std::chrono::system_clock::now();
        rec.ip = "198.51.100.1";
        rec.browser = "Chrome";
        std::vector<EnrichedClickRecord> batch(100000, rec);

        std::atomic<bool> started{false};
        std::atomic<bool> flushing{true};
        std::thread writer([&] {
            started = true;
            EXPECT_TRUE(clicks.batchInsert(batch)) << clicks.lastError();
            flushing = false;
        });
        while (!started.load()) std::this_thread::yield();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));

        auto before = std::chrono::steady_clock::now();
        auto found = links.findByKey("short.test", "hot");
        auto elapsed = std::chrono::steady_clock::now() - before;
        const bool overlapped = flushing.load();
        writer.join();

        EXPECT_TRUE(found.found()) << found.error;
        EXPECT_LT(elapsed, std::chrono::milliseconds(200))
            << "조회가 클릭 트랜잭션 종료를 기다리면 안 됩니다";
        EXPECT_TRUE(overlapped) << "조회는 배치 저장이 끝나기 전에 반환되어야 합니다";
        EXPECT_EQ(clicks.clickCount(link.id), 100000);
    }

    cleanup();
}

// 17. 시각 형식 (UTC)
TEST(ClickTimestampTest, FormatsUtc) {
    std::chrono::system_clock::time_point epoch{};
    EXPECT_EQ(formatTimestamp(epoch), "1970-01-01 00:00:00");
    EXPECT_EQ(formatTimestamp(epoch + std::chrono::seconds(86400 + 3661)), "1970-01-02 01:01:01");
}
