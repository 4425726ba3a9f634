/**
 * @file test_cache.cpp
 * @brief 리다이렉트 캐시 단위 테스트
 *
 * 테스트 대상:
 *   - RedirectCache: 용량 제한, LRU 제거 순서, get의 최근 사용 갱신,
 *     set 교체, 무효화, 도메인 대소문자 정규화, 동시 접근
 */

#include <gtest/gtest.h>

#include "cache/redirect_cache.h"

#include <thread>
#include <vector>

using namespace shortline::cache;
using shortline::data::LinkRecord;

namespace {

LinkRecord makeLink(int64_t id, const std::string& domain, const std::string& slug,
                    const std::string& destination = "https://example.com/") {
    LinkRecord link;
    link.id = id;
    link.domain = domain;
    link.slug = slug;
    link.destination = destination;
    return link;
}

} // namespace

class RedirectCacheTest : public ::testing::Test {
protected:
    RedirectCache cache_{2};
};

// 1. 용량 2에서 a, b, c 삽입 → a 제거
TEST_F(RedirectCacheTest, EvictsLeastRecentlyUsed) {
    cache_.set("d", "a", makeLink(1, "d", "a"));
    cache_.set("d", "b", makeLink(2, "d", "b"));
    cache_.set("d", "c", makeLink(3, "d", "c"));

    EXPECT_EQ(cache_.size(), 2u) << "크기는 용량을 넘지 않아야 합니다";
    EXPECT_FALSE(cache_.get("d", "a").has_value()) << "가장 오래된 a가 제거되어야 합니다";
    EXPECT_TRUE(cache_.get("d", "b").has_value());
    EXPECT_TRUE(cache_.get("d", "c").has_value());
}

// 2. get은 사용으로 간주되어 제거 순서를 바꿈
TEST_F(RedirectCacheTest, GetRefreshesRecency) {
    cache_.set("d", "a", makeLink(1, "d", "a"));
    cache_.set("d", "b", makeLink(2, "d", "b"));

    ASSERT_TRUE(cache_.get("d", "a").has_value());
    cache_.set("d", "c", makeLink(3, "d", "c"));

    EXPECT_TRUE(cache_.get("d", "a").has_value()) << "최근 조회한 a는 남아야 합니다";
    EXPECT_FALSE(cache_.get("d", "b").has_value()) << "b가 제거되어야 합니다";
}

// 3. 기존 키에 set → 값 교체 + 최근 사용 갱신
TEST_F(RedirectCacheTest, SetReplacesExistingEntry) {
    cache_.set("d", "a", makeLink(1, "d", "a", "https://old.example/"));
    cache_.set("d", "b", makeLink(2, "d", "b"));
    cache_.set("d", "a", makeLink(1, "d", "a", "https://new.example/"));

    EXPECT_EQ(cache_.size(), 2u);
    auto hit = cache_.get("d", "a");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->destination, "https://new.example/");

    cache_.set("d", "c", makeLink(3, "d", "c"));
    EXPECT_FALSE(cache_.get("d", "b").has_value()) << "교체로 a가 최근 사용이 되어 b가 제거되어야 합니다";
}

// 4. set → invalidate → get 미스
TEST_F(RedirectCacheTest, InvalidateRemovesEntry) {
    cache_.set("d", "a", makeLink(1, "d", "a"));
    cache_.invalidate("d", "a");

    EXPECT_FALSE(cache_.get("d", "a").has_value());
    EXPECT_EQ(cache_.size(), 0u);

    // 없는 키 무효화는 무시
    cache_.invalidate("d", "missing");
    EXPECT_EQ(cache_.size(), 0u);
}

// 5. 도메인은 대소문자 무시, slug는 구분
TEST_F(RedirectCacheTest, DomainCaseInsensitiveSlugCaseSensitive) {
    cache_.set("Short.EXAMPLE", "AbC", makeLink(1, "short.example", "AbC"));

    EXPECT_TRUE(cache_.get("short.example", "AbC").has_value());
    EXPECT_FALSE(cache_.get("short.example", "abc").has_value())
        << "slug는 대소문자를 구분해야 합니다";

    cache_.invalidate("SHORT.example", "AbC");
    EXPECT_FALSE(cache_.get("short.example", "AbC").has_value());
}

// 6. 같은 slug라도 도메인이 다르면 별개 항목
TEST_F(RedirectCacheTest, SameSlugDifferentDomains) {
    cache_.set("one.example", "x", makeLink(1, "one.example", "x", "https://one/"));
    cache_.set("two.example", "x", makeLink(2, "two.example", "x", "https://two/"));

    EXPECT_EQ(cache_.get("one.example", "x")->destination, "https://one/");
    EXPECT_EQ(cache_.get("two.example", "x")->destination, "https://two/");
}

// 7. 용량 0은 1로 보정
TEST(RedirectCacheCapacityTest, ZeroCapacityClampedToOne) {
    RedirectCache cache(0);
    EXPECT_EQ(cache.capacity(), 1u);

    cache.set("d", "a", makeLink(1, "d", "a"));
    cache.set("d", "b", makeLink(2, "d", "b"));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(cache.get("d", "b").has_value());
}

// 8. 여러 스레드에서 동시 get/set/invalidate
TEST(RedirectCacheConcurrencyTest, ConcurrentAccessKeepsBound) {
    RedirectCache cache(64);
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 1000; ++i) {
                std::string slug = "s" + std::to_string((i * 7 + t) % 200);
                cache.set("d", slug, makeLink(i, "d", slug));
                (void)cache.get("d", slug);
                if (i % 10 == 0) cache.invalidate("d", slug);
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_LE(cache.size(), 64u) << "동시 접근 후에도 용량 제한이 유지되어야 합니다";
}
