/**
 * @file slug_generator.cpp
 * @brief 무작위 Base62 slug 생성 구현
 */

#include "slug_generator.h"

#include <openssl/rand.h>

#include <cstdint>
#include <vector>

namespace shortline::redirect {

namespace {

constexpr char kCharset[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
constexpr size_t kCharsetSize = sizeof(kCharset) - 1;

// 62의 배수 미만 바이트만 사용 (모듈로 편향 제거)
constexpr uint8_t kRejectThreshold = static_cast<uint8_t>(256 - (256 % kCharsetSize));

} // namespace

std::optional<std::string> generateSlug(size_t length) {
    std::string slug;
    slug.reserve(length);

    std::vector<uint8_t> rand_bytes(length * 2);
    while (slug.size() < length) {
        if (RAND_bytes(rand_bytes.data(), static_cast<int>(rand_bytes.size())) != 1) {
            return std::nullopt;
        }
        for (uint8_t b : rand_bytes) {
            if (b >= kRejectThreshold) continue;
            slug.push_back(kCharset[b % kCharsetSize]);
            if (slug.size() == length) break;
        }
    }
    return slug;
}

} // namespace shortline::redirect
