#pragma once

/**
 * @file slug_generator.h
 * @brief 무작위 Base62 slug 생성
 */

#include <optional>
#include <string>
#include <cstddef>

namespace shortline::redirect {

/// 기본 slug 길이
constexpr size_t kDefaultSlugLength = 6;

/**
 * @brief 암호학적 난수(OpenSSL RAND_bytes)로 Base62 slug 생성
 * @return 난수 생성 실패 시 std::nullopt
 */
std::optional<std::string> generateSlug(size_t length = kDefaultSlugLength);

} // namespace shortline::redirect
