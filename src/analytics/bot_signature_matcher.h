#pragma once

/**
 * @file bot_signature_matcher.h
 * @brief User-Agent 기반 봇/자동화 트래픽 판별
 *
 * UserAgentParser의 봇 플래그를 먼저 확인하고, 이어서 고정된 시그니처
 * 목록을 대소문자 무시 부분 문자열로 검색합니다. 상태와 I/O가 없습니다.
 */

#include <string>
#include <vector>

namespace shortline::analytics {

class BotSignatureMatcher {
public:
    /**
     * @brief 봇 여부 판별
     * @param user_agent 원본 User-Agent (빈 문자열은 봇 아님)
     */
    static bool isBot(const std::string& user_agent);

    /**
     * @brief 시그니처 목록 (소문자, 감사용)
     */
    static const std::vector<std::string>& signatures();
};

} // namespace shortline::analytics
