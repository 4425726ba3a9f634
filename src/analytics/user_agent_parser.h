#pragma once

/**
 * @file user_agent_parser.h
 * @brief User-Agent 문자열 파서
 *
 * 브라우저 이름/버전, 운영체제, 모바일 여부, 봇 여부를 추출합니다.
 * 모든 입력에 대해 결과를 반환하며 알 수 없는 필드는 빈 문자열입니다.
 */

#include <string>

namespace shortline::analytics {

/**
 * @brief UA 파싱 결과
 */
struct UserAgentInfo {
    std::string browser;            ///< "Chrome", "Firefox", "Googlebot" ...
    std::string browser_version;    ///< "120.0.0.0"
    std::string os;                 ///< "Windows 10", "Android 14", "iOS 17.1" ...
    bool mobile{false};
    bool bot{false};
};

/**
 * @brief User-Agent 파서 (상태 없음)
 */
class UserAgentParser {
public:
    static UserAgentInfo parse(const std::string& user_agent);

private:
    static void detectBrowser(const std::string& ua, UserAgentInfo& info);
    static void detectOs(const std::string& ua, UserAgentInfo& info);
    static void detectBotProduct(const std::string& ua, UserAgentInfo& info);
};

} // namespace shortline::analytics
