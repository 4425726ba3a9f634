/**
 * @file bot_signature_matcher.cpp
 * @brief 봇 시그니처 목록 및 판별 구현
 */

#include "bot_signature_matcher.h"
#include "user_agent_parser.h"

#include <algorithm>
#include <cctype>

namespace shortline::analytics {

const std::vector<std::string>& BotSignatureMatcher::signatures() {
    static const std::vector<std::string> kSignatures = {
        // 일반 패턴
        "bot",
        "spider",
        "crawl",

        // 링크 미리보기
        "facebookexternalhit",
        "facebot",
        "whatsapp",
        "slackbot",
        "telegrambot",
        "applebot",
        "twitterbot",
        "linkedinbot",
        "preview",

        // Google 도구
        "google web preview",
        "google favicon",
        "google-ad",
        "google-site-verification",
        "googlesecurityscanner",
        "google_analytics_snippet_validator",
        "chrome-lighthouse",

        // 보안 스캐너
        "burpcollaborator.net/",
        "zgrab/",
        "netcraftsurveyagent/",
        "netcraft web server survey",

        // HTTP 클라이언트 라이브러리
        "go-http-client/",
        "curl/",
        "wget/",
        "python-requests/",
        "python-urllib/",
        "pycurl/",
        "java/",
        "libwww-perl/",
        "okhttp/",
        "ruby",

        // 헤드리스 렌더러
        "headlesschrome/",
        "dumprendertree/",
        "phantomjs",
        "slimerjs",
        "wkhtmltoimage",
        "wkhtmltopdf",

        // 기타
        "admantx",
        "alexatoolbar/",
        "bingpreview/",
        "dataprovider.com",
        "faraday v",
        "gigablastopensource/",
        "owler/",
        "pageanalyzer/",
        "panscient.com",
        "ruxitrecorder/",
        "ruxitsynthetic/",
        "synapse",
        "tracemyfile/",
        "trendsmapresolver/",
        "ubermetrics-technologies.com",
        "wappalyzer",
        "whatweb/",
        "wininet",
        "wordpress.com",
        "wsr-agent/",
    };
    return kSignatures;
}

bool BotSignatureMatcher::isBot(const std::string& user_agent) {
    if (user_agent.empty()) return false;

    if (UserAgentParser::parse(user_agent).bot) return true;

    std::string lower = user_agent;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& sigs = signatures();
    return std::any_of(sigs.begin(), sigs.end(), [&](const std::string& sig) {
        return lower.find(sig) != std::string::npos;
    });
}

} // namespace shortline::analytics
