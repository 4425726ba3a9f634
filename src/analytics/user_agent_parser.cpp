/**
 * @file user_agent_parser.cpp
 * @brief User-Agent 문자열 파서 구현
 */

#include "user_agent_parser.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace shortline::analytics {

namespace {

std::string toLower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

/// pos부터 숫자/점/밑줄로 이루어진 버전 문자열 추출
std::string readVersion(const std::string& ua, size_t pos) {
    size_t end = pos;
    while (end < ua.size() &&
           (std::isdigit(static_cast<unsigned char>(ua[end])) || ua[end] == '.' || ua[end] == '_')) {
        ++end;
    }
    return ua.substr(pos, end - pos);
}

/// "Token/1.2.3" 에서 버전 추출. 토큰이 없으면 false
bool tokenVersion(const std::string& ua, std::string_view token, std::string& version) {
    auto pos = ua.find(token);
    if (pos == std::string::npos) return false;
    version = readVersion(ua, pos + token.size());
    return true;
}

std::string underscoresToDots(std::string s) {
    std::replace(s.begin(), s.end(), '_', '.');
    return s;
}

/// Windows NT 버전 → 제품명
std::string windowsName(const std::string& nt_version) {
    if (nt_version == "10.0") return "Windows 10";
    if (nt_version == "6.3")  return "Windows 8.1";
    if (nt_version == "6.2")  return "Windows 8";
    if (nt_version == "6.1")  return "Windows 7";
    if (nt_version == "6.0")  return "Windows Vista";
    if (nt_version == "5.1" || nt_version == "5.2") return "Windows XP";
    if (nt_version == "5.0")  return "Windows 2000";
    if (nt_version.empty())   return "Windows";
    return "Windows NT " + nt_version;
}

constexpr std::array<std::string_view, 8> kMobileTokens = {
    "mobile", "android", "iphone", "ipod", "ipad",
    "windows phone", "blackberry", "opera mini"
};

constexpr std::array<std::string_view, 4> kBotTokens = {
    "bot", "crawler", "spider", "slurp"
};

} // namespace

// ============================================================
// 공개 API
// ============================================================

UserAgentInfo UserAgentParser::parse(const std::string& user_agent) {
    UserAgentInfo info;
    if (user_agent.empty()) return info;

    std::string lower = toLower(user_agent);

    for (auto token : kMobileTokens) {
        if (contains(lower, token)) {
            info.mobile = true;
            break;
        }
    }

    for (auto token : kBotTokens) {
        if (contains(lower, token)) {
            info.bot = true;
            break;
        }
    }
    if (contains(lower, "+http")) info.bot = true;

    detectOs(user_agent, info);

    if (info.bot) {
        detectBotProduct(user_agent, info);
        if (!info.browser.empty()) return info;
    }

    detectBrowser(user_agent, info);
    return info;
}

// ============================================================
// 내부 구현
// ============================================================

void UserAgentParser::detectBrowser(const std::string& ua, UserAgentInfo& info) {
    std::string version;

    // 우선순위: Edge > Opera > Samsung > Firefox > Chrome > Safari > IE
    for (auto token : {"Edg/", "EdgA/", "EdgiOS/", "Edge/"}) {
        if (tokenVersion(ua, token, version)) {
            info.browser = "Edge";
            info.browser_version = version;
            return;
        }
    }

    if (tokenVersion(ua, "OPR/", version)) {
        info.browser = "Opera";
        info.browser_version = version;
        return;
    }
    if (contains(ua, "Opera")) {
        info.browser = "Opera";
        if (!tokenVersion(ua, "Version/", version)) tokenVersion(ua, "Opera/", version);
        info.browser_version = version;
        return;
    }

    if (tokenVersion(ua, "SamsungBrowser/", version)) {
        info.browser = "Samsung Internet";
        info.browser_version = version;
        return;
    }

    if (tokenVersion(ua, "Firefox/", version) || tokenVersion(ua, "FxiOS/", version)) {
        info.browser = "Firefox";
        info.browser_version = version;
        return;
    }

    if (tokenVersion(ua, "Chrome/", version) || tokenVersion(ua, "CriOS/", version)) {
        info.browser = "Chrome";
        info.browser_version = version;
        return;
    }

    if (contains(ua, "Safari/")) {
        info.browser = "Safari";
        tokenVersion(ua, "Version/", version);
        info.browser_version = version;
        return;
    }

    if (tokenVersion(ua, "MSIE ", version)) {
        info.browser = "Internet Explorer";
        info.browser_version = version;
        return;
    }
    if (contains(ua, "Trident/") && tokenVersion(ua, "rv:", version)) {
        info.browser = "Internet Explorer";
        info.browser_version = version;
        return;
    }
}

void UserAgentParser::detectOs(const std::string& ua, UserAgentInfo& info) {
    std::string version;

    if (contains(ua, "Windows Phone")) {
        tokenVersion(ua, "Windows Phone ", version);
        info.os = version.empty() ? "Windows Phone" : "Windows Phone " + version;
        return;
    }
    if (tokenVersion(ua, "Windows NT ", version)) {
        info.os = windowsName(version);
        return;
    }
    if (contains(ua, "Android")) {
        tokenVersion(ua, "Android ", version);
        info.os = version.empty() ? "Android" : "Android " + version;
        return;
    }
    if (contains(ua, "iPhone") || contains(ua, "iPad") || contains(ua, "iPod")) {
        // "CPU iPhone OS 17_1 like Mac OS X" / "CPU OS 17_1 like Mac OS X"
        if (!tokenVersion(ua, "iPhone OS ", version)) tokenVersion(ua, "CPU OS ", version);
        version = underscoresToDots(version);
        info.os = version.empty() ? "iOS" : "iOS " + version;
        return;
    }
    if (contains(ua, "CrOS")) {
        info.os = "ChromeOS";
        return;
    }
    if (tokenVersion(ua, "Mac OS X ", version)) {
        version = underscoresToDots(version);
        info.os = version.empty() ? "Mac OS X" : "Mac OS X " + version;
        return;
    }
    if (contains(ua, "Macintosh")) {
        info.os = "Mac OS X";
        return;
    }
    if (contains(ua, "Linux")) {
        info.os = "Linux";
        return;
    }
}

void UserAgentParser::detectBotProduct(const std::string& ua, UserAgentInfo& info) {
    // "Mozilla/5.0 (compatible; Googlebot/2.1; +http://www.google.com/bot.html)"
    // → 봇 토큰을 포함한 첫 번째 "이름/버전" 제품 토큰
    size_t start = 0;
    while (start < ua.size()) {
        size_t end = ua.find_first_of(" ;()", start);
        if (end == std::string::npos) end = ua.size();

        std::string token = ua.substr(start, end - start);
        start = end + 1;
        if (token.empty() || token[0] == '+') continue;

        std::string lower = toLower(token);
        bool is_bot_token = std::any_of(kBotTokens.begin(), kBotTokens.end(),
                                        [&](std::string_view t) { return contains(lower, t); });
        if (!is_bot_token) continue;

        auto slash = token.find('/');
        if (slash == std::string::npos) {
            info.browser = token;
        } else {
            info.browser = token.substr(0, slash);
            info.browser_version = readVersion(token, slash + 1);
        }
        return;
    }
}

} // namespace shortline::analytics
