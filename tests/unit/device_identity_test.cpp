#include "core/device/device_identity.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

using quota::core::ClassifyUserAgent;
using quota::core::DeviceSignals;
using quota::core::HashingIdentityResolver;

namespace {

constexpr const char* kChromeWindows =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/120.0.0.0 Safari/537.36";
constexpr const char* kEdgeWindows =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/120.0.0.0 Safari/537.36 Edg/120.0.2210.91";
constexpr const char* kSafariIphone =
    "Mozilla/5.0 (iPhone; CPU iPhone OS 17_1 like Mac OS X) AppleWebKit/605.1.15 "
    "(KHTML, like Gecko) Version/17.1 Mobile/15E148 Safari/604.1";
constexpr const char* kChromeAndroidTablet =
    "Mozilla/5.0 (Linux; Android 13; SM-X700) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/120.0.0.0 Safari/537.36";
constexpr const char* kFirefoxLinux =
    "Mozilla/5.0 (X11; Linux x86_64; rv:121.0) Gecko/20100101 Firefox/121.0";

} // namespace

// SHA-256 已知向量
TEST(DeviceIdentityTest, Sha256KnownVectors) {
    EXPECT_EQ(quota::core::Sha256Hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(quota::core::Sha256Hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

// 客户端指纹优先, 与地址和UA无关
TEST(DeviceIdentityTest, ClientFingerprintTakesPrecedence) {
    HashingIdentityResolver resolver;
    DeviceSignals a{"fp-123", kChromeWindows, "web", "10.0.0.1"};
    DeviceSignals b{"fp-123", kSafariIphone, "ios", "192.168.1.9"};
    EXPECT_EQ(resolver.Resolve(a), resolver.Resolve(b));
    EXPECT_EQ(resolver.Resolve(a), quota::core::Sha256Hex("client:fp-123"));
}

// 无客户端指纹时使用 地址 + UA
TEST(DeviceIdentityTest, FallsBackToAddressAndUserAgent) {
    HashingIdentityResolver resolver;
    DeviceSignals a{"", kChromeWindows, "web", "10.0.0.1"};
    DeviceSignals same{"", kChromeWindows, "other-platform", "10.0.0.1"};
    DeviceSignals other_ip{"", kChromeWindows, "web", "10.0.0.2"};
    DeviceSignals other_ua{"", kFirefoxLinux, "web", "10.0.0.1"};

    const auto fp = resolver.Resolve(a);
    EXPECT_EQ(fp, quota::core::Sha256Hex(std::string("10.0.0.1:") + kChromeWindows));
    EXPECT_EQ(fp.size(), 64u);
    EXPECT_EQ(fp, resolver.Resolve(same));
    EXPECT_NE(fp, resolver.Resolve(other_ip));
    EXPECT_NE(fp, resolver.Resolve(other_ua));
}

TEST(DeviceIdentityTest, ClassifiesCommonUserAgents) {
    auto chrome = ClassifyUserAgent(kChromeWindows);
    EXPECT_EQ(chrome.device_type, "desktop");
    EXPECT_EQ(chrome.browser, "Chrome");
    EXPECT_EQ(chrome.os, "Windows");

    auto edge = ClassifyUserAgent(kEdgeWindows);
    EXPECT_EQ(edge.browser, "Edge");

    auto iphone = ClassifyUserAgent(kSafariIphone);
    EXPECT_EQ(iphone.device_type, "mobile");
    EXPECT_EQ(iphone.browser, "Safari");
    EXPECT_EQ(iphone.os, "iOS");

    auto tablet = ClassifyUserAgent(kChromeAndroidTablet);
    EXPECT_EQ(tablet.device_type, "tablet");
    EXPECT_EQ(tablet.os, "Android");

    auto firefox = ClassifyUserAgent(kFirefoxLinux);
    EXPECT_EQ(firefox.device_type, "desktop");
    EXPECT_EQ(firefox.browser, "Firefox");
    EXPECT_EQ(firefox.os, "Linux");
}

// 空UA或无法识别时全部为 unknown
TEST(DeviceIdentityTest, UnknownUserAgent) {
    auto empty = ClassifyUserAgent("");
    EXPECT_EQ(empty.device_type, "unknown");
    EXPECT_EQ(empty.browser, "unknown");
    EXPECT_EQ(empty.os, "unknown");

    auto curl = ClassifyUserAgent("curl/8.4.0");
    EXPECT_EQ(curl.device_type, "unknown");
    EXPECT_EQ(curl.browser, "unknown");
}

TEST(DeviceIdentityTest, FingerprintPrefix) {
    EXPECT_EQ(quota::core::FingerprintPrefix("0123456789abcdef"), "0123456789ab");
    EXPECT_EQ(quota::core::FingerprintPrefix("abc"), "abc");
}

// 会话ID为64位十六进制且不重复
TEST(DeviceIdentityTest, SessionIdsAreRandomHex) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto id_or = quota::core::GenerateSessionId();
        ASSERT_TRUE(id_or.IsOk()) << id_or.GetStatus().Message();
        const auto& id = id_or.Value();
        ASSERT_EQ(id.size(), 64u);
        EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
        EXPECT_TRUE(seen.insert(id).second);
    }
}
