#include "core/device/device_identity.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace quota {
namespace core {

namespace {

constexpr std::size_t kFingerprintPrefixLength = 12;
constexpr int kSessionIdBytes = 32;

std::string ToHex(const unsigned char* data, std::size_t length) {
    std::stringstream ss;
    for (std::size_t i = 0; i < length; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::string ToLower(const std::string& value) {
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool Contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

std::string HashingIdentityResolver::Resolve(const DeviceSignals& signals) const {
    if (!signals.client_fingerprint.empty()) {
        return Sha256Hex("client:" + signals.client_fingerprint);
    }
    return Sha256Hex(signals.source_address + ":" + signals.user_agent);
}

std::string Sha256Hex(const std::string& input) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        // EVP_sha256 为内置算法, 只有内存耗尽时才会失败
        return std::string();
    }
    return ToHex(digest, digest_len);
}

DeviceTraits ClassifyUserAgent(const std::string& user_agent) {
    DeviceTraits traits;
    if (user_agent.empty()) {
        return traits;
    }
    const std::string ua = ToLower(user_agent);

    // 设备类型: 平板需先于手机判断, Android 平板 UA 不带 "mobile"
    if (Contains(ua, "ipad") || Contains(ua, "tablet") ||
        (Contains(ua, "android") && !Contains(ua, "mobile"))) {
        traits.device_type = "tablet";
    } else if (Contains(ua, "mobi") || Contains(ua, "iphone") || Contains(ua, "ipod")) {
        traits.device_type = "mobile";
    } else if (Contains(ua, "windows") || Contains(ua, "macintosh") ||
               Contains(ua, "x11") || Contains(ua, "linux") || Contains(ua, "cros")) {
        traits.device_type = "desktop";
    }

    // 浏览器: Edge/Opera 的 UA 同时包含 Chrome 与 Safari 标识
    if (Contains(ua, "edg/") || Contains(ua, "edge/")) {
        traits.browser = "Edge";
    } else if (Contains(ua, "opr/") || Contains(ua, "opera")) {
        traits.browser = "Opera";
    } else if (Contains(ua, "chrome/") || Contains(ua, "crios/")) {
        traits.browser = "Chrome";
    } else if (Contains(ua, "firefox/") || Contains(ua, "fxios/")) {
        traits.browser = "Firefox";
    } else if (Contains(ua, "safari/")) {
        traits.browser = "Safari";
    }

    // 操作系统: iOS UA 含 "like Mac OS X", Android UA 含 "Linux"
    if (Contains(ua, "windows")) {
        traits.os = "Windows";
    } else if (Contains(ua, "android")) {
        traits.os = "Android";
    } else if (Contains(ua, "iphone") || Contains(ua, "ipad") || Contains(ua, "ipod")) {
        traits.os = "iOS";
    } else if (Contains(ua, "mac os x") || Contains(ua, "macintosh")) {
        traits.os = "macOS";
    } else if (Contains(ua, "cros")) {
        traits.os = "ChromeOS";
    } else if (Contains(ua, "linux")) {
        traits.os = "Linux";
    }
    return traits;
}

std::string FingerprintPrefix(const std::string& fingerprint_hash) {
    return fingerprint_hash.substr(0, std::min(kFingerprintPrefixLength, fingerprint_hash.size()));
}

quota::common::StatusOr<std::string> GenerateSessionId() {
    unsigned char bytes[kSessionIdBytes];
    // 会话ID即访问凭证, 随机源失败时不做降级
    if (RAND_bytes(bytes, kSessionIdBytes) != 1) {
        return quota::common::Status::Internal("Failed to generate session id");
    }
    return quota::common::StatusOr<std::string>(ToHex(bytes, kSessionIdBytes));
}

} // namespace core
} // namespace quota
