#pragma once

#include "common/status_or.hpp"

#include <string>

namespace quota {
namespace core {

// 请求时可获得的设备信号
struct DeviceSignals {
    std::string client_fingerprint; // 客户端自行生成的指纹, 可为空
    std::string user_agent;
    std::string platform;
    std::string source_address;
};

// 仅用于展示的设备特征
struct DeviceTraits {
    std::string device_type = "unknown"; // desktop / mobile / tablet / unknown
    std::string browser = "unknown";
    std::string os = "unknown";
};

// 设备身份解析接口, 输出作为 (分组, 指纹) 去重键
// 实现必须是纯函数: 相同输入永远得到相同指纹
class DeviceIdentityResolver {
public:
    virtual ~DeviceIdentityResolver() = default;
    virtual std::string Resolve(const DeviceSignals& signals) const = 0;
};

// 默认实现: 优先使用客户端指纹, 否则取 来源地址 + UA, 统一做 SHA-256
class HashingIdentityResolver : public DeviceIdentityResolver {
public:
    std::string Resolve(const DeviceSignals& signals) const override;
};

// SHA-256 十六进制摘要
std::string Sha256Hex(const std::string& input);

// 从 User-Agent 粗略识别设备类型、浏览器与操作系统
DeviceTraits ClassifyUserAgent(const std::string& user_agent);

// 展示用的指纹前缀
std::string FingerprintPrefix(const std::string& fingerprint_hash);

// 生成 64 位十六进制的随机会话ID
quota::common::StatusOr<std::string> GenerateSessionId();

} // namespace core
} // namespace quota
