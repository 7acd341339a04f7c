#pragma once

#include "common/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace quota {
namespace common {

class ConfigLoader {
public:
    // 解析失败或取值非法时抛出 std::runtime_error
    static AppConfig Load(const std::string& path);
    static AppConfig LoadFromString(const std::string& content);
    static AppConfig LoadFromEnvOrDefault();
private:
    static AppConfig FromJson(const nlohmann::json& j);
    static nlohmann::json ReadFile(const std::string& path);
    static void Validate(const AppConfig& cfg);
};

// 查找分组类型对应的默认限额, 未配置时为 1
int DefaultLimitFor(const QuotaConfig& quota, const std::string& kind);

}
}
