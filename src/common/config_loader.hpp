#pragma once

#include "common/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace dispatch {
namespace common {

class ConfigLoader {
public:
    static AppConfig Load(const std::string& path);
    static AppConfig LoadFromEnvOrDefault();
    static AppConfig FromJson(const nlohmann::json& j);
private:
    static nlohmann::json ReadFile(const std::string& path);
};

// 解析配置文件路径: 命令行参数 > DISPATCH_SERVER_CONFIG > 默认示例配置
std::string ResolveConfigPath(int argc, char** argv);

}
}
