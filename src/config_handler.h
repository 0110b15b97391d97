// config_handler.h
#ifndef CONFIG_HANDLER_H
#define CONFIG_HANDLER_H

#include "common_types.h" // Includes filesystem, string, vector, etc.
#include <filesystem>
#include <optional>

// 从指定的 JSON 文件路径加载配置到 Config 结构体中。
// 如果文件不存在则使用默认值并返回 true；解析失败返回 false（保留默认值）。
bool loadConfiguration(const std::filesystem::path& configPath, Config& config);

// 将当前生效的配置写入一个文本文件，用于记录和调试。
// 成功返回 true，失败返回 false。
bool writeConfigToFile(const Config& config, const std::filesystem::path& outputFilePath);

// Case-insensitive alias lookup in config.fontAliases.
std::optional<FontSpec> lookupFontAlias(const Config& config, const string& name);

// Alias if known, otherwise the name itself is taken as a font file path.
FontSpec fontSpecFor(const Config& config, const string& nameOrPath);

#endif // CONFIG_HANDLER_H
