// config_handler.cpp
// 专门负责读取和解析 config.json
#include "config_handler.h"
#include "common_types.h"
#include <nlohmann/json.hpp> // 使用 nlohmann/json 库
#include <iostream>
#include <fstream>
#include <iomanip>

// 使用 nlohmann::json 的命名空间
using json = nlohmann::json;

namespace {

void readFontAliases(const json& fonts, Config& config) {
    if (!fonts.is_object()) {
        std::cerr << "Warning: 'Fonts' in config must be an object. Ignoring." << std::endl;
        return;
    }
    for (const auto& item : fonts.items()) {
        FontSpec spec;
        if (item.value().is_string()) {
            spec.path = item.value().get<string>();
        } else if (item.value().is_object() && item.value().contains("path") && item.value()["path"].is_string()) {
            spec.path = item.value()["path"].get<string>();
            spec.faceIndex = item.value().value("faceIndex", 0);
        } else {
            std::cerr << "Warning: Font alias '" << item.key() << "' has no usable path. Ignoring." << std::endl;
            continue;
        }
        config.fontAliases[toLower(item.key())] = spec;
    }
}

} // end anonymous namespace

// --- Public Functions ---

bool loadConfiguration(const std::filesystem::path& configPath, Config& config) {
    std::cout << "Info: Attempting to load configuration from '" << configPath.string() << "'..." << std::endl;

    std::ifstream configFile(configPath);
    if (!configFile.is_open()) {
        std::cout << "Info: Config file '" << configPath.string() << "' not found. Using default values." << std::endl;
        return true; // 文件不存在是正常情况，使用默认配置
    }

    Config loaded = config;
    try {
        json j;
        configFile >> j; // 从文件流解析 JSON

        // 安全地获取 "Settings" 对象
        const auto& settings = j.value("Settings", json::object());

        // 使用 .value() 方法安全地读取每个配置项，如果键不存在则使用默认值
        loaded.outputSize = settings.value("outputSize", loaded.outputSize);
        loaded.fontName = settings.value("font", loaded.fontName);
        loaded.fontSize = settings.value("fontSize", loaded.fontSize);
        loaded.sortFontSize = settings.value("sortFontSize", loaded.sortFontSize);
        loaded.measureCanvasSize = settings.value("measureCanvasSize", loaded.measureCanvasSize);
        loaded.outputDirectory = settings.value("outputDirectory", loaded.outputDirectory);
        loaded.framePrefix = settings.value("framePrefix", loaded.framePrefix);
        loaded.frameIndexWidth = settings.value("frameIndexWidth", loaded.frameIndexWidth);
        loaded.fps = settings.value("fps", loaded.fps);
        loaded.previewFrameLimit = settings.value("previewFrameLimit", loaded.previewFrameLimit);
        loaded.workerCount = settings.value("workerCount", loaded.workerCount);
        loaded.asciiOnlyCandidates = settings.value("asciiOnlyCandidates", loaded.asciiOnlyCandidates);

        if (j.contains("Fonts")) {
            readFontAliases(j["Fonts"], loaded);
        }

    } catch (const json::parse_error& e) {
        // 捕获 JSON 解析错误
        std::cerr << "Error: Failed to parse config file '" << configPath.string() << "'." << std::endl;
        std::cerr << "       Reason: " << e.what() << std::endl;
        std::cerr << "       Using default values instead." << std::endl;
        return false;
    } catch (const json::exception& e) {
        // 类型不匹配等错误
        std::cerr << "Error: Invalid value in config file '" << configPath.string() << "': " << e.what() << std::endl;
        std::cerr << "       Using default values instead." << std::endl;
        return false;
    }

    // 基本的合法性检查
    if (loaded.outputSize <= 0 || loaded.fontSize <= 0.0f || loaded.sortFontSize <= 0.0f ||
        loaded.measureCanvasSize <= 0 || loaded.frameIndexWidth <= 0 || loaded.fps <= 0 ||
        loaded.previewFrameLimit <= 0 || loaded.workerCount < 0) {
        std::cerr << "Error: Config file '" << configPath.string() << "' contains out-of-range values. Using default values instead." << std::endl;
        return false;
    }

    config = loaded;
    std::cout << "Info: Configuration loaded successfully." << std::endl;
    return true;
}


// 用于生成一个人类可读的运行日志，而不是一个有效的JSON文件。
bool writeConfigToFile(const Config& config, const std::filesystem::path& outputFilePath) {
    std::ofstream configFile(outputFilePath);
    if (!configFile.is_open()) {
        std::cerr << "Error: Could not open config output file for writing: " << outputFilePath.string() << std::endl;
        return false;
    }

    std::cout << "Info: Writing effective configuration to: " << outputFilePath.string() << std::endl;

    configFile << "# Effective configuration used for this run" << std::endl;
    configFile << "# Automatically generated by the program." << std::endl;
    configFile << std::endl;

    configFile << "[Settings]" << std::endl;
    configFile << "outputSize = " << config.outputSize << std::endl;
    configFile << "font = " << config.fontName << "  # Alias or path given" << std::endl;
    configFile << "finalFontPath = " << config.finalFontPath << "  # Resolved path used" << std::endl;
    configFile << "fontFaceIndex = " << config.finalFontFaceIndex << std::endl;
    configFile << "fontSize = " << std::fixed << std::setprecision(2) << config.fontSize << " # Font size for output frames" << std::endl;
    configFile << "sortFontSize = " << std::fixed << std::setprecision(2) << config.sortFontSize << " # Font size for brightness measurement" << std::endl;
    configFile << "measureCanvasSize = " << config.measureCanvasSize << std::endl;
    configFile << "outputDirectory = " << config.outputDirectory << std::endl;
    configFile << "framePrefix = " << config.framePrefix << std::endl;
    configFile << "frameIndexWidth = " << config.frameIndexWidth << std::endl;
    configFile << "fps = " << config.fps << std::endl;
    configFile << "preview = " << (config.preview ? "true" : "false") << std::endl;
    configFile << "previewFrameLimit = " << config.previewFrameLimit << std::endl;
    configFile << "workerCount = " << config.workerCount << " # 0 = hardware concurrency" << std::endl;

    configFile << std::endl << "[Fonts]" << std::endl;
    for (const auto& [alias, spec] : config.fontAliases) {
        configFile << alias << " = " << spec.path;
        if (spec.faceIndex != 0) {
            configFile << " (face " << spec.faceIndex << ")";
        }
        configFile << std::endl;
    }

    configFile.close();
    if (!configFile) {
         std::cerr << "Error: Failed to write all data or close the config output file: " << outputFilePath.string() << std::endl;
         return false;
    }

    return true;
}

std::optional<FontSpec> lookupFontAlias(const Config& config, const string& name) {
    auto it = config.fontAliases.find(toLower(name));
    if (it == config.fontAliases.end()) {
        return std::nullopt;
    }
    return it->second;
}

FontSpec fontSpecFor(const Config& config, const string& nameOrPath) {
    if (auto alias = lookupFontAlias(config, nameOrPath)) {
        return *alias;
    }
    FontSpec spec;
    spec.path = nameOrPath;
    return spec;
}
