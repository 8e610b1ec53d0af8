#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ttsserve {
namespace core {
namespace cache {

// AudioKeyParams — параметры синтеза, однозначно определяющие аудио
struct AudioKeyParams {
    std::string text;
    std::string voice;
    double speed = 1.0;
    std::string format = "mp3";
    std::string language = "en-us";
    std::optional<std::string> emotion;
    double emotionStrength = 1.0;
};

// CacheKeys — канонические ключи кэша (SHA-256, hex)
// Входные строки нормализуются (trim, lower-case для голоса/формата/языка),
// скорость и сила эмоции округляются до 2 знаков.
class CacheKeys {
public:
    static std::string audioKey(const AudioKeyParams& params); // Ключ аудио
    static std::string voiceKey(const std::string& voice); // Ключ эмбеддинга голоса
    static std::string modelKey(const std::string& modelPath, const std::string& variant = ""); // Ключ модели
    static std::string textKey(const std::string& text, const std::string& level = "standard"); // Ключ обработки текста
    static std::string phonemeKey(const std::string& text, const std::string& language = "en-us"); // Ключ фонем
    static bool isValidKey(const std::string& key); // 64 hex-символа
    static std::string sha256Hex(const std::string& data); // SHA-256 строки
    static std::string sha256Hex(const std::vector<uint8_t>& data); // SHA-256 байтов
};

} // namespace cache
} // namespace core
} // namespace ttsserve
