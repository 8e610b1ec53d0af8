#include "ttsserve/core/cache/CacheKeys.hpp"
#include "ttsserve/core/common/Error.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ttsserve {
namespace core {
namespace cache {

namespace {

std::string trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string normalizeLower(const std::string& value) {
    std::string result = trim(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

std::string toHex(const unsigned char* hash, size_t length) {
    std::stringstream ss;
    for (size_t i = 0; i < length; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

// SHA-256 через EVP (одноразовый вызов)
std::string digestSha256(const unsigned char* data, size_t size) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(data, size, digest, &length, EVP_sha256(), nullptr) != 1) {
        throw Error(ErrorKind::Internal, "EVP sha256 digest failed");
    }
    return toHex(digest, length);
}

} // namespace

std::string CacheKeys::sha256Hex(const std::string& data) {
    return digestSha256(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

std::string CacheKeys::sha256Hex(const std::vector<uint8_t>& data) {
    return digestSha256(data.data(), data.size());
}

std::string CacheKeys::audioKey(const AudioKeyParams& params) {
    // nlohmann::json хранит объекты в std::map — ключи уже отсортированы
    nlohmann::json components = {
        {"text", trim(params.text)},
        {"voice", normalizeLower(params.voice)},
        {"speed", round2(params.speed)},
        {"format", normalizeLower(params.format)},
        {"language", normalizeLower(params.language)}
    };
    if (params.emotion && !trim(*params.emotion).empty()) {
        components["emotion"] = normalizeLower(*params.emotion);
        components["emotion_strength"] = round2(params.emotionStrength);
    }
    return sha256Hex(components.dump());
}

std::string CacheKeys::voiceKey(const std::string& voice) {
    return sha256Hex("voice:" + normalizeLower(voice));
}

std::string CacheKeys::modelKey(const std::string& modelPath, const std::string& variant) {
    return sha256Hex("model:" + modelPath + ":" + variant);
}

std::string CacheKeys::textKey(const std::string& text, const std::string& level) {
    return sha256Hex("text_preprocess:" + level + ":" + trim(text));
}

std::string CacheKeys::phonemeKey(const std::string& text, const std::string& language) {
    return sha256Hex("phonemes:" + normalizeLower(language) + ":" + trim(text));
}

bool CacheKeys::isValidKey(const std::string& key) {
    if (key.size() != SHA256_DIGEST_LENGTH * 2) return false;
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isdigit(c) || (c >= 'a' && c <= 'f');
    });
}

} // namespace cache
} // namespace core
} // namespace ttsserve
