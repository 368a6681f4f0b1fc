#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <regex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace execbox {

enum class PiiType : uint8_t {
    EMAIL,
    PHONE,
    SSN,
    CREDIT_CARD,
    IP_ADDRESS
};

[[nodiscard]] inline const char* pii_type_to_string(PiiType type) {
    switch (type) {
        case PiiType::EMAIL:       return "EMAIL";
        case PiiType::PHONE:       return "PHONE";
        case PiiType::SSN:         return "SSN";
        case PiiType::CREDIT_CARD: return "CREDIT_CARD";
        case PiiType::IP_ADDRESS:  return "IP_ADDRESS";
        default:                   return "UNKNOWN";
    }
}

/**
 * @brief Reversible PII tokenization at the tool-call boundary
 *
 * Detected literals (email, three phone formats, SSN, card-like digit groups,
 * IPv4) are replaced by tokens "[TYPE_XXXXXXXX]". A literal always maps to the
 * same token for the lifetime of the instance; untokenize() replaces known
 * tokens only and never re-runs detection.
 *
 * The maps grow until clear(). Scope one instance per logical task, or call
 * clear() between unrelated tasks.
 *
 * Thread-safety: all methods may be called concurrently. Two threads
 * tokenizing the same literal receive the same token.
 */
class PrivacyTokenizer {
public:
    struct Detection {
        std::string literal;
        PiiType type;
    };

    struct Stats {
        size_t total_tokens = 0;
        std::unordered_map<PiiType, size_t> by_type;

        [[nodiscard]] nlohmann::json to_json() const;
    };

    PrivacyTokenizer();

    [[nodiscard]] std::string tokenize_text(std::string_view text);
    [[nodiscard]] std::string untokenize_text(std::string_view text) const;

    /// Recurse through objects (values only) and arrays; other scalars pass through
    [[nodiscard]] nlohmann::json tokenize(const nlohmann::json& data);
    [[nodiscard]] nlohmann::json untokenize(const nlohmann::json& data) const;

    /// Detected literals in pattern order (duplicates included)
    [[nodiscard]] std::vector<Detection> detect(std::string_view text) const;

    void clear();

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] size_t size() const;

private:
    [[nodiscard]] std::string token_for(const std::string& literal, PiiType type);

    std::vector<std::pair<std::regex, PiiType>> patterns_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::string> token_to_value_;
    std::unordered_map<std::string, std::string> value_to_token_;
    std::unordered_map<std::string, PiiType> token_types_;
};

} // namespace execbox
