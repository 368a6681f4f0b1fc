#include "privacy/privacy_tokenizer.hpp"
#include "core/random.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <stdexcept>

namespace execbox {

namespace {

constexpr size_t kTokenHexBytes = 4;       // 8 hex characters
constexpr int kMaxTokenAttempts = 16;

} // anonymous namespace

PrivacyTokenizer::PrivacyTokenizer() {
    const auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
    patterns_.emplace_back(std::regex(R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Z|a-z]{2,}\b)", flags), PiiType::EMAIL);
    patterns_.emplace_back(std::regex(R"(\b\d{3}-\d{3}-\d{4}\b)", flags), PiiType::PHONE);
    patterns_.emplace_back(std::regex(R"(\(\d{3}\)\s?\d{3}-\d{4}\b)", flags), PiiType::PHONE);
    patterns_.emplace_back(std::regex(R"(\b\d{3}\.\d{3}\.\d{4}\b)", flags), PiiType::PHONE);
    patterns_.emplace_back(std::regex(R"(\b\d{3}-\d{2}-\d{4}\b)", flags), PiiType::SSN);
    patterns_.emplace_back(std::regex(R"(\b\d{4}[\s-]?\d{4}[\s-]?\d{4}[\s-]?\d{4}\b)", flags), PiiType::CREDIT_CARD);
    patterns_.emplace_back(std::regex(R"(\b\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)", flags), PiiType::IP_ADDRESS);
}

std::vector<PrivacyTokenizer::Detection> PrivacyTokenizer::detect(std::string_view text) const {
    std::vector<Detection> found;
    const std::string subject(text);
    for (const auto& [re, type] : patterns_) {
        for (auto it = std::sregex_iterator(subject.begin(), subject.end(), re);
             it != std::sregex_iterator(); ++it) {
            found.push_back({it->str(), type});
        }
    }
    return found;
}

std::string PrivacyTokenizer::token_for(const std::string& literal, PiiType type) {
    // Caller holds the unique lock
    if (auto it = value_to_token_.find(literal); it != value_to_token_.end()) {
        return it->second;
    }

    for (int attempt = 0; attempt < kMaxTokenAttempts; ++attempt) {
        std::string token = std::format("[{}_{}]", pii_type_to_string(type),
                                        random::hex(kTokenHexBytes, true));
        if (token_to_value_.contains(token)) continue;

        token_to_value_.emplace(token, literal);
        value_to_token_.emplace(literal, token);
        token_types_.emplace(token, type);
        return token;
    }
    throw std::runtime_error("Could not mint a unique privacy token");
}

std::string PrivacyTokenizer::tokenize_text(std::string_view text) {
    auto detected = detect(text);
    if (detected.empty()) return std::string(text);

    // Longest literal first so a literal that contains another is replaced whole
    std::stable_sort(detected.begin(), detected.end(),
        [](const Detection& a, const Detection& b) {
            return a.literal.size() > b.literal.size();
        });

    std::vector<std::pair<std::string, std::string>> replacements;
    {
        std::unique_lock lock(mutex_);
        for (const auto& d : detected) {
            replacements.emplace_back(d.literal, token_for(d.literal, d.type));
        }
    }

    std::string result(text);
    for (const auto& [literal, token] : replacements) {
        utils::replace_all(result, literal, token);
    }
    return result;
}

std::string PrivacyTokenizer::untokenize_text(std::string_view text) const {
    std::string result(text);
    if (result.find('[') == std::string::npos) return result;

    std::shared_lock lock(mutex_);
    for (const auto& [token, original] : token_to_value_) {
        utils::replace_all(result, token, original);
    }
    return result;
}

nlohmann::json PrivacyTokenizer::tokenize(const nlohmann::json& data) {
    if (data.is_string()) {
        return tokenize_text(data.get_ref<const std::string&>());
    }
    if (data.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto it = data.begin(); it != data.end(); ++it) {
            out[it.key()] = tokenize(it.value());
        }
        return out;
    }
    if (data.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : data) {
            out.push_back(tokenize(item));
        }
        return out;
    }
    return data;
}

nlohmann::json PrivacyTokenizer::untokenize(const nlohmann::json& data) const {
    if (data.is_string()) {
        return untokenize_text(data.get_ref<const std::string&>());
    }
    if (data.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto it = data.begin(); it != data.end(); ++it) {
            out[it.key()] = untokenize(it.value());
        }
        return out;
    }
    if (data.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : data) {
            out.push_back(untokenize(item));
        }
        return out;
    }
    return data;
}

void PrivacyTokenizer::clear() {
    std::unique_lock lock(mutex_);
    token_to_value_.clear();
    value_to_token_.clear();
    token_types_.clear();
}

PrivacyTokenizer::Stats PrivacyTokenizer::get_stats() const {
    std::shared_lock lock(mutex_);
    Stats stats;
    stats.total_tokens = token_to_value_.size();
    for (const auto& [token, type] : token_types_) {
        ++stats.by_type[type];
    }
    return stats;
}

size_t PrivacyTokenizer::size() const {
    std::shared_lock lock(mutex_);
    return token_to_value_.size();
}

nlohmann::json PrivacyTokenizer::Stats::to_json() const {
    nlohmann::json types = nlohmann::json::object();
    for (auto type : {PiiType::EMAIL, PiiType::PHONE, PiiType::SSN,
                      PiiType::CREDIT_CARD, PiiType::IP_ADDRESS}) {
        const auto it = by_type.find(type);
        types[pii_type_to_string(type)] = it == by_type.end() ? 0 : it->second;
    }
    return {{"total_tokens", total_tokens}, {"by_type", std::move(types)}};
}

} // namespace execbox
