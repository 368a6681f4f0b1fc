#include "policy/network_policy.hpp"
#include "core/utils.hpp"

#include <array>
#include <format>

namespace execbox {

namespace {

constexpr std::array<std::string_view, 4> kLoopbackHosts = {
    "127.0.0.1", "localhost", "::1", "0.0.0.0",
};

std::vector<std::string_view> split_labels(std::string_view host) {
    std::vector<std::string_view> labels;
    size_t start = 0;
    for (;;) {
        const auto dot = host.find('.', start);
        labels.push_back(host.substr(start, dot - start));
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }
    return labels;
}

} // anonymous namespace

NetworkPolicy::NetworkPolicy(const std::vector<std::string>& allowed_endpoints) {
    for (const auto& endpoint : allowed_endpoints) {
        add_allowed_endpoint(endpoint);
    }
}

NetworkPolicy NetworkPolicy::from_provider_endpoint(
    std::string_view provider_url, const std::vector<std::string>& extra_endpoints) {

    NetworkPolicy policy(extra_endpoints);
    if (!provider_url.empty()) {
        if (auto endpoint = extract_endpoint(provider_url)) {
            policy.add_allowed_endpoint(*endpoint);
        } else {
            utils::log::warn(std::format("Could not extract endpoint from provider URL '{}'",
                                         provider_url));
        }
    }
    return policy;
}

std::optional<std::string> NetworkPolicy::extract_endpoint(std::string_view url) {
    uint16_t default_port = 80;
    if (const auto scheme_end = url.find("://"); scheme_end != std::string_view::npos) {
        const std::string scheme = utils::to_lower(std::string(url.substr(0, scheme_end)));
        if (scheme == "https" || scheme == "wss") default_port = 443;
        url.remove_prefix(scheme_end + 3);
    }

    url = url.substr(0, url.find_first_of("/?#"));
    if (const auto at = url.rfind('@'); at != std::string_view::npos) {
        url.remove_prefix(at + 1);
    }
    if (url.empty()) return std::nullopt;

    // Bracketed IPv6 literal: "[::1]:8080"
    if (url.front() == '[') {
        const auto close = url.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        const std::string_view host = url.substr(1, close - 1);
        const std::string_view rest = url.substr(close + 1);
        if (rest.empty()) return std::format("{}:{}", host, default_port);
        if (rest.front() != ':' || !utils::try_parse_int<uint16_t>(rest.substr(1))) {
            return std::nullopt;
        }
        return std::format("{}{}", host, rest);
    }

    const auto colon = url.rfind(':');
    if (colon == std::string_view::npos) {
        return std::format("{}:{}", url, default_port);
    }
    if (colon == 0 || !utils::try_parse_int<uint16_t>(url.substr(colon + 1))) {
        return std::nullopt;
    }
    return std::string(url);
}

bool NetworkPolicy::is_loopback(std::string_view host) {
    for (const auto& lb : kLoopbackHosts) {
        if (host == lb) return true;
    }
    return false;
}

bool NetworkPolicy::is_allowed(std::string_view host, std::optional<uint16_t> port) const {
    if (is_loopback(host)) return true;
    if (allowed_.empty()) return false;

    const std::string endpoint = port ? std::format("{}:{}", host, *port) : std::string(host);
    if (allowed_.contains(endpoint)) return true;
    if (allowed_.contains(std::string(host))) return true;

    for (const auto& pattern : allowed_) {
        if (matches_pattern(host, port, pattern)) return true;
    }
    return false;
}

bool NetworkPolicy::matches_pattern(std::string_view host, std::optional<uint16_t> port,
                                    std::string_view pattern) {
    if (pattern.find('*') == std::string_view::npos) return false;

    std::string_view pattern_host = pattern;
    std::optional<std::string_view> pattern_port;
    if (const auto colon = pattern.find(':'); colon != std::string_view::npos) {
        pattern_host = pattern.substr(0, colon);
        pattern_port = pattern.substr(colon + 1);
    }
    if (pattern_host.find('*') == std::string_view::npos) return false;

    const auto pattern_labels = split_labels(pattern_host);
    const auto host_labels = split_labels(host);
    if (pattern_labels.size() != host_labels.size()) return false;

    for (size_t i = 0; i < pattern_labels.size(); ++i) {
        if (pattern_labels[i] != "*" && pattern_labels[i] != host_labels[i]) return false;
    }

    if (pattern_port) {
        return port && std::to_string(*port) == *pattern_port;
    }
    return true;
}

std::optional<std::string> NetworkPolicy::validate_connection(
    std::string_view host, std::optional<uint16_t> port) const {

    if (is_allowed(host, port)) return std::nullopt;

    const std::string target = port ? std::format("{}:{}", host, *port) : std::string(host);
    const auto endpoints = get_allowed_endpoints();
    return std::format(
        "Network access to {} is blocked by security policy. Only allowed endpoints: {}",
        target, endpoints.empty() ? std::string("(none)") : utils::join(endpoints, ", "));
}

void NetworkPolicy::add_allowed_endpoint(const std::string& endpoint) {
    const std::string trimmed = utils::trim(endpoint);
    if (!trimmed.empty()) allowed_.insert(trimmed);
}

void NetworkPolicy::remove_allowed_endpoint(const std::string& endpoint) {
    allowed_.erase(utils::trim(endpoint));
}

std::vector<std::string> NetworkPolicy::get_allowed_endpoints() const {
    return {allowed_.begin(), allowed_.end()};
}

nlohmann::json NetworkPolicy::to_json() const {
    nlohmann::json loopback = nlohmann::json::array();
    for (const auto& lb : kLoopbackHosts) loopback.push_back(std::string(lb));
    return {
        {"allowed_endpoints", get_allowed_endpoints()},
        {"loopback", std::move(loopback)},
    };
}

} // namespace execbox
