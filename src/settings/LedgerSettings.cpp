#include "settings/LedgerSettings.hpp"
#include "domain/LedgerErrors.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace realty::settings {

namespace {

std::optional<domain::Percent> parseRate(const std::string& name, const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    try {
        return domain::Percent::fromString(value);
    } catch (const std::invalid_argument& e) {
        throw domain::ConfigurationError(name + ": " + e.what());
    }
}

int64_t parseDays(const std::string& name, const std::string& value) {
    try {
        size_t consumed = 0;
        long long days = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return days;
    } catch (const std::exception&) {
        throw domain::ConfigurationError(name + " must be an integer number of days, got '" + value + "'");
    }
}

std::optional<domain::Percent> rateFromJson(const nlohmann::json& value, const std::string& name) {
    if (value.is_null()) {
        return std::nullopt;
    }
    if (!value.is_string()) {
        throw domain::ConfigurationError(name + " must be a decimal string like \"1.00\"");
    }
    return parseRate(name, value.get<std::string>());
}

} // namespace

LedgerSettings::LedgerSettings() {
    std::string policyFile = getEnvOrDefault("LEDGER_POLICY_FILE", "");
    if (!policyFile.empty()) {
        loadPolicyFile(policyFile);
    }
    applyEnvironment();
    policy_.validate();

    std::cout << "[LedgerSettings] currency=" << policy_.currency
              << " penaltyRate=" << (policy_.penaltyRatePerMonth ? policy_.penaltyRatePerMonth->toString() : "unset")
              << " graceDays=" << policy_.penaltyGraceDays
              << " periodDays=" << policy_.penaltyPeriodDays << std::endl;
    if (!policy_.penaltyRatePerMonth) {
        std::cerr << "[LedgerSettings] LEDGER_PENALTY_RATE_PERCENT is not set, "
                  << "penalty assessment past the grace period will fail" << std::endl;
    }
}

void LedgerSettings::loadPolicyFile(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw domain::ConfigurationError("Cannot open ledger policy file: " + path);
    }
    nlohmann::json config;
    try {
        config = nlohmann::json::parse(input);
    } catch (const nlohmann::json::parse_error& e) {
        throw domain::ConfigurationError("Invalid ledger policy file " + path + ": " + e.what());
    }
    applyJson(config);
    std::cout << "[LedgerSettings] Loaded policy file " << path << std::endl;
}

void LedgerSettings::applyJson(const nlohmann::json& config) {
    if (!config.is_object()) {
        throw domain::ConfigurationError("Ledger policy must be a JSON object");
    }

    domain::LedgerPolicy updated = policy_;
    try {
        if (config.contains("currency")) {
            updated.currency = config.at("currency").get<std::string>();
        }
        if (config.contains("penaltyRatePercent")) {
            updated.penaltyRatePerMonth = rateFromJson(config.at("penaltyRatePercent"), "penaltyRatePercent");
        }
        if (config.contains("penaltyGraceDays")) {
            updated.penaltyGraceDays = config.at("penaltyGraceDays").get<int64_t>();
        }
        if (config.contains("penaltyPeriodDays")) {
            updated.penaltyPeriodDays = config.at("penaltyPeriodDays").get<int64_t>();
        }
        if (config.contains("agentCommissionPercent")) {
            updated.defaultAgentCommissionRate =
                rateFromJson(config.at("agentCommissionPercent"), "agentCommissionPercent");
        }
        if (config.contains("brokerCommissionPercent")) {
            updated.defaultBrokerCommissionRate =
                rateFromJson(config.at("brokerCommissionPercent"), "brokerCommissionPercent");
        }
    } catch (const nlohmann::json::exception& e) {
        throw domain::ConfigurationError(std::string("Invalid ledger policy value: ") + e.what());
    }

    updated.validate();
    policy_ = updated;
}

void LedgerSettings::applyEnvironment() {
    if (auto value = getEnv("LEDGER_CURRENCY")) {
        policy_.currency = *value;
    }
    if (auto value = getEnv("LEDGER_PENALTY_RATE_PERCENT")) {
        policy_.penaltyRatePerMonth = parseRate("LEDGER_PENALTY_RATE_PERCENT", *value);
    }
    if (auto value = getEnv("LEDGER_PENALTY_GRACE_DAYS")) {
        policy_.penaltyGraceDays = parseDays("LEDGER_PENALTY_GRACE_DAYS", *value);
    }
    if (auto value = getEnv("LEDGER_PENALTY_PERIOD_DAYS")) {
        policy_.penaltyPeriodDays = parseDays("LEDGER_PENALTY_PERIOD_DAYS", *value);
    }
    if (auto value = getEnv("LEDGER_AGENT_COMMISSION_PERCENT")) {
        policy_.defaultAgentCommissionRate = parseRate("LEDGER_AGENT_COMMISSION_PERCENT", *value);
    }
    if (auto value = getEnv("LEDGER_BROKER_COMMISSION_PERCENT")) {
        policy_.defaultBrokerCommissionRate = parseRate("LEDGER_BROKER_COMMISSION_PERCENT", *value);
    }
}

std::string LedgerSettings::getEnvOrDefault(const char* name, const char* defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string(defaultValue);
}

std::optional<std::string> LedgerSettings::getEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::optional<std::string>(value) : std::nullopt;
}

} // namespace realty::settings
