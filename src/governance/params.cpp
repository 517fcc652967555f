// SHAREGOV - Governance Parameters Implementation
// Copyright (c) 2024 SHAREGOV Developers
// MIT License

#include <sharegov/governance/params.h>

#include <sstream>

namespace sharegov {
namespace governance {

namespace {

util::ConfigParseResult BadValue(const char* key, const std::string& detail) {
    return util::ConfigParseResult::Error(std::string("Invalid value for -") + key + ": " + detail);
}

} // namespace

util::ConfigParseResult GovernanceParams::FromConfig(const util::ConfigManager& config,
                                                     GovernanceParams& out) {
    using util::ConfigKeys::DEFAULTMODEL;
    using util::ConfigKeys::EVENTRETENTION;
    using util::ConfigKeys::GOVERNANCECLASS;
    using util::ConfigKeys::MAXDESCRIPTIONLENGTH;
    using util::ConfigKeys::MAXOPTIONS;
    using util::ConfigKeys::OPERATOR;

    GovernanceParams params = out;

    if (config.HasKey(GOVERNANCECLASS)) {
        auto value = config.TryGetUInt(GOVERNANCECLASS);
        if (!value) {
            return BadValue(GOVERNANCECLASS, "expected an unsigned integer");
        }
        params.governanceClass = *value;
    }

    if (config.HasKey(MAXDESCRIPTIONLENGTH)) {
        auto value = config.TryGetUInt(MAXDESCRIPTIONLENGTH);
        if (!value || *value == 0 || *value > MAX_DESCRIPTION_LENGTH_LIMIT) {
            return BadValue(MAXDESCRIPTIONLENGTH, "expected 1.." +
                            std::to_string(MAX_DESCRIPTION_LENGTH_LIMIT));
        }
        params.maxDescriptionLength = static_cast<size_t>(*value);
    }

    if (config.HasKey(MAXOPTIONS)) {
        auto value = config.TryGetUInt(MAXOPTIONS);
        if (!value || *value < 2 || *value > MAX_OPTIONS_LIMIT) {
            return BadValue(MAXOPTIONS, "expected 2.." + std::to_string(MAX_OPTIONS_LIMIT));
        }
        params.maxOptions = static_cast<size_t>(*value);
    }

    if (config.HasKey(DEFAULTMODEL)) {
        std::string name = config.GetString(DEFAULTMODEL, "");
        auto model = ParseGovernanceModel(name);
        if (!model) {
            return BadValue(DEFAULTMODEL, "unknown governance model '" + name + "'");
        }
        params.defaultModel = *model;
    }

    if (config.HasKey(EVENTRETENTION)) {
        auto value = config.TryGetUInt(EVENTRETENTION);
        if (!value) {
            return BadValue(EVENTRETENTION, "expected an unsigned integer");
        }
        params.eventRetention = static_cast<size_t>(*value);
    }

    if (config.HasKey(OPERATOR)) {
        params.operators.clear();
        for (const auto& op : config.GetList(OPERATOR)) {
            if (!IsValidHolderId(op)) {
                return BadValue(OPERATOR, "invalid operator id '" + op + "'");
            }
            params.operators.push_back(op);
        }
    }

    out = std::move(params);
    return util::ConfigParseResult::Success();
}

std::string GovernanceParams::ToString() const {
    std::ostringstream oss;
    oss << "GovernanceParams(class=" << governanceClass
        << ", maxDescription=" << maxDescriptionLength
        << ", maxOptions=" << maxOptions
        << ", model=" << GovernanceModelToString(defaultModel)
        << ", retention=" << eventRetention
        << ", operators=" << operators.size() << ")";
    return oss.str();
}

} // namespace governance
} // namespace sharegov
