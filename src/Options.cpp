/**
 * @file Options.cpp
 * @brief Implementation of policy names and option conversions
 */

#include "structmerge/Options.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace structmerge {

namespace {
    std::string to_lower(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                      [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    /**
     * @brief Strip '_' and '-' so "exclude_empty" and "ExcludeEmpty" compare equal
     */
    std::string normalize(const std::string& name) {
        std::string result;
        for (char c : to_lower(name)) {
            if (c != '_' && c != '-') {
                result += c;
            }
        }
        return result;
    }

    std::string override_errors_name(OverrideErrors mode) {
        return mode == OverrideErrors::Ignore ? "ignore" : "propagate";
    }

    OverrideErrors parse_override_errors(const std::string& name) {
        const std::string lower = to_lower(name);
        if (lower == "propagate") return OverrideErrors::Propagate;
        if (lower == "ignore") return OverrideErrors::Ignore;
        throw std::invalid_argument("Unknown field_override_errors mode: '" + name + "'");
    }
}

std::string policy_name(MergePolicy policy) {
    switch (policy) {
        case MergePolicy::IncludeAll: return "include_all";
        case MergePolicy::ExcludeEmpty: return "exclude_empty";
        case MergePolicy::OverwriteEmpty: return "overwrite_empty";
    }
    return "unknown";
}

MergePolicy parse_policy(const std::string& name) {
    const std::string key = normalize(name);
    if (key == "includeall") return MergePolicy::IncludeAll;
    if (key == "excludeempty") return MergePolicy::ExcludeEmpty;
    if (key == "overwriteempty") return MergePolicy::OverwriteEmpty;
    throw std::invalid_argument("Unknown merge policy: '" + name + "'");
}

void to_json(Value& j, MergePolicy policy) {
    j = policy_name(policy);
}

void from_json(const Value& j, MergePolicy& policy) {
    policy = parse_policy(j.get<std::string>());
}

void to_json(Value& j, const MergeOptions& options) {
    j = Value{
        {"policy", policy_name(options.policy)},
        {"include", options.include},
        {"exclude", options.exclude},
        {"field_override_errors", override_errors_name(options.field_override_errors)}
    };
}

void from_json(const Value& j, MergeOptions& options) {
    if (!j.is_object()) {
        throw std::invalid_argument("MergeOptions must be a JSON object, got " +
                                    std::string(j.type_name()));
    }

    MergeOptions result;
    if (j.contains("policy")) {
        j.at("policy").get_to(result.policy);
    }
    if (j.contains("include")) {
        j.at("include").get_to(result.include);
    }
    if (j.contains("exclude")) {
        j.at("exclude").get_to(result.exclude);
    }
    if (j.contains("field_override_errors")) {
        result.field_override_errors =
            parse_override_errors(j.at("field_override_errors").get<std::string>());
    }
    options = std::move(result);
}

} // namespace structmerge
