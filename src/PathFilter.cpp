/**
 * @file PathFilter.cpp
 * @brief Implementation of qualified paths and include/exclude rules
 */

#include "structmerge/PathFilter.hpp"

namespace structmerge {

std::string qualify(const std::string& prefix, const std::string& name) {
    return prefix + name;
}

std::string nested_prefix(const std::string& path) {
    return path + ".";
}

bool is_top_level(const std::string& path) {
    return path.find('.') == std::string::npos;
}

PathFilter::PathFilter(const MergeOptions& options)
    : PathFilter(options.include, options.exclude)
{}

PathFilter::PathFilter(const std::vector<std::string>& include,
                       const std::vector<std::string>& exclude)
    : include_(include.begin(), include.end())
    , exclude_(exclude.begin(), exclude.end())
{}

bool PathFilter::includes(const std::string& path) const {
    if (include_.empty()) {
        return true;
    }

    if (include_.count(path) > 0) {
        return true;
    }

    // Nested include entries pull their top-level ancestor in by prefix.
    if (is_top_level(path)) {
        for (const auto& key : include_) {
            if (key.compare(0, path.size(), path) == 0) {
                return true;
            }
        }
    }

    return false;
}

bool PathFilter::excludes(const std::string& path) const {
    return exclude_.count(path) > 0;
}

namespace {
    void collect_paths(const TypeDescriptor& type, const std::string& prefix,
                       std::vector<std::string>& out) {
        for (const auto& field : type.fields) {
            const std::string path = qualify(prefix, field.name);
            out.push_back(path);

            const TypeDescriptor& field_type = field.type();
            if (field_type.is_record() && !field_type.atomic && !field_type.custom_merge) {
                collect_paths(field_type, nested_prefix(path), out);
            }
        }
    }
}

std::vector<std::string> field_paths(const TypeDescriptor& type) {
    std::vector<std::string> paths;
    if (type.is_record() && !type.atomic && !type.custom_merge) {
        collect_paths(type, "", paths);
    }
    return paths;
}

} // namespace structmerge
