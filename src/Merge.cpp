/**
 * @file Merge.cpp
 * @brief Implementation of the recursive record merge
 */

#include "structmerge/Merge.hpp"
#include "structmerge/Log.hpp"
#include "structmerge/PathFilter.hpp"
#include "structmerge/Snapshot.hpp"
#include <exception>
#include <memory>
#include <string>

namespace structmerge {

namespace {
    /**
     * @brief Per-call state shared by every recursion level
     */
    struct MergeContext {
        const MergeOptions& options;
        PathFilter filter;
        std::shared_ptr<spdlog::logger> logger;
    };

    bool should_assign(MergePolicy policy, const TypeDescriptor& type,
                       const void* destination, const void* source) {
        switch (policy) {
            case MergePolicy::IncludeAll:
                return true;
            case MergePolicy::ExcludeEmpty:
                return !type.is_empty(source);
            case MergePolicy::OverwriteEmpty:
                return type.is_empty(destination);
        }
        return true;
    }

    void merge_field_override(MergeContext& ctx, const std::string& path,
                              const TypeDescriptor& type,
                              void* destination, const void* source) {
        STRUCTMERGE_DEBUG(*ctx.logger, "field '{}': delegating to custom merge of '{}'",
                          path, type.name);
        if (ctx.options.field_override_errors == OverrideErrors::Propagate) {
            type.custom_merge(destination, SourceRef(source, type));
            return;
        }

        try {
            type.custom_merge(destination, SourceRef(source, type));
        } catch (const std::exception& e) {
            ctx.logger->warn("field '{}': custom merge of '{}' failed, continuing: {}",
                            path, type.name, e.what());
        }
    }

    void merge_record(MergeContext& ctx, void* destination, const void* source,
                      const TypeDescriptor& type, const std::string& prefix) {
        // Atomic values have no meaningful empty sub-fields.
        if (type.atomic) {
            if (type.assign) {
                type.assign(destination, source);
            }
            return;
        }

        if (type.custom_merge) {
            STRUCTMERGE_DEBUG(*ctx.logger, "record '{}': delegating to custom merge", type.name);
            type.custom_merge(destination, SourceRef(source, type));
            return;
        }

        for (const auto& field : type.fields) {
            const std::string path = qualify(prefix, field.name);

            if (!ctx.filter.includes(path)) {
                STRUCTMERGE_DEBUG(*ctx.logger, "field '{}': not included, skipped", path);
                continue;
            }
            if (ctx.filter.excludes(path)) {
                STRUCTMERGE_DEBUG(*ctx.logger, "field '{}': excluded, skipped", path);
                continue;
            }
            if (!field.settable) {
                STRUCTMERGE_DEBUG(*ctx.logger, "field '{}': read-only, skipped", path);
                continue;
            }

            const TypeDescriptor& field_type = field.type();
            void* dst_field = field.access(destination);
            const void* src_field = field.read(source);

            if (field_type.custom_merge) {
                merge_field_override(ctx, path, field_type, dst_field, src_field);
                continue;
            }

            if (field_type.is_record()) {
                merge_record(ctx, dst_field, src_field, field_type, nested_prefix(path));
                continue;
            }

            if (!field_type.settable()) {
                STRUCTMERGE_DEBUG(*ctx.logger, "field '{}': type '{}' is not assignable, skipped",
                                  path, field_type.name);
                continue;
            }

            if (should_assign(ctx.options.policy, field_type, dst_field, src_field)) {
                STRUCTMERGE_TRACE(*ctx.logger, "field '{}': assigned {}", path,
                                  snapshot(src_field, field_type).dump());
                field_type.assign(dst_field, src_field);
            }
        }
    }
}

bool is_empty(const void* value, const TypeDescriptor& type) {
    return type.is_empty(value);
}

namespace detail {

void merge_root(void* destination, const TypeDescriptor& destination_type,
                const void* source, const TypeDescriptor& source_type,
                const MergeOptions& options) {
    if (destination == nullptr) {
        throw InvalidDestination(destination_type.name + "*");
    }

    const TypeDescriptor* record_type = &destination_type;
    if (destination_type.category == Category::Indirection) {
        if (destination_type.element == nullptr || !destination_type.element().is_record() ||
            destination_type.materialize == nullptr) {
            throw InvalidDestination(destination_type.name);
        }
        destination = destination_type.materialize(destination);
        if (destination == nullptr) {
            throw InvalidDestination(destination_type.name);
        }
        record_type = &destination_type.element();
    } else if (!destination_type.is_record()) {
        throw InvalidDestination(destination_type.name);
    }

    if (!source_type.is_record()) {
        throw InvalidSource(source_type.name);
    }

    if (record_type->id != source_type.id) {
        throw TypeMismatch(record_type->name, source_type.name);
    }

    MergeContext ctx{options, PathFilter(options), log::logger()};
    merge_record(ctx, destination, source, *record_type, "");
}

} // namespace detail

} // namespace structmerge
