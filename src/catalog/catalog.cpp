#include <quarry/catalog/catalog.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <utility>

namespace quarry::catalog {

auto fold_name(std::string_view name) -> std::string {
    std::string out;
    out.reserve(name.size());
    for (char ch : name) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return out;
}

auto TypeDescriptor::find(std::string_view column) const -> const FieldDescriptor* {
    if (auto it = lookup_.find(fold_name(column)); it != lookup_.end()) {
        return &fields[it->second];
    }
    return nullptr;
}

auto Catalog::register_type(std::string type_name, std::string cache_name,
                            std::vector<FieldSpec> fields, TypeOptions options)
    -> Result<const TypeDescriptor*> {
    if (type_name.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidField, "type name must not be empty"));
    }
    auto folded = fold_name(type_name);
    if (by_name_.contains(folded)) {
        return std::unexpected(
            make_error(ErrorCode::DuplicateType,
                       fmt::format("type '{}' is already registered", type_name), type_name));
    }
    if (fields.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidField, fmt::format("type '{}' declares no fields", type_name),
            type_name));
    }

    auto descriptor = std::make_unique<TypeDescriptor>();
    descriptor->name = type_name;
    descriptor->cache_name = std::move(cache_name);
    descriptor->fields.reserve(fields.size());
    for (auto& spec : fields) {
        if (spec.name.empty()) {
            return std::unexpected(make_error(
                ErrorCode::InvalidField,
                fmt::format("type '{}': field #{} has no name", type_name,
                            descriptor->fields.size()),
                type_name));
        }
        if (!spec.get) {
            return std::unexpected(make_error(
                ErrorCode::InvalidField,
                fmt::format("type '{}': field '{}' has no accessor", type_name, spec.name),
                spec.name));
        }
        if (spec.type == ValueKind::Null) {
            return std::unexpected(make_error(
                ErrorCode::InvalidField,
                fmt::format("type '{}': field '{}' has no semantic type", type_name, spec.name),
                spec.name));
        }
        const auto position = descriptor->fields.size();
        auto [_, inserted] = descriptor->lookup_.emplace(fold_name(spec.name), position);
        if (!inserted) {
            return std::unexpected(make_error(
                ErrorCode::InvalidField,
                fmt::format("type '{}': duplicate column '{}'", type_name, spec.name), spec.name));
        }
        descriptor->fields.push_back(FieldDescriptor{
            .name = std::move(spec.name),
            .type = spec.type,
            .index = spec.index,
            .position = position,
            .get = std::move(spec.get),
            .set = std::move(spec.set),
        });
    }

    auto placement_column = [&](const std::optional<std::string>& column,
                                std::string_view role) -> Result<std::optional<std::size_t>> {
        if (!column.has_value()) {
            return std::nullopt;
        }
        const auto* field = descriptor->find(*column);
        if (field == nullptr) {
            return std::unexpected(make_error(
                ErrorCode::InvalidField,
                fmt::format("type '{}': {} column '{}' is not a field", type_name, role, *column),
                *column));
        }
        return field->position;
    };
    auto affinity = placement_column(options.affinity_column, "affinity");
    if (!affinity) {
        return std::unexpected(affinity.error());
    }
    auto key = placement_column(options.key_column, "key");
    if (!key) {
        return std::unexpected(key.error());
    }
    descriptor->has_affinity_column = affinity->has_value();
    descriptor->placement_field = affinity->has_value() ? *affinity : *key;

    spdlog::debug("catalog: registered type '{}' in cache '{}' ({} columns)", descriptor->name,
                  descriptor->cache_name, descriptor->fields.size());

    by_name_.emplace(std::move(folded), types_.size());
    types_.push_back(std::move(descriptor));
    return types_.back().get();
}

auto Catalog::find_type(std::string_view type_name) const -> const TypeDescriptor* {
    if (auto it = by_name_.find(fold_name(type_name)); it != by_name_.end()) {
        return types_[it->second].get();
    }
    return nullptr;
}

auto Catalog::resolve(std::string_view type_name, std::string_view column) const
    -> Result<const FieldDescriptor*> {
    const auto* type = find_type(type_name);
    if (type == nullptr) {
        return std::unexpected(make_error(ErrorCode::UnresolvedTable,
                                          fmt::format("unknown type '{}'", type_name),
                                          std::string(type_name)));
    }
    const auto* field = type->find(column);
    if (field == nullptr) {
        return std::unexpected(
            make_error(ErrorCode::UnknownColumn,
                       fmt::format("type '{}' has no column '{}'", type->name, column),
                       fmt::format("{}.{}", type->name, column)));
    }
    return field;
}

auto Catalog::types() const -> std::vector<const TypeDescriptor*> {
    std::vector<const TypeDescriptor*> out;
    out.reserve(types_.size());
    for (const auto& type : types_) {
        out.push_back(type.get());
    }
    return out;
}

auto Catalog::types_in_cache(std::string_view cache_name) const
    -> std::vector<const TypeDescriptor*> {
    const auto folded = fold_name(cache_name);
    std::vector<const TypeDescriptor*> out;
    for (const auto& type : types_) {
        if (fold_name(type->cache_name) == folded) {
            out.push_back(type.get());
        }
    }
    return out;
}

}  // namespace quarry::catalog
