#pragma once

#include <quarry/core/error.hpp>
#include <quarry/core/value.hpp>

#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace quarry::catalog {

enum class IndexKind : std::uint8_t {
    None,
    Ordered,
    Hash,
};

/// Reads one field out of a stored object. Returns NULL if the payload is not
/// of the registered type.
using FieldGetter = std::function<Value(const std::any&)>;
/// Writes one field; false when the payload or value type does not fit.
using FieldSetter = std::function<bool(std::any&, const Value&)>;

/// Field declaration passed to `Catalog::register_type`.
struct FieldSpec {
    std::string name;
    ValueKind type = ValueKind::Int;
    IndexKind index = IndexKind::None;
    FieldGetter get;
    FieldSetter set;
};

/// Build a field spec from a data member pointer. The accessor pair is
/// resolved once here; no per-row lookup happens afterwards.
template <typename T, typename M>
[[nodiscard]] auto field(std::string name, M T::*member, IndexKind index = IndexKind::None)
    -> FieldSpec {
    return FieldSpec{
        .name = std::move(name),
        .type = kind_for<M>(),
        .index = index,
        .get = [member](const std::any& payload) -> Value {
            const auto* object = std::any_cast<T>(&payload);
            if (object == nullptr) {
                return Value{};
            }
            return Value{object->*member};
        },
        .set = [member](std::any& payload, const Value& value) -> bool {
            auto* object = std::any_cast<T>(&payload);
            if (object == nullptr) {
                return false;
            }
            auto converted = value_as<M>(value);
            if (!converted.has_value()) {
                return false;
            }
            object->*member = std::move(*converted);
            return true;
        },
    };
}

struct FieldDescriptor {
    std::string name;
    ValueKind type = ValueKind::Int;
    IndexKind index = IndexKind::None;
    std::size_t position = 0;
    FieldGetter get;
    FieldSetter set;

    [[nodiscard]] auto indexed() const noexcept -> bool { return index != IndexKind::None; }
};

/// Placement options for a registered type.
struct TypeOptions {
    /// Column equal to the key's affinity part (entries co-locate on it).
    std::optional<std::string> affinity_column;
    /// Column equal to the key id; decides placement when there is no affinity column.
    std::optional<std::string> key_column;
};

/// Catalog entry for one registered type. Immutable after registration.
struct TypeDescriptor {
    std::string name;
    std::string cache_name;
    std::vector<FieldDescriptor> fields;
    /// Field whose value decides which partition an entry lives in.
    std::optional<std::size_t> placement_field;
    /// True when placement comes from an explicit affinity column.
    bool has_affinity_column = false;

    [[nodiscard]] auto find(std::string_view column) const -> const FieldDescriptor*;
    [[nodiscard]] auto width() const noexcept -> std::size_t { return fields.size(); }

   private:
    friend class Catalog;
    std::unordered_map<std::string, std::size_t> lookup_;
};

/// Case-folded form used for every identifier comparison.
[[nodiscard]] auto fold_name(std::string_view name) -> std::string;

class Catalog {
   public:
    Catalog() = default;

    Catalog(const Catalog&) = delete;
    auto operator=(const Catalog&) -> Catalog& = delete;

    /// Register a type. Fails with DuplicateType if the name is taken and with
    /// InvalidField if a field is unusable.
    auto register_type(std::string type_name, std::string cache_name, std::vector<FieldSpec> fields,
                       TypeOptions options = {}) -> Result<const TypeDescriptor*>;

    [[nodiscard]] auto find_type(std::string_view type_name) const -> const TypeDescriptor*;

    /// Resolve a column of a registered type. Fails with UnresolvedTable or UnknownColumn.
    [[nodiscard]] auto resolve(std::string_view type_name, std::string_view column) const
        -> Result<const FieldDescriptor*>;

    /// Types in registration order.
    [[nodiscard]] auto types() const -> std::vector<const TypeDescriptor*>;
    [[nodiscard]] auto types_in_cache(std::string_view cache_name) const
        -> std::vector<const TypeDescriptor*>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return types_.size(); }

   private:
    std::vector<std::unique_ptr<TypeDescriptor>> types_;
    std::unordered_map<std::string, std::size_t> by_name_;
};

}  // namespace quarry::catalog
