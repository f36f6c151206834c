#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "model/dynamic.hpp"
#include "model/value.hpp"
#include "util/strings.hpp"

// Adapters bind C++ types to the structural kinds the traversal understands.
//
// Built-in coverage:
//   Scalar     arithmetic types, enums, std::string, std::string_view
//   Nullable   T*, std::unique_ptr<T>, std::shared_ptr<T>, std::optional<T>;
//              const char* and char* are C strings whose referent is the whole
//              text, compared and trimmed as a std::string_view
//   Sequence   std::vector<T> (except std::vector<bool>), std::deque<T>
//   FixedArray std::array<T, N>, T[N]
//   Map        std::map<K, V>, std::unordered_map<K, V> with scalar K
//   Dynamic    Json::Value
//   Record     any type with an ADL-visible
//                  template <class In> void introspect(In&& inspect, const T& v);
//              calling inspect(member, "Name") once per field in declaration order.
//              An optional ADL-visible
//                  std::string_view introspect_name(const T*);
//              gives the declared name used for the root field path.

namespace model {

template <typename T>
const TypeAdapter& adapter_for();

namespace detail {

template <typename>
inline constexpr bool dependent_false_v = false;

struct IntrospectVisitor {
    template <typename M>
    void operator()(const M&, std::string_view) const noexcept {}
};

template <typename T, typename = void>
struct has_introspect : std::false_type {};

template <typename T>
struct has_introspect<T, std::void_t<decltype(introspect(std::declval<IntrospectVisitor&>(),
                                                         std::declval<const T&>()))>>
    : std::true_type {};

template <typename T, typename = void>
struct has_introspect_name : std::false_type {};

template <typename T>
struct has_introspect_name<T, std::void_t<decltype(std::string_view(
                                  introspect_name(std::declval<const T*>())))>>
    : std::true_type {};

template <typename T>
std::string_view declared_name() noexcept {
    if constexpr (has_introspect_name<T>::value) {
        return std::string_view(introspect_name(static_cast<const T*>(nullptr)));
    } else {
        return {};
    }
}

template <typename T>
struct is_text : std::bool_constant<std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>> {};

template <typename T>
struct is_scalar
    : std::bool_constant<std::is_arithmetic_v<T> || std::is_enum_v<T> || is_text<T>::value> {};

template <typename T>
struct is_sequence : std::false_type {};
template <typename T, typename A>
struct is_sequence<std::vector<T, A>> : std::true_type {
    static_assert(!std::is_same_v<T, bool>, "std::vector<bool> has no addressable elements");
};
template <typename T, typename A>
struct is_sequence<std::deque<T, A>> : std::true_type {};

template <typename T>
struct is_fixed_array : std::false_type {};
template <typename T, std::size_t N>
struct is_fixed_array<std::array<T, N>> : std::true_type {};
template <typename T, std::size_t N>
struct is_fixed_array<T[N]> : std::true_type {};

template <typename T>
struct is_map : std::false_type {};
template <typename K, typename V, typename C, typename A>
struct is_map<std::map<K, V, C, A>> : std::true_type {};
template <typename K, typename V, typename H, typename E, typename A>
struct is_map<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template <typename T>
struct is_c_string : std::bool_constant<std::is_same_v<T, const char*> || std::is_same_v<T, char*>> {};

// Referent access for pointer-like types.
template <typename P>
struct pointer_like : std::false_type {};

template <typename T>
struct pointer_like<T*> : std::true_type {
    using target = std::remove_cv_t<T>;
    static const target* get(T* const& p) noexcept { return p; }
};

template <typename T, typename D>
struct pointer_like<std::unique_ptr<T, D>> : std::true_type {
    using target = std::remove_cv_t<T>;
    static const target* get(const std::unique_ptr<T, D>& p) noexcept { return p.get(); }
};

template <typename T>
struct pointer_like<std::shared_ptr<T>> : std::true_type {
    using target = std::remove_cv_t<T>;
    static const target* get(const std::shared_ptr<T>& p) noexcept { return p.get(); }
};

template <typename T>
struct pointer_like<std::optional<T>> : std::true_type {
    using target = std::remove_cv_t<T>;
    static const target* get(const std::optional<T>& p) noexcept { return p ? &*p : nullptr; }
};

template <typename T>
std::string_view scalar_name() noexcept {
    if constexpr (has_introspect_name<T>::value) {
        return declared_name<T>();
    } else if constexpr (std::is_same_v<T, bool>) {
        return "bool";
    } else if constexpr (std::is_same_v<T, char>) {
        return "char";
    } else if constexpr (std::is_integral_v<T>) {
        constexpr bool is_signed = std::is_signed_v<T>;
        switch (sizeof(T)) {
        case 1: return is_signed ? "int8" : "uint8";
        case 2: return is_signed ? "int16" : "uint16";
        case 4: return is_signed ? "int32" : "uint32";
        default: return is_signed ? "int64" : "uint64";
        }
    } else if constexpr (std::is_same_v<T, float>) {
        return "float32";
    } else if constexpr (std::is_floating_point_v<T>) {
        return "float64";
    } else if constexpr (std::is_same_v<T, std::string>) {
        return "string";
    } else if constexpr (std::is_same_v<T, std::string_view>) {
        return "string_view";
    } else {
        return {};
    }
}

template <typename T>
std::string render_scalar(const T& v) {
    if constexpr (std::is_same_v<T, bool>) {
        return v ? "true" : "false";
    } else if constexpr (std::is_same_v<T, char>) {
        return std::string(1, v);
    } else if constexpr (std::is_integral_v<T>) {
        return util::format_integer(v);
    } else if constexpr (std::is_floating_point_v<T>) {
        return util::format_double(static_cast<double>(v));
    } else if constexpr (std::is_enum_v<T>) {
        return util::format_integer(static_cast<std::underlying_type_t<T>>(v));
    } else {
        return std::string(v);
    }
}

template <typename Range>
std::string render_elements(const Range& range) {
    std::string out = "[";
    bool first = true;
    for (const auto& e : range) {
        if (!first) {
            out += ", ";
        }
        first = false;
        out += Value::of(e).render();
    }
    out += "]";
    return out;
}

template <typename T>
class ScalarAdapter final : public TypeAdapter {
public:
    Kind kind() const noexcept override { return Kind::Scalar; }
    std::type_index type() const noexcept override { return typeid(T); }
    std::string_view name() const noexcept override { return scalar_name<T>(); }
    std::string render(const void* obj) const override { return render_scalar(get(obj)); }

    bool textual() const noexcept override { return is_text<T>::value; }

    std::string_view text(const void* obj) const override {
        if constexpr (is_text<T>::value) {
            return std::string_view(get(obj));
        } else {
            return TypeAdapter::text(obj);
        }
    }

    bool equals(const void* a, const void* b) const override { return get(a) == get(b); }

    bool sized() const noexcept override { return is_text<T>::value; }

    std::size_t size(const void* obj) const override {
        if constexpr (is_text<T>::value) {
            return get(obj).size();
        } else {
            return TypeAdapter::size(obj);
        }
    }

private:
    static const T& get(const void* obj) noexcept { return *static_cast<const T*>(obj); }
};

template <typename P>
class NullableAdapter final : public TypeAdapter {
    using Traits = pointer_like<P>;
    using Target = typename Traits::target;

public:
    Kind kind() const noexcept override { return Kind::Nullable; }
    std::type_index type() const noexcept override { return typeid(P); }
    std::string_view name() const noexcept override { return {}; }

    std::string render(const void* obj) const override {
        const Target* ref = Traits::get(get(obj));
        if (ref == nullptr) {
            return "<nil>";
        }
        return Value::of(*ref).render();
    }

    bool nullable() const noexcept override { return true; }
    bool is_null(const void* obj) const noexcept override { return Traits::get(get(obj)) == nullptr; }
    const TypeAdapter* target() const override { return &adapter_for<Target>(); }

    Value deref(const void* obj) const override {
        const Target* ref = Traits::get(get(obj));
        if (ref == nullptr) {
            return Value{};
        }
        return Value::of(*ref);
    }

    const void* storage(const void* obj) const noexcept override { return Traits::get(get(obj)); }

private:
    static const P& get(const void* obj) noexcept { return *static_cast<const P*>(obj); }
};

// NUL-terminated text behind a char pointer. A null pointer is an absent value;
// otherwise the referent is the text up to the terminator.
template <typename P>
class CStringAdapter final : public TypeAdapter {
public:
    Kind kind() const noexcept override { return Kind::Nullable; }
    std::type_index type() const noexcept override { return typeid(P); }
    std::string_view name() const noexcept override { return {}; }

    std::string render(const void* obj) const override {
        const char* p = get(obj);
        return p == nullptr ? std::string("<nil>") : std::string(p);
    }

    bool nullable() const noexcept override { return true; }
    bool is_null(const void* obj) const noexcept override { return get(obj) == nullptr; }
    const TypeAdapter* target() const override { return &adapter_for<std::string_view>(); }

    Value deref(const void* obj) const override {
        const char* p = get(obj);
        if (p == nullptr) {
            return Value{};
        }
        auto text = std::make_shared<const std::string_view>(p);
        return Value(&adapter_for<std::string_view>(), std::shared_ptr<const void>(std::move(text)));
    }

    const void* storage(const void* obj) const noexcept override { return get(obj); }

private:
    static const char* get(const void* obj) noexcept { return *static_cast<const P*>(obj); }
};

template <typename C>
class SequenceAdapter final : public TypeAdapter {
public:
    Kind kind() const noexcept override { return Kind::Sequence; }
    std::type_index type() const noexcept override { return typeid(C); }
    std::string_view name() const noexcept override { return {}; }
    std::string render(const void* obj) const override { return render_elements(get(obj)); }

    bool sized() const noexcept override { return true; }
    std::size_t size(const void* obj) const override { return get(obj).size(); }

    Value element(const void* obj, std::size_t index) const override {
        return Value::of(get(obj)[index]);
    }

private:
    static const C& get(const void* obj) noexcept { return *static_cast<const C*>(obj); }
};

template <typename A>
class FixedArrayAdapter final : public TypeAdapter {
public:
    Kind kind() const noexcept override { return Kind::FixedArray; }
    std::type_index type() const noexcept override { return typeid(A); }
    std::string_view name() const noexcept override { return {}; }
    std::string render(const void* obj) const override { return render_elements(get(obj)); }

    bool sized() const noexcept override { return true; }
    std::size_t size(const void* obj) const override { return std::size(get(obj)); }

    Value element(const void* obj, std::size_t index) const override {
        return Value::of(get(obj)[index]);
    }

private:
    static const A& get(const void* obj) noexcept { return *static_cast<const A*>(obj); }
};

template <typename M>
class MapAdapter final : public TypeAdapter {
    using Key = typename M::key_type;
    using Mapped = typename M::mapped_type;
    static_assert(is_scalar<Key>::value, "map keys must be scalar");

public:
    Kind kind() const noexcept override { return Kind::Map; }
    std::type_index type() const noexcept override { return typeid(M); }
    std::string_view name() const noexcept override { return {}; }

    std::string render(const void* obj) const override {
        std::string out = "{";
        bool first = true;
        for (const auto& [k, v] : get(obj)) {
            if (!first) {
                out += ", ";
            }
            first = false;
            out += render_scalar(k);
            out += ": ";
            out += Value::of(v).render();
        }
        out += "}";
        return out;
    }

    bool sized() const noexcept override { return true; }
    std::size_t size(const void* obj) const override { return get(obj).size(); }

    std::vector<Value> keys(const void* obj) const override {
        const M& m = get(obj);
        std::vector<Value> out;
        out.reserve(m.size());
        for (const auto& kv : m) {
            out.push_back(Value::of(kv.first));
        }
        return out;
    }

    Value lookup(const void* obj, const Value& key) const override {
        const Key* k = key.get_if<Key>();
        if (k == nullptr) {
            throw std::logic_error("model: map lookup with a key of type " + key.type_label());
        }
        const M& m = get(obj);
        const auto it = m.find(*k);
        if (it != m.end()) {
            return Value::of(it->second);
        }
        auto zero = std::make_shared<const Mapped>();
        return Value(&adapter_for<Mapped>(), std::shared_ptr<const void>(std::move(zero)));
    }

private:
    static const M& get(const void* obj) noexcept { return *static_cast<const M*>(obj); }
};

template <typename T>
class RecordAdapter final : public TypeAdapter {
public:
    Kind kind() const noexcept override { return Kind::Record; }
    std::type_index type() const noexcept override { return typeid(T); }
    std::string_view name() const noexcept override { return declared_name<T>(); }

    std::string render(const void* obj) const override {
        std::string out = "{";
        bool first = true;
        for (const auto& f : fields(obj)) {
            if (!first) {
                out += ", ";
            }
            first = false;
            out += f.name;
            out += ": ";
            out += f.value.render();
        }
        out += "}";
        return out;
    }

    std::vector<Field> fields(const void* obj) const override {
        std::vector<Field> out;
        const T& rec = *static_cast<const T*>(obj);
        introspect([&out](const auto& member, std::string_view field_name) {
            out.push_back(Field{field_name, Value::of(member)});
        }, rec);
        return out;
    }
};

} // namespace detail

template <typename T>
const TypeAdapter& adapter_for() {
    using U = std::remove_cv_t<T>;
    if constexpr (std::is_same_v<U, Json::Value>) {
        return dynamic_adapter();
    } else if constexpr (detail::is_c_string<U>::value) {
        static const detail::CStringAdapter<U> adapter{};
        return adapter;
    } else if constexpr (detail::pointer_like<U>::value) {
        static const detail::NullableAdapter<U> adapter{};
        return adapter;
    } else if constexpr (detail::is_fixed_array<U>::value) {
        static const detail::FixedArrayAdapter<U> adapter{};
        return adapter;
    } else if constexpr (detail::is_map<U>::value) {
        static const detail::MapAdapter<U> adapter{};
        return adapter;
    } else if constexpr (detail::is_sequence<U>::value) {
        static const detail::SequenceAdapter<U> adapter{};
        return adapter;
    } else if constexpr (detail::is_scalar<U>::value) {
        static const detail::ScalarAdapter<U> adapter{};
        return adapter;
    } else if constexpr (detail::has_introspect<U>::value) {
        static const detail::RecordAdapter<U> adapter{};
        return adapter;
    } else {
        static_assert(detail::dependent_false_v<U>,
                      "no structural adapter for this type; declare introspect() for records");
    }
}

template <typename T>
Value Value::of(const T& obj) {
    return Value(&adapter_for<T>(), static_cast<const void*>(std::addressof(obj)));
}

} // namespace model
