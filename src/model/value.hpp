#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace model {

// Structural kind shared by both sides of a comparison position.
enum class Kind : std::uint8_t {
    Scalar,     // numeric, boolean, enum or textual leaf
    Nullable,   // pointer-like or optional reference
    Sequence,   // variable length, uniform element type
    FixedArray, // compile-time length, uniform element type
    Record,     // named fields in declaration order
    Map,        // scalar keys, uniform value type
    Dynamic     // concrete kind known only at runtime
};

const char* kind_name(Kind kind) noexcept;

class Value;
struct Field;
class TypeAdapter;

// Declared name of the adapted type, otherwise its demangled C++ name.
std::string type_label(const TypeAdapter& adapter);

// Per-type accessor table. One immutable instance exists per adapted C++ type;
// handles refer to it by pointer. Accessors a kind does not provide throw
// std::logic_error.
class TypeAdapter {
public:
    virtual ~TypeAdapter() = default;

    virtual Kind kind() const noexcept = 0;
    virtual std::type_index type() const noexcept = 0;
    // Declared name, empty for anonymous types (containers, pointers, dynamic trees).
    virtual std::string_view name() const noexcept = 0;
    virtual std::string render(const void* obj) const = 0;

    virtual bool textual() const noexcept { return false; }
    virtual std::string_view text(const void* obj) const;
    virtual bool equals(const void* a, const void* b) const;

    // Whether values of this type may be absent. is_null is false for others.
    virtual bool nullable() const noexcept { return false; }
    virtual bool is_null(const void* /*obj*/) const noexcept { return false; }
    virtual const TypeAdapter* target() const { return nullptr; }
    virtual Value deref(const void* obj) const;

    // Whether the type has a length (containers and textual scalars).
    virtual bool sized() const noexcept { return false; }
    virtual std::size_t size(const void* obj) const;
    virtual Value element(const void* obj, std::size_t index) const;

    // Identity of whatever backs the value; equal storage means equal content.
    virtual const void* storage(const void* obj) const noexcept { return obj; }

    virtual std::vector<Field> fields(const void* obj) const;

    virtual std::vector<Value> keys(const void* obj) const;
    // Absent keys resolve to an owned zero value of the mapped type.
    virtual Value lookup(const void* obj, const Value& key) const;

    // Concrete value of a dynamic node; an invalid handle when the node holds
    // nothing comparable.
    virtual Value payload(const void* obj) const;
};

// Read-only handle to one side of a comparison position. Handles never own the
// referenced object, except for temporaries produced by the adapter (zero
// values), which are kept alive by every handle derived from them.
class Value {
public:
    Value() = default;
    Value(const TypeAdapter* adapter, const void* obj) noexcept
        : adapter_(adapter), obj_(obj) {}
    Value(const TypeAdapter* adapter, std::shared_ptr<const void> owned) noexcept
        : adapter_(adapter), obj_(owned.get()), owner_(std::move(owned)) {}

    // Defined in model/adapters.hpp.
    template <typename T>
    static Value of(const T& obj);

    bool valid() const noexcept { return adapter_ != nullptr && obj_ != nullptr; }
    explicit operator bool() const noexcept { return valid(); }

    const TypeAdapter& adapter() const;
    const void* address() const noexcept { return obj_; }

    Kind kind() const { return adapter().kind(); }
    std::type_index type() const { return adapter().type(); }
    std::string_view type_name() const { return adapter().name(); }
    // Declared name when present, otherwise the implementation type name.
    std::string type_label() const;
    bool same_type(const Value& other) const;

    std::string render() const { return adapter().render(obj_); }
    bool textual() const { return adapter().textual(); }
    std::string_view text() const { return adapter().text(obj_); }
    bool equals(const Value& other) const;

    bool nullable() const { return adapter().nullable(); }
    bool is_null() const { return adapter().is_null(obj_); }
    Value deref() const;

    bool sized() const { return adapter().sized(); }
    std::size_t size() const { return adapter().size(obj_); }
    Value element(std::size_t index) const;
    const void* storage() const { return adapter().storage(obj_); }

    std::vector<Field> fields() const;
    std::vector<Value> keys() const;
    Value lookup(const Value& key) const;
    Value payload() const;

    template <typename T>
    const T* get_if() const noexcept {
        if (!valid() || adapter_->type() != std::type_index(typeid(T))) {
            return nullptr;
        }
        return static_cast<const T*>(obj_);
    }

private:
    Value adopt(Value child) const;

    const TypeAdapter* adapter_{nullptr};
    const void* obj_{nullptr};
    std::shared_ptr<const void> owner_{};
};

struct Field {
    std::string_view name;
    Value value;
};

} // namespace model
