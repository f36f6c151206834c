#include "model/value.hpp"

#include <cstdlib>
#include <cxxabi.h>
#include <stdexcept>

namespace model {
namespace {

[[noreturn]] void unsupported(const TypeAdapter& adapter, const char* op) {
    std::string msg = "model: ";
    msg += op;
    msg += " is not supported by ";
    msg += kind_name(adapter.kind());
    msg += " type ";
    msg += type_label(adapter);
    throw std::logic_error(msg);
}

} // namespace

const char* kind_name(Kind kind) noexcept {
    switch (kind) {
    case Kind::Scalar: return "scalar";
    case Kind::Nullable: return "nullable";
    case Kind::Sequence: return "sequence";
    case Kind::FixedArray: return "fixed array";
    case Kind::Record: return "record";
    case Kind::Map: return "map";
    case Kind::Dynamic: return "dynamic";
    }
    return "unknown";
}

std::string type_label(const TypeAdapter& adapter) {
    const auto declared = adapter.name();
    if (!declared.empty()) {
        return std::string(declared);
    }
    const char* mangled = adapter.type().name();
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), &std::free);
    if (status != 0 || !demangled) {
        return mangled;
    }
    return demangled.get();
}

std::string_view TypeAdapter::text(const void* /*obj*/) const { unsupported(*this, "text"); }

bool TypeAdapter::equals(const void* /*a*/, const void* /*b*/) const { unsupported(*this, "equals"); }

Value TypeAdapter::deref(const void* /*obj*/) const { unsupported(*this, "deref"); }

std::size_t TypeAdapter::size(const void* /*obj*/) const { unsupported(*this, "size"); }

Value TypeAdapter::element(const void* /*obj*/, std::size_t /*index*/) const { unsupported(*this, "element"); }

std::vector<Field> TypeAdapter::fields(const void* /*obj*/) const { unsupported(*this, "fields"); }

std::vector<Value> TypeAdapter::keys(const void* /*obj*/) const { unsupported(*this, "keys"); }

Value TypeAdapter::lookup(const void* /*obj*/, const Value& /*key*/) const { unsupported(*this, "lookup"); }

Value TypeAdapter::payload(const void* /*obj*/) const { unsupported(*this, "payload"); }

const TypeAdapter& Value::adapter() const {
    if (adapter_ == nullptr) {
        throw std::logic_error("model: access through an empty value handle");
    }
    return *adapter_;
}

std::string Value::type_label() const {
    if (adapter_ == nullptr) {
        return "<invalid>";
    }
    return model::type_label(*adapter_);
}

bool Value::same_type(const Value& other) const {
    return adapter().type() == other.adapter().type();
}

bool Value::equals(const Value& other) const {
    if (!same_type(other)) {
        return false;
    }
    return adapter().equals(obj_, other.obj_);
}

Value Value::adopt(Value child) const {
    if (owner_ && !child.owner_) {
        child.owner_ = owner_;
    }
    return child;
}

Value Value::deref() const { return adopt(adapter().deref(obj_)); }

Value Value::element(std::size_t index) const { return adopt(adapter().element(obj_, index)); }

std::vector<Field> Value::fields() const {
    auto out = adapter().fields(obj_);
    for (auto& f : out) {
        f.value = adopt(std::move(f.value));
    }
    return out;
}

std::vector<Value> Value::keys() const {
    auto out = adapter().keys(obj_);
    for (auto& k : out) {
        k = adopt(std::move(k));
    }
    return out;
}

Value Value::lookup(const Value& key) const { return adopt(adapter().lookup(obj_, key)); }

Value Value::payload() const { return adopt(adapter().payload(obj_)); }

} // namespace model
