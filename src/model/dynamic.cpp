#include "model/dynamic.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "model/adapters.hpp"
#include "util/strings.hpp"

namespace model {
namespace {

// Type identities of the array and object views over a Json::Value.
struct JsonArrayView {};
struct JsonObjectView {};

template <typename T>
Value owned(T v) {
    auto holder = std::make_shared<const T>(std::move(v));
    return Value(&adapter_for<T>(), std::shared_ptr<const void>(std::move(holder)));
}

const Json::Value& get(const void* obj) noexcept { return *static_cast<const Json::Value*>(obj); }

std::string render_json(const Json::Value& v) {
    switch (v.type()) {
    case Json::nullValue:
        return "<nil>";
    case Json::booleanValue:
        return v.asBool() ? "true" : "false";
    case Json::intValue:
    case Json::uintValue:
    case Json::realValue:
        return util::format_double(v.asDouble());
    case Json::stringValue:
        return v.asString();
    case Json::arrayValue: {
        std::string out = "[";
        for (Json::ArrayIndex i = 0; i < v.size(); ++i) {
            if (i != 0) {
                out += ", ";
            }
            out += render_json(v[i]);
        }
        out += "]";
        return out;
    }
    case Json::objectValue: {
        std::string out = "{";
        bool first = true;
        for (const auto& name : v.getMemberNames()) {
            if (!first) {
                out += ", ";
            }
            first = false;
            out += name;
            out += ": ";
            out += render_json(v[name]);
        }
        out += "}";
        return out;
    }
    }
    return "<unknown>";
}

class JsonArrayAdapter final : public TypeAdapter {
public:
    Kind kind() const noexcept override { return Kind::Sequence; }
    std::type_index type() const noexcept override { return typeid(JsonArrayView); }
    std::string_view name() const noexcept override { return {}; }
    std::string render(const void* obj) const override { return render_json(get(obj)); }

    bool sized() const noexcept override { return true; }
    std::size_t size(const void* obj) const override { return get(obj).size(); }

    Value element(const void* obj, std::size_t index) const override {
        return Value::of(get(obj)[static_cast<Json::ArrayIndex>(index)]);
    }
};

class JsonObjectAdapter final : public TypeAdapter {
public:
    Kind kind() const noexcept override { return Kind::Map; }
    std::type_index type() const noexcept override { return typeid(JsonObjectView); }
    std::string_view name() const noexcept override { return {}; }
    std::string render(const void* obj) const override { return render_json(get(obj)); }

    bool sized() const noexcept override { return true; }
    std::size_t size(const void* obj) const override { return get(obj).size(); }

    std::vector<Value> keys(const void* obj) const override {
        std::vector<Value> out;
        for (auto& name : get(obj).getMemberNames()) {
            out.push_back(owned(std::move(name)));
        }
        return out;
    }

    Value lookup(const void* obj, const Value& key) const override {
        const auto* k = key.get_if<std::string>();
        if (k == nullptr) {
            throw std::logic_error("model: JSON member lookup with a key of type " + key.type_label());
        }
        const Json::Value* member = get(obj).find(k->data(), k->data() + k->size());
        if (member == nullptr) {
            return Value::of(Json::Value::nullSingleton());
        }
        return Value::of(*member);
    }
};

const TypeAdapter& json_array_adapter() noexcept {
    static const JsonArrayAdapter adapter{};
    return adapter;
}

const TypeAdapter& json_object_adapter() noexcept {
    static const JsonObjectAdapter adapter{};
    return adapter;
}

class DynamicAdapter final : public TypeAdapter {
public:
    Kind kind() const noexcept override { return Kind::Dynamic; }
    std::type_index type() const noexcept override { return typeid(Json::Value); }
    std::string_view name() const noexcept override { return {}; }
    std::string render(const void* obj) const override { return render_json(get(obj)); }

    bool equals(const void* a, const void* b) const override { return get(a) == get(b); }

    bool nullable() const noexcept override { return true; }
    bool is_null(const void* obj) const noexcept override { return get(obj).isNull(); }

    Value payload(const void* obj) const override {
        const Json::Value& v = get(obj);
        switch (v.type()) {
        case Json::stringValue:
            return owned(v.asString());
        case Json::intValue:
        case Json::uintValue:
        case Json::realValue:
            return owned(v.asDouble());
        case Json::booleanValue:
            return owned(v.asBool());
        case Json::arrayValue:
            return Value(&json_array_adapter(), obj);
        case Json::objectValue:
            return Value(&json_object_adapter(), obj);
        case Json::nullValue:
            break;
        }
        return Value{};
    }
};

} // namespace

const TypeAdapter& dynamic_adapter() noexcept {
    static const DynamicAdapter adapter{};
    return adapter;
}

} // namespace model
