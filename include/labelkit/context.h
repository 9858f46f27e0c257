#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>

namespace labelkit {

//=============================================================================
// Context - caller-supplied value that conditional content is tested against
//
// Type-erased and immutable. as<T>() is the only way back to the value and
// succeeds only when the stored type is exactly T.
//=============================================================================
class Context {
public:
    Context() = default;

    template<typename T>
    static Context of(T value) {
        using V = std::decay_t<T>;
        return Context(std::make_shared<const V>(std::move(value)), typeid(V));
    }

    // A shared_ptr<T> is shared, not copied, and matches T
    template<typename T>
    static Context of(std::shared_ptr<T> value) {
        return shared(std::move(value));
    }

    // Share an existing object; a null pointer yields an empty context
    template<typename T>
    static Context shared(std::shared_ptr<T> value) {
        if (!value) return Context();
        using V = std::remove_const_t<T>;
        return Context(std::shared_ptr<const void>(std::move(value)), typeid(V));
    }

    template<typename T>
    const T* as() const {
        if (!_value || _type != std::type_index(typeid(T))) return nullptr;
        return static_cast<const T*>(_value.get());
    }

    template<typename T>
    bool is() const { return as<T>() != nullptr; }

    bool empty() const { return !_value; }
    std::type_index type() const { return _type; }

private:
    Context(std::shared_ptr<const void> value, std::type_index type)
        : _value(std::move(value)), _type(type) {}

    std::shared_ptr<const void> _value;
    std::type_index _type = typeid(void);
};

// Key/value context used by declarative (persistable) conditions
using Fields = std::map<std::string, std::string>;

struct FieldMatch {
    std::string field;
    std::string equals;
};

//=============================================================================
// Condition - predicate over a context value of a declared type
//=============================================================================
class Condition {
public:
    Condition() = default;

    // An empty std::function yields an invalid Condition
    template<typename T>
    static Condition make(std::function<bool(const T&)> fn) {
        Condition c;
        c._type = typeid(T);
        if (fn) {
            c._test = [fn = std::move(fn)](const Context& ctx) {
                const T* value = ctx.as<T>();
                return value != nullptr && fn(*value);
            };
        }
        return c;
    }

    // Matches a Fields context whose `field` entry equals `value`
    static Condition fieldEquals(std::string field, std::string value);

    bool valid() const { return static_cast<bool>(_test); }

    // False when invalid, when the context is empty or of another type
    bool evaluate(const Context& ctx) const { return _test && _test(ctx); }

    std::type_index contextType() const { return _type; }

    // Set only for conditions built by fieldEquals()
    const std::optional<FieldMatch>& fieldMatch() const { return _fieldMatch; }

private:
    std::function<bool(const Context&)> _test;
    std::type_index _type = typeid(void);
    std::optional<FieldMatch> _fieldMatch;
};

} // namespace labelkit
