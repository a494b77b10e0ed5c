#ifndef RSTORE_VALUE_H
#define RSTORE_VALUE_H

#include <rstore/rstore_export.h>
#include <rstore/rstore_forward_declarations.h>

#include <fmt/format.h>

#include <concepts>
#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <variant>
#include <vector>

namespace rstore {

    enum class ValueKind : uint8_t {
        NONE,
        BOOL,
        INT,
        FLOAT,
        STRING,
        LIST,
        MAP,
        OBJECT
    };

    [[nodiscard]] RSTORE_EXPORT std::string_view to_string(ValueKind kind);

    /*
     * A Value is an immutable, dynamically shaped piece of state. Scalars are held inline; lists, maps and opaque
     * user objects are held by shared pointer to const, so copying a Value shares the payload and two Values can be
     * compared by identity (the "strict" equality used to gate state writes).
     *
     * Opaque objects use a small type-erased holder: the payload is kept as shared_ptr<const void> together with its
     * std::type_index, and is recovered with as<T>().
     */
    struct RSTORE_EXPORT Value {
        using List = std::vector<Value>;
        using Map = std::map<std::string, Value, std::less<> >;
        using Path = std::vector<std::string>;

        struct Object {
            std::shared_ptr<const void> ptr;
            std::type_index type{typeid(void)};
        };

        Value() = default;

        Value(std::nullptr_t) {}

        Value(bool v) : _data{v} {}

        template<std::integral I>
            requires (!std::same_as<I, bool>)
        Value(I v) : _data{static_cast<int64_t>(v)} {}

        template<std::floating_point F>
        Value(F v) : _data{static_cast<double>(v)} {}

        Value(const char *v) : _data{std::string{v}} {}

        Value(std::string v) : _data{std::move(v)} {}

        Value(std::string_view v) : _data{std::string{v}} {}

        Value(List v) : _data{std::make_shared<const List>(std::move(v))} {}

        Value(Map v) : _data{std::make_shared<const Map>(std::move(v))} {}

        static Value list(List items = {}) { return Value{std::move(items)}; }

        static Value map(Map entries = {}) { return Value{std::move(entries)}; }

        template<typename T, typename... Ts>
        static Value object(Ts &&... args) {
            Value v;
            v._data = Object{std::make_shared<const T>(std::forward<Ts>(args)...), std::type_index(typeid(T))};
            return v;
        }

        template<typename T>
        static Value object(std::shared_ptr<const T> ptr) {
            Value v;
            v._data = Object{std::move(ptr), std::type_index(typeid(T))};
            return v;
        }

        [[nodiscard]] ValueKind kind() const { return static_cast<ValueKind>(_data.index()); }

        [[nodiscard]] bool is_null() const { return kind() == ValueKind::NONE; }
        [[nodiscard]] bool is_bool() const { return kind() == ValueKind::BOOL; }
        [[nodiscard]] bool is_int() const { return kind() == ValueKind::INT; }
        [[nodiscard]] bool is_float() const { return kind() == ValueKind::FLOAT; }
        [[nodiscard]] bool is_number() const { return is_int() || is_float(); }
        [[nodiscard]] bool is_string() const { return kind() == ValueKind::STRING; }
        [[nodiscard]] bool is_list() const { return kind() == ValueKind::LIST; }
        [[nodiscard]] bool is_map() const { return kind() == ValueKind::MAP; }
        [[nodiscard]] bool is_object() const { return kind() == ValueKind::OBJECT; }

        template<typename T>
        [[nodiscard]] bool holds() const {
            auto obj = std::get_if<Object>(&_data);
            return obj != nullptr && obj->type == std::type_index(typeid(T));
        }

        [[nodiscard]] bool as_bool() const;
        [[nodiscard]] int64_t as_int() const;
        // Ints widen to double.
        [[nodiscard]] double as_float() const;
        [[nodiscard]] const std::string &as_string() const;
        [[nodiscard]] const List &as_list() const;
        [[nodiscard]] const Map &as_map() const;

        template<typename T>
        [[nodiscard]] const T &as() const {
            if (!holds<T>()) {
                throw std::bad_cast();
            }
            return *static_cast<const T *>(std::get<Object>(_data).ptr.get());
        }

        [[nodiscard]] std::size_t size() const;

        [[nodiscard]] bool contains(std::string_view key) const;

        // Missing keys and out of range indices yield null.
        [[nodiscard]] const Value &operator[](std::string_view key) const;
        [[nodiscard]] const Value &operator[](std::size_t index) const;

        [[nodiscard]] const Value &get_in(const Path &path) const;

        // Copy-on-write builders: each returns a new Value and shares every untouched element with this one.
        [[nodiscard]] Value with(std::string_view key, Value v) const;
        [[nodiscard]] Value without(std::string_view key) const;
        [[nodiscard]] Value push_back(Value v) const;
        [[nodiscard]] Value set(std::size_t index, Value v) const;
        // Intermediate nulls are replaced by empty maps.
        [[nodiscard]] Value set_in(const Path &path, Value v) const;

        /*
         * The address of the shared payload for containers and objects, nullptr for scalars. Two values with the same
         * identity are guaranteed identical.
         */
        [[nodiscard]] const void *identity() const;

        [[nodiscard]] std::string to_string() const;

        friend RSTORE_EXPORT bool identical(const Value &lhs, const Value &rhs);

        friend RSTORE_EXPORT bool shallow_equal(const Value &lhs, const Value &rhs);

        friend RSTORE_EXPORT bool deep_equal(const Value &lhs, const Value &rhs);

        friend bool operator==(const Value &lhs, const Value &rhs) { return deep_equal(lhs, rhs); }

    private:
        using data_type = std::variant<std::monostate, bool, int64_t, double, std::string,
            std::shared_ptr<const List>, std::shared_ptr<const Map>, Object>;

        data_type _data{};
    };

    RSTORE_EXPORT bool identical(const Value &lhs, const Value &rhs);

    RSTORE_EXPORT bool shallow_equal(const Value &lhs, const Value &rhs);

    RSTORE_EXPORT bool deep_equal(const Value &lhs, const Value &rhs);

    RSTORE_EXPORT Value::Path parse_path(std::string_view dotted);

} // namespace rstore

template<>
struct fmt::formatter<rstore::Value> : fmt::formatter<std::string> {
    auto format(const rstore::Value &v, format_context &ctx) const {
        return fmt::formatter<std::string>::format(v.to_string(), ctx);
    }
};

#endif  // RSTORE_VALUE_H
