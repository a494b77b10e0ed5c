#ifndef RSTORE_STATE_H
#define RSTORE_STATE_H

#include <rstore/rstore_export.h>
#include <rstore/types/value.h>
#include <rstore/util/hash.h>

#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rstore {

    // Ordered initial-state template, as supplied by the spec author.
    using StateTemplate = std::vector<std::pair<std::string, Value> >;

    /**
     * The fixed set of property keys of a store, in declaration order. Shared by every snapshot of every instance of
     * a spec.
     */
    struct RSTORE_EXPORT StateSchema {
        explicit StateSchema(std::vector<std::string> keys);

        [[nodiscard]] const std::vector<std::string> &keys() const { return _keys; }

        [[nodiscard]] std::size_t size() const { return _keys.size(); }

        [[nodiscard]] std::optional<std::size_t> index_of(std::string_view key) const;

        [[nodiscard]] const std::string &key(std::size_t index) const { return _keys[index]; }

    private:
        std::vector<std::string> _keys;
        string_map<std::size_t> _index;
    };

    /**
     * One immutable state snapshot. Records are only ever replaced: with() builds a new record that shares every
     * untouched Value with this one.
     */
    struct RSTORE_EXPORT StateRecord {
        StateRecord(state_schema_s_ptr schema, std::vector<Value> values);

        static Snapshot from_template(const StateTemplate &state);

        [[nodiscard]] const state_schema_s_ptr &schema() const { return _schema; }

        [[nodiscard]] const std::vector<Value> &values() const { return _values; }

        [[nodiscard]] std::size_t size() const { return _values.size(); }

        [[nodiscard]] const Value &at(std::size_t index) const { return _values[index]; }

        // Returns nullptr for unknown keys.
        [[nodiscard]] const Value *find(std::string_view key) const;

        [[nodiscard]] Snapshot with(std::size_t index, Value v) const;

        [[nodiscard]] Value to_map() const;

    private:
        state_schema_s_ptr _schema;
        std::vector<Value> _values;
    };

    /**
     * Copy-on-write working copy used by update(). Mutations land in a private vector; changed() diffs it against the
     * base snapshot by identity and commit() materialises the new snapshot.
     */
    class RSTORE_EXPORT Draft {
    public:
        // store_id names the owner in UnknownPropertyError messages.
        explicit Draft(Snapshot base, std::string store_id = {});

        [[nodiscard]] const Value &get(std::string_view key) const;

        [[nodiscard]] const Value &operator[](std::string_view key) const { return get(key); }

        void set(std::string_view key, Value v);

        // The first path segment names the property, the rest descend into it.
        void set_in(const Value::Path &path, Value v);

        void set_in(std::string_view dotted_path, Value v);

        void update(std::string_view key, const std::function<Value(const Value &)> &fn);

        void assign(const StateTemplate &partial);

        [[nodiscard]] std::vector<std::size_t> changed() const;

        [[nodiscard]] const std::vector<Value> &values() const { return _values; }

        [[nodiscard]] const Snapshot &base() const { return _base; }

    private:
        [[nodiscard]] std::size_t index_of(std::string_view key) const;

        Snapshot _base;
        std::string _store_id;
        std::vector<Value> _values;
    };

} // namespace rstore

#endif  // RSTORE_STATE_H
