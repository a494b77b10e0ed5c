#include <rstore/types/state.h>
#include <rstore/util/errors.h>

namespace rstore {

    StateSchema::StateSchema(std::vector<std::string> keys) : _keys{std::move(keys)} {
        _index.reserve(_keys.size());
        for (std::size_t i = 0; i < _keys.size(); ++i) {
            auto [_, inserted] = _index.emplace(_keys[i], i);
            if (!inserted) { throw_error<std::invalid_argument>("Duplicate state property '{}'", _keys[i]); }
        }
    }

    std::optional<std::size_t> StateSchema::index_of(std::string_view key) const {
        auto it = _index.find(key);
        if (it == _index.end()) { return std::nullopt; }
        return it->second;
    }

    StateRecord::StateRecord(state_schema_s_ptr schema, std::vector<Value> values)
        : _schema{std::move(schema)}, _values(std::move(values)) {
        if (_schema->size() != _values.size()) {
            throw_error<std::invalid_argument>("State record has {} values for {} keys", _values.size(),
                                               _schema->size());
        }
    }

    Snapshot StateRecord::from_template(const StateTemplate &state) {
        std::vector<std::string> keys;
        std::vector<Value> values;
        keys.reserve(state.size());
        values.reserve(state.size());
        for (const auto &[key, value]: state) {
            keys.push_back(key);
            values.push_back(value);
        }
        return std::make_shared<const StateRecord>(std::make_shared<const StateSchema>(std::move(keys)),
                                                   std::move(values));
    }

    const Value *StateRecord::find(std::string_view key) const {
        auto index = _schema->index_of(key);
        return index ? &_values[*index] : nullptr;
    }

    Snapshot StateRecord::with(std::size_t index, Value v) const {
        auto values = _values;
        values[index] = std::move(v);
        return std::make_shared<const StateRecord>(_schema, std::move(values));
    }

    Value StateRecord::to_map() const {
        Value::Map map;
        for (std::size_t i = 0; i < _values.size(); ++i) { map.emplace(_schema->key(i), _values[i]); }
        return Value{std::move(map)};
    }

    Draft::Draft(Snapshot base, std::string store_id)
        : _base{std::move(base)}, _store_id{std::move(store_id)}, _values(_base->values()) {}

    std::size_t Draft::index_of(std::string_view key) const {
        auto index = _base->schema()->index_of(key);
        if (!index) { throw UnknownPropertyError(_store_id.empty() ? "<draft>" : _store_id, key); }
        return *index;
    }

    const Value &Draft::get(std::string_view key) const { return _values[index_of(key)]; }

    void Draft::set(std::string_view key, Value v) { _values[index_of(key)] = std::move(v); }

    void Draft::set_in(const Value::Path &path, Value v) {
        if (path.empty()) { throw_error<std::invalid_argument>("Empty state path"); }
        auto index = index_of(path.front());
        if (path.size() == 1) {
            _values[index] = std::move(v);
            return;
        }
        Value::Path rest(path.begin() + 1, path.end());
        _values[index] = _values[index].set_in(rest, std::move(v));
    }

    void Draft::set_in(std::string_view dotted_path, Value v) { set_in(parse_path(dotted_path), std::move(v)); }

    void Draft::update(std::string_view key, const std::function<Value(const Value &)> &fn) {
        auto index = index_of(key);
        _values[index] = fn(_values[index]);
    }

    void Draft::assign(const StateTemplate &partial) {
        for (const auto &[key, value]: partial) { set(key, value); }
    }

    std::vector<std::size_t> Draft::changed() const {
        std::vector<std::size_t> result;
        const auto &original = _base->values();
        for (std::size_t i = 0; i < _values.size(); ++i) {
            if (!identical(original[i], _values[i])) { result.push_back(i); }
        }
        return result;
    }

} // namespace rstore
