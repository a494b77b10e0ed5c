#include <rstore/types/value.h>
#include <rstore/util/errors.h>

#include <fmt/ranges.h>

#include <charconv>
#include <cmath>
#include <optional>

namespace rstore {

    std::string_view to_string(ValueKind kind) {
        switch (kind) {
            case ValueKind::NONE: return "null";
            case ValueKind::BOOL: return "bool";
            case ValueKind::INT: return "int";
            case ValueKind::FLOAT: return "float";
            case ValueKind::STRING: return "string";
            case ValueKind::LIST: return "list";
            case ValueKind::MAP: return "map";
            case ValueKind::OBJECT: return "object";
        }
        return "unknown";
    }

    namespace {
        const Value &null_value() {
            static const Value null{};
            return null;
        }

        std::optional<std::size_t> parse_index(std::string_view segment) {
            std::size_t index{};
            auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), index);
            if (ec != std::errc{} || ptr != segment.data() + segment.size()) { return std::nullopt; }
            return index;
        }

        Value set_in_impl(const Value &current, const Value::Path &path, std::size_t depth, Value v) {
            if (depth == path.size()) { return v; }
            const auto &segment = path[depth];
            if (current.is_list()) {
                auto index = parse_index(segment);
                if (!index) {
                    throw_error<std::invalid_argument>("Path segment '{}' is not a list index", segment);
                }
                return current.set(*index, set_in_impl(current[*index], path, depth + 1, std::move(v)));
            }
            const Value base = current.is_null() ? Value::map() : current;
            if (!base.is_map()) {
                throw_error<std::invalid_argument>("Cannot descend into {} with path segment '{}'",
                                                   to_string(base.kind()), segment);
            }
            return base.with(segment, set_in_impl(base[segment], path, depth + 1, std::move(v)));
        }

        bool same_float(double a, double b) {
            return a == b ? std::signbit(a) == std::signbit(b) : (std::isnan(a) && std::isnan(b));
        }
    } // namespace

    bool Value::as_bool() const {
        if (auto v = std::get_if<bool>(&_data)) { return *v; }
        throw_error<std::invalid_argument>("Expected bool, got {}", rstore::to_string(kind()));
    }

    int64_t Value::as_int() const {
        if (auto v = std::get_if<int64_t>(&_data)) { return *v; }
        throw_error<std::invalid_argument>("Expected int, got {}", rstore::to_string(kind()));
    }

    double Value::as_float() const {
        if (auto v = std::get_if<double>(&_data)) { return *v; }
        if (auto v = std::get_if<int64_t>(&_data)) { return static_cast<double>(*v); }
        throw_error<std::invalid_argument>("Expected float, got {}", rstore::to_string(kind()));
    }

    const std::string &Value::as_string() const {
        if (auto v = std::get_if<std::string>(&_data)) { return *v; }
        throw_error<std::invalid_argument>("Expected string, got {}", rstore::to_string(kind()));
    }

    const Value::List &Value::as_list() const {
        if (auto v = std::get_if<std::shared_ptr<const List> >(&_data)) { return **v; }
        throw_error<std::invalid_argument>("Expected list, got {}", rstore::to_string(kind()));
    }

    const Value::Map &Value::as_map() const {
        if (auto v = std::get_if<std::shared_ptr<const Map> >(&_data)) { return **v; }
        throw_error<std::invalid_argument>("Expected map, got {}", rstore::to_string(kind()));
    }

    std::size_t Value::size() const {
        switch (kind()) {
            case ValueKind::LIST: return as_list().size();
            case ValueKind::MAP: return as_map().size();
            case ValueKind::STRING: return as_string().size();
            default: return 0;
        }
    }

    bool Value::contains(std::string_view key) const {
        return is_map() && as_map().find(key) != as_map().end();
    }

    const Value &Value::operator[](std::string_view key) const {
        if (!is_map()) { return null_value(); }
        auto &m = as_map();
        auto it = m.find(key);
        return it == m.end() ? null_value() : it->second;
    }

    const Value &Value::operator[](std::size_t index) const {
        if (!is_list()) { return null_value(); }
        auto &l = as_list();
        return index < l.size() ? l[index] : null_value();
    }

    const Value &Value::get_in(const Path &path) const {
        const Value *current = this;
        for (const auto &segment: path) {
            if (current->is_list()) {
                auto index = parse_index(segment);
                if (!index) { return null_value(); }
                current = &(*current)[*index];
            } else {
                current = &(*current)[segment];
            }
            if (current->is_null()) { break; }
        }
        return *current;
    }

    Value Value::with(std::string_view key, Value v) const {
        Map copy = is_map() ? as_map() : Map{};
        copy.insert_or_assign(std::string{key}, std::move(v));
        return Value{std::move(copy)};
    }

    Value Value::without(std::string_view key) const {
        if (!contains(key)) { return *this; }
        Map copy = as_map();
        copy.erase(copy.find(key));
        return Value{std::move(copy)};
    }

    Value Value::push_back(Value v) const {
        List copy = is_list() ? as_list() : List{};
        copy.push_back(std::move(v));
        return Value{std::move(copy)};
    }

    Value Value::set(std::size_t index, Value v) const {
        List copy = is_list() ? as_list() : List{};
        if (index >= copy.size()) { copy.resize(index + 1); }
        copy[index] = std::move(v);
        return Value{std::move(copy)};
    }

    Value Value::set_in(const Path &path, Value v) const {
        return set_in_impl(*this, path, 0, std::move(v));
    }

    const void *Value::identity() const {
        switch (kind()) {
            case ValueKind::LIST: return std::get<std::shared_ptr<const List> >(_data).get();
            case ValueKind::MAP: return std::get<std::shared_ptr<const Map> >(_data).get();
            case ValueKind::OBJECT: return std::get<Object>(_data).ptr.get();
            default: return nullptr;
        }
    }

    std::string Value::to_string() const {
        switch (kind()) {
            case ValueKind::NONE: return "null";
            case ValueKind::BOOL: return as_bool() ? "true" : "false";
            case ValueKind::INT: return fmt::format("{}", as_int());
            case ValueKind::FLOAT: return fmt::format("{}", std::get<double>(_data));
            case ValueKind::STRING: return fmt::format("\"{}\"", as_string());
            case ValueKind::LIST: {
                std::vector<std::string> items;
                for (const auto &item: as_list()) { items.push_back(item.to_string()); }
                return fmt::format("[{}]", fmt::join(items, ", "));
            }
            case ValueKind::MAP: {
                std::vector<std::string> items;
                for (const auto &[k, item]: as_map()) { items.push_back(fmt::format("{}: {}", k, item.to_string())); }
                return fmt::format("{{{}}}", fmt::join(items, ", "));
            }
            case ValueKind::OBJECT: {
                const auto &obj = std::get<Object>(_data);
                return fmt::format("<{} @{}>", obj.type.name(), fmt::ptr(obj.ptr.get()));
            }
        }
        return "<unknown>";
    }

    bool identical(const Value &lhs, const Value &rhs) {
        if (lhs.kind() != rhs.kind()) { return false; }
        switch (lhs.kind()) {
            case ValueKind::NONE: return true;
            case ValueKind::BOOL: return lhs.as_bool() == rhs.as_bool();
            case ValueKind::INT: return lhs.as_int() == rhs.as_int();
            case ValueKind::FLOAT: return same_float(lhs.as_float(), rhs.as_float());
            case ValueKind::STRING: return lhs.as_string() == rhs.as_string();
            default: return lhs.identity() == rhs.identity();
        }
    }

    bool shallow_equal(const Value &lhs, const Value &rhs) {
        if (identical(lhs, rhs)) { return true; }
        if (lhs.kind() != rhs.kind()) { return false; }
        if (lhs.is_list()) {
            const auto &a = lhs.as_list();
            const auto &b = rhs.as_list();
            if (a.size() != b.size()) { return false; }
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (!identical(a[i], b[i])) { return false; }
            }
            return true;
        }
        if (lhs.is_map()) {
            const auto &a = lhs.as_map();
            const auto &b = rhs.as_map();
            if (a.size() != b.size()) { return false; }
            for (const auto &[key, value]: a) {
                auto it = b.find(key);
                if (it == b.end() || !identical(value, it->second)) { return false; }
            }
            return true;
        }
        return false;
    }

    bool deep_equal(const Value &lhs, const Value &rhs) {
        if (identical(lhs, rhs)) { return true; }
        if (lhs.kind() != rhs.kind()) { return false; }
        if (lhs.is_list()) {
            const auto &a = lhs.as_list();
            const auto &b = rhs.as_list();
            if (a.size() != b.size()) { return false; }
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (!deep_equal(a[i], b[i])) { return false; }
            }
            return true;
        }
        if (lhs.is_map()) {
            const auto &a = lhs.as_map();
            const auto &b = rhs.as_map();
            if (a.size() != b.size()) { return false; }
            for (const auto &[key, value]: a) {
                auto it = b.find(key);
                if (it == b.end() || !deep_equal(value, it->second)) { return false; }
            }
            return true;
        }
        return false;
    }

    Value::Path parse_path(std::string_view dotted) {
        Value::Path path;
        std::size_t start = 0;
        while (start <= dotted.size()) {
            auto end = dotted.find('.', start);
            if (end == std::string_view::npos) { end = dotted.size(); }
            if (end == start) { throw_error<std::invalid_argument>("Empty segment in path '{}'", dotted); }
            path.emplace_back(dotted.substr(start, end - start));
            start = end + 1;
        }
        return path;
    }

} // namespace rstore
