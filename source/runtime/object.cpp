// object.cpp
// Dynamic object construction, field access and rendering

#include <opticsgen/runtime/object.h>

#include <ostream>
#include <sstream>
#include <stdexcept>

namespace opticsgen::runtime {

Object Object::record(std::string type, std::initializer_list<std::pair<std::string, Object>> fields)
{
    auto map = ObjectMap{}.transient();
    for (const auto& [name, value] : fields) {
        map.set(name, ObjectBox{value});
    }
    return Object{Record{std::move(type), map.persistent(), false}};
}

Object Object::list(std::initializer_list<Object> items)
{
    auto list = ObjectList{}.transient();
    for (const auto& item : items) {
        list.push_back(ObjectBox{item});
    }
    return Object{list.persistent()};
}

Object Object::map(std::initializer_list<std::pair<std::string, Object>> entries)
{
    auto map = ObjectMap{}.transient();
    for (const auto& [key, value] : entries) {
        map.set(key, ObjectBox{value});
    }
    return Object{map.persistent()};
}

Object Object::enumeration(std::string type, std::string constant)
{
    return Object{EnumValue{std::move(type), std::move(constant)}};
}

Object Object::field(const std::string& name) const
{
    if (auto* r = get_if<Record>()) {
        if (auto* found = r->fields.find(name)) {
            return found->get();
        }
    }
    return Object{};
}

Object Object::with_field(const std::string& name, Object value) const
{
    auto* r = get_if<Record>();
    if (!r) {
        throw std::invalid_argument("with_field('" + name + "') on a non-record value " + to_string(*this));
    }
    Record updated = *r;
    updated.fields = updated.fields.set(name, ObjectBox{std::move(value)});
    return Object{std::move(updated)};
}

std::string Object::type_name() const
{
    if (auto* r = get_if<Record>()) {
        return r->type;
    }
    if (auto* e = get_if<EnumValue>()) {
        return e->type;
    }
    return {};
}

namespace {

void write(std::ostream& os, const Object& object)
{
    std::visit(
        [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                os << "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                os << (v ? "true" : "false");
            } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, double>) {
                os << v;
            } else if constexpr (std::is_same_v<T, std::string>) {
                os << '"' << v << '"';
            } else if constexpr (std::is_same_v<T, EnumValue>) {
                os << v.type << "::" << v.constant;
            } else if constexpr (std::is_same_v<T, Record>) {
                // immer::map iteration order is unspecified; fields are printed as stored
                os << v.type << (v.builder ? "::Builder" : "") << "{";
                bool first = true;
                for (const auto& [name, value] : v.fields) {
                    os << (first ? "" : ", ") << name << ": ";
                    write(os, value.get());
                    first = false;
                }
                os << "}";
            } else if constexpr (std::is_same_v<T, ObjectList>) {
                os << "[";
                for (std::size_t i = 0; i < v.size(); ++i) {
                    os << (i > 0 ? ", " : "");
                    write(os, v[i].get());
                }
                os << "]";
            } else {
                static_assert(std::is_same_v<T, ObjectMap>);
                os << "{";
                bool first = true;
                for (const auto& [key, value] : v) {
                    os << (first ? "" : ", ") << key << ": ";
                    write(os, value.get());
                    first = false;
                }
                os << "}";
            }
        },
        object.data);
}

} // namespace

std::string to_string(const Object& object)
{
    std::ostringstream os;
    write(os, object);
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const Object& object)
{
    write(os, object);
    return os;
}

} // namespace opticsgen::runtime
