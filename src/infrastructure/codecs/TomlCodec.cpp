/**
 * @file TomlCodec.cpp
 * @brief Document <-> toml::table conversion.
 */

#include "infrastructure/codecs/TomlCodec.hpp"

#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <toml++/toml.h>

namespace stowage::infrastructure::codecs {

namespace {

using domain::DecodeError;
using domain::EncodeError;

toml::table toTable(const Document& object);
toml::array toArray(const Document& array);

std::int64_t toInteger(const Document& value) {
    if (value.is_number_unsigned()) {
        auto u = value.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw EncodeError("TOML integers are 64-bit signed; " + std::to_string(u) + " is out of range");
        }
        return static_cast<std::int64_t>(u);
    }
    return value.get<std::int64_t>();
}

[[noreturn]] void unsupported(const Document& value) {
    throw EncodeError(std::string("TOML cannot represent a ") + value.type_name() + " value");
}

template <typename Insert>
void insertValue(const Document& value, Insert&& insert) {
    switch (value.type()) {
        case Document::value_t::object:
            insert(toTable(value));
            break;
        case Document::value_t::array:
            insert(toArray(value));
            break;
        case Document::value_t::string:
            insert(value.get<std::string>());
            break;
        case Document::value_t::boolean:
            insert(value.get<bool>());
            break;
        case Document::value_t::number_integer:
        case Document::value_t::number_unsigned:
            insert(toInteger(value));
            break;
        case Document::value_t::number_float:
            insert(value.get<double>());
            break;
        case Document::value_t::null:
        case Document::value_t::binary:
        case Document::value_t::discarded:
            unsupported(value);
    }
}

toml::table toTable(const Document& object) {
    toml::table table;
    for (auto it = object.begin(); it != object.end(); ++it) {
        const std::string& key = it.key();
        insertValue(it.value(), [&](auto&& v) { table.insert_or_assign(key, std::forward<decltype(v)>(v)); });
    }
    return table;
}

toml::array toArray(const Document& array) {
    toml::array result;
    for (const auto& element : array) {
        insertValue(element, [&](auto&& v) { result.push_back(std::forward<decltype(v)>(v)); });
    }
    return result;
}

template <typename Printable>
std::string printed(const Printable& value) {
    std::ostringstream os;
    os << value;
    return os.str();
}

Document fromNode(const toml::node& node) {
    if (const auto* table = node.as_table()) {
        Document object = Document::object();
        for (auto&& [key, child] : *table) {
            object[std::string(key.str())] = fromNode(child);
        }
        return object;
    }
    if (const auto* array = node.as_array()) {
        Document result = Document::array();
        for (const auto& child : *array) {
            result.push_back(fromNode(child));
        }
        return result;
    }
    if (const auto* s = node.as_string()) return s->get();
    if (const auto* i = node.as_integer()) return i->get();
    if (const auto* f = node.as_floating_point()) return f->get();
    if (const auto* b = node.as_boolean()) return b->get();
    if (const auto* d = node.as_date()) return printed(d->get());
    if (const auto* t = node.as_time()) return printed(t->get());
    if (const auto* dt = node.as_date_time()) return printed(dt->get());
    throw DecodeError("Unsupported TOML node");
}

} // namespace

domain::Bytes TomlCodec::DocumentToBytes(const Document& document) {
    if (!document.is_object()) {
        throw EncodeError(std::string("TOML documents must be tables, got ") + document.type_name());
    }
    const std::string text = printed(toTable(document));
    return domain::Bytes(text.begin(), text.end());
}

Document TomlCodec::BytesToDocument(const std::uint8_t* data, std::size_t size) {
    std::string_view text(reinterpret_cast<const char*>(data), size);
    try {
        toml::table table = toml::parse(text);
        return fromNode(table);
    } catch (const toml::parse_error& e) {
        std::ostringstream os;
        os << e.description() << " (" << e.source().begin << ")";
        throw DecodeError(os.str());
    }
}

} // namespace stowage::infrastructure::codecs
