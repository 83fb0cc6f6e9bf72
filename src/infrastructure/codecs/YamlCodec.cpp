/**
 * @file YamlCodec.cpp
 * @brief Document <-> YAML conversion.
 */

#include "infrastructure/codecs/YamlCodec.hpp"

#include <string>

#include <yaml-cpp/yaml.h>

namespace stowage::infrastructure::codecs {

namespace {

using domain::DecodeError;
using domain::EncodeError;

constexpr int kDoublePrecision = 17;

void emit(YAML::Emitter& out, const Document& value) {
    switch (value.type()) {
        case Document::value_t::object:
            out << YAML::BeginMap;
            for (auto it = value.begin(); it != value.end(); ++it) {
                out << YAML::Key << YAML::DoubleQuoted << it.key();
                out << YAML::Value;
                emit(out, it.value());
            }
            out << YAML::EndMap;
            break;
        case Document::value_t::array:
            out << YAML::BeginSeq;
            for (const auto& element : value) {
                emit(out, element);
            }
            out << YAML::EndSeq;
            break;
        case Document::value_t::string:
            out << YAML::DoubleQuoted << value.get_ref<const std::string&>();
            break;
        case Document::value_t::boolean:
            out << value.get<bool>();
            break;
        case Document::value_t::number_integer:
            out << value.get<long long>();
            break;
        case Document::value_t::number_unsigned:
            out << value.get<unsigned long long>();
            break;
        case Document::value_t::number_float:
            out << value.get<double>();
            break;
        case Document::value_t::null:
            out << YAML::Null;
            break;
        case Document::value_t::binary:
        case Document::value_t::discarded:
            throw EncodeError(std::string("YAML cannot represent a ") + value.type_name() + " value");
    }
}

Document scalar(const YAML::Node& node) {
    const std::string& text = node.Scalar();

    // Quoted scalars carry the non-specific "!" tag.
    if (node.Tag() == "!") {
        return text;
    }

    long long i = 0;
    if (YAML::convert<long long>::decode(node, i)) return i;
    unsigned long long u = 0;
    if (YAML::convert<unsigned long long>::decode(node, u)) return u;
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d)) return d;
    bool b = false;
    if (YAML::convert<bool>::decode(node, b)) return b;
    return text;
}

Document fromNode(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar:
            return scalar(node);
        case YAML::NodeType::Sequence: {
            Document array = Document::array();
            for (const auto& child : node) {
                array.push_back(fromNode(child));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            Document object = Document::object();
            for (const auto& entry : node) {
                object[entry.first.as<std::string>()] = fromNode(entry.second);
            }
            return object;
        }
    }
    return nullptr;
}

} // namespace

domain::Bytes YamlCodec::DocumentToBytes(const Document& document) {
    YAML::Emitter out;
    out.SetDoublePrecision(kDoublePrecision);
    emit(out, document);
    if (!out.good()) {
        throw EncodeError("YAML emitter: " + out.GetLastError());
    }
    std::string text(out.c_str(), out.size());
    text += '\n';
    return domain::Bytes(text.begin(), text.end());
}

Document YamlCodec::BytesToDocument(const std::uint8_t* data, std::size_t size) {
    try {
        YAML::Node root = YAML::Load(std::string(reinterpret_cast<const char*>(data), size));
        return fromNode(root);
    } catch (const YAML::Exception& e) {
        throw DecodeError(e.what());
    }
}

} // namespace stowage::infrastructure::codecs
