#pragma once

#include "../core/serde.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <concepts>
#include <sstream>
#include <string>

namespace cskit::fmt {

namespace serde = ::cskit::core::serde;

template <typename T>
concept Serializable = requires(const T& t, serde::Serializer& s) { t.serialize(s); };

template <typename T>
concept Deserializable = requires(T& t, const serde::Fghj& data) {
    { t.deserializeFromFghj(data) } -> std::same_as<serde::SerdeException>;
};

inline serde::Fghj inParseJson(const std::string& data) {
    std::stringstream ss(data);
    serde::Fghj pt;
    boost::property_tree::read_json(ss, pt);
    return pt;
}

template <Serializable T>
inline serde::Fghj inToTree(const T& item) {
    serde::Serializer serializer;
    item.serialize(serializer);
    return serializer.root;
}

template <Serializable T>
inline std::string inToJson(const T& item) {
    std::stringstream ss;
    boost::property_tree::write_json(ss, inToTree(item), false);
    return ss.str();
}

template <Serializable T>
inline std::string inToJsonPretty(const T& item) {
    std::stringstream ss;
    boost::property_tree::write_json(ss, inToTree(item), true);
    return ss.str();
}

// Fills `item` from JSON text; parse and content errors come back as the message.
template <Deserializable T>
inline serde::SerdeException inFromJson(T& item, const std::string& data) {
    try {
        return item.deserializeFromFghj(inParseJson(data));
    } catch (const boost::property_tree::json_parser_error& e) {
        return std::string(e.what());
    }
}

} // namespace cskit::fmt
