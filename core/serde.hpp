#pragma once

#include "common/utils.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace cskit::core::serde {

using Fghj = boost::property_tree::ptree;
using SerdeException = std::optional<std::string>;

// Builds one JSON object. Nested objects and lists are built with their own
// Serializer and attached with putChild/putList.
class Serializer {
public:
    void putKey(const std::string& key) { pendingKey = key; }

    template <typename T>
    void putValue(const T& value) {
        if (pendingKey.empty()) return;
        if constexpr (std::is_floating_point_v<T>) {
            // Shortest exact form, so documents reload to identical doubles.
            root.put(pendingKey, common::formatDecimal(static_cast<double>(value)));
        } else if constexpr (std::is_same_v<T, bool>) {
            root.put(pendingKey, value ? "true" : "false");
        } else {
            root.put(pendingKey, value);
        }
        pendingKey.clear();
    }

    void putChild(const std::string& key, const Serializer& child) { root.add_child(key, child.root); }

    void putList(const std::string& key, const std::vector<Serializer>& items) {
        Fghj arr;
        for (const auto& item : items) {
            arr.push_back(std::make_pair("", item.root));
        }
        root.add_child(key, arr);
    }

    template <typename T>
    void putValueList(const std::string& key, const std::vector<T>& values) {
        std::vector<Serializer> items;
        items.reserve(values.size());
        for (const auto& v : values) {
            Serializer s;
            if constexpr (std::is_floating_point_v<T>) {
                s.root.put_value(common::formatDecimal(static_cast<double>(v)));
            } else {
                s.root.put_value(v);
            }
            items.push_back(std::move(s));
        }
        putList(key, items);
    }

    Fghj root;

private:
    std::string pendingKey{};
};

inline void writeJson(const Serializer& s, const std::string& path) {
    boost::property_tree::write_json(path, s.root);
}

} // namespace cskit::core::serde
