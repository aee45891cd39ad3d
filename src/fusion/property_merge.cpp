#include "fusion/property_merge.hpp"
#include "similarity/text_utils.hpp"
#include <map>
#include <set>
#include <stdexcept>

namespace kgf {
namespace merge {

std::string most_frequent_string(const std::vector<std::string>& values, size_t* count) {
    std::map<std::string, size_t> counts;
    std::vector<std::string> order;

    for (const auto& value : values) {
        if (counts[value]++ == 0) {
            order.push_back(value);
        }
    }

    std::string best;
    size_t best_count = 0;
    for (const auto& value : order) {
        if (counts[value] > best_count) {
            best = value;
            best_count = counts[value];
        }
    }

    if (count) *count = best_count;
    return best;
}

PropertyValue most_frequent(const std::vector<PropertyValue>& values) {
    if (values.empty()) return PropertyValue();

    std::vector<std::string> keys;
    keys.reserve(values.size());
    for (const auto& value : values) {
        keys.push_back(value.to_string());
    }

    std::string winner = most_frequent_string(keys);
    for (size_t i = 0; i < values.size(); ++i) {
        if (keys[i] == winner) return values[i];
    }
    return values.front();
}

PropertyValue longest_string(const std::vector<PropertyValue>& values) {
    if (values.empty()) return PropertyValue();

    size_t best = 0;
    size_t best_length = 0;
    for (size_t i = 0; i < values.size(); ++i) {
        if (!values[i].is_string()) {
            throw std::invalid_argument("longest_string requires string values");
        }
        size_t length = text::utf8_length(values[i].string_value);
        if (i == 0 || length > best_length) {
            best = i;
            best_length = length;
        }
    }
    return values[best];
}

PropertyValue mean(const std::vector<PropertyValue>& values) {
    if (values.empty()) return PropertyValue();

    double total = 0.0;
    for (const auto& value : values) {
        if (!value.is_number()) {
            throw std::invalid_argument("mean requires number values");
        }
        total += value.number_value;
    }
    return PropertyValue(total / static_cast<double>(values.size()));
}

PropertyValue list_union(const std::vector<PropertyValue>& values) {
    std::vector<PropertyValue> merged;
    std::set<std::string> seen;

    for (const auto& value : values) {
        if (!value.is_list()) {
            throw std::invalid_argument("list_union requires list values");
        }
        for (const auto& item : value.list_value) {
            if (seen.insert(item.to_string()).second) {
                merged.push_back(item);
            }
        }
    }

    return PropertyValue(merged);
}

PropertyValue list_intersection(const std::vector<PropertyValue>& values) {
    if (values.empty()) return PropertyValue(std::vector<PropertyValue>{});

    std::vector<std::set<std::string>> others;
    for (size_t i = 0; i < values.size(); ++i) {
        if (!values[i].is_list()) {
            throw std::invalid_argument("list_intersection requires list values");
        }
        if (i == 0) continue;
        std::set<std::string> keys;
        for (const auto& item : values[i].list_value) {
            keys.insert(item.to_string());
        }
        others.push_back(std::move(keys));
    }

    std::vector<PropertyValue> result;
    std::set<std::string> seen;
    for (const auto& item : values.front().list_value) {
        std::string key = item.to_string();
        if (!seen.insert(key).second) continue;

        bool in_all = true;
        for (const auto& other : others) {
            if (!other.count(key)) {
                in_all = false;
                break;
            }
        }
        if (in_all) result.push_back(item);
    }

    return PropertyValue(result);
}

bool all_of_kind(const std::vector<PropertyValue>& values, PropertyValue::Kind kind) {
    for (const auto& value : values) {
        if (value.kind != kind) return false;
    }
    return !values.empty();
}

} // namespace merge
} // namespace kgf
