#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <optional>

namespace nlohmann {

/**
 * @brief 判断 j[keys[0]][keys[1]]... 是否存在且不为 null
 */
template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref && !ref->is_null();
}

/**
 * @brief 可选字段，不存在或为 null 时返回 std::nullopt
 */
template <typename T>
std::optional<T> get_optional(const json &j, const char *key) {
    if (!exists(j, key)) return std::nullopt;
    return j.at(key).get<T>();
}

}  // namespace nlohmann
