#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <type_traits>
#include <utility>

// Only set members are written, so a partially filled config file stays partial.
#define TO_JSON_OPTIONAL_RENAME(JSON, CLASS, MEMBER, JSON_NAME) \
    [&]() { \
        if (CLASS.MEMBER) \
            JSON[JSON_NAME] = *CLASS.MEMBER; \
    }()

#define TO_JSON_OPTIONAL(JSON, CLASS, MEMBER) TO_JSON_OPTIONAL_RENAME(JSON, CLASS, MEMBER, #MEMBER)

#define FROM_JSON_OPTIONAL_RENAME(JSON, CLASS, MEMBER, JSON_NAME) \
    [&]() { \
        if (auto it = JSON.find(JSON_NAME); it != JSON.end() && !it->is_null()) \
            CLASS.MEMBER = it->template get<typename std::decay_t<decltype(CLASS.MEMBER)>::value_type>(); \
    }()

#define FROM_JSON_OPTIONAL(JSON, CLASS, MEMBER) FROM_JSON_OPTIONAL_RENAME(JSON, CLASS, MEMBER, #MEMBER)
