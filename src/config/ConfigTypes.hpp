#pragma once

#include <cstdint>

enum eConfigAction : uint8_t {
    ACTION_NONE = 0,
    ACTION_DENY,
    ACTION_ALLOW,
    ACTION_AUTHENTICATE
};
