#pragma once
#include <string_view>

extern const std::string_view XELIS_SIGN_RELEASE_NAME;
extern const std::string_view XELIS_SIGN_VERSION_FULL;
