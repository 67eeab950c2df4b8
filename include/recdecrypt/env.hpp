#pragma once

#include <string>
#include <string_view>

namespace recdecrypt::env {

std::string Get(std::string_view name);
std::string GetOr(std::string_view name, std::string_view fallback);
bool IsEnabled(std::string_view name, bool default_value = false);

}  // namespace recdecrypt::env
