// frontend/include/specdoc/Version.hpp
#pragma once
#include <string_view>


namespace specdoc {

    inline constexpr int k_version_major = 0;
    inline constexpr int k_version_minor = 3;
    inline constexpr int k_version_patch = 0;

    inline constexpr std::string_view k_version_string = "specdoc v0.3.0";

} // namespace specdoc
