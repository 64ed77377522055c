#pragma once

#include <cstdint>
#include <string_view>

#ifndef TOTEM_BOOST_ENGINE_VERSION
#define TOTEM_BOOST_ENGINE_VERSION "1.2.0"
#endif

#ifndef TOTEM_BOOST_BUILD_RELEASE
#define TOTEM_BOOST_BUILD_RELEASE "Streaks and Premium Boosts"
#endif

namespace totem {

inline constexpr std::string_view kEngineDisplayName = "Totem Boost Engine";
inline constexpr std::string_view kInterfaceVersion = "boost-system-v1";
inline constexpr std::string_view kEngineVersion = TOTEM_BOOST_ENGINE_VERSION;
inline constexpr std::string_view kBuildRelease = TOTEM_BOOST_BUILD_RELEASE;
inline constexpr std::string_view kSignatureDomain = "totem-boost-free-boost-v1";
inline constexpr std::uint32_t kSnapshotFormatVersion = 2;
inline constexpr std::int64_t kSecondsPerDay = 24 * 60 * 60;

}  // namespace totem
