#ifndef BOA_CORE_CONFIG_H
#define BOA_CORE_CONFIG_H

#include <chrono>
#include <cstddef>

namespace boa::core::config {

inline constexpr const char kDefaultIndent[] = "  ";
inline constexpr const char kDefaultRootSelector[] = ":root";
inline constexpr std::size_t kTabColumns = 4;

inline constexpr std::chrono::milliseconds kWatchDebounce{30};
inline constexpr std::chrono::milliseconds kWatchPollInterval{50};

inline constexpr const char kProgramName[] = "boa";
inline constexpr const char kVersionString[] = "boa 0.1.0";

}  // namespace boa::core::config

#endif  // BOA_CORE_CONFIG_H
