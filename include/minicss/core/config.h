#ifndef MINICSS_CORE_CONFIG_H
#define MINICSS_CORE_CONFIG_H

namespace minicss::core::config {

inline constexpr const char kProgramName[] = "minicss";
inline constexpr const char kVersionString[] = "minicss 0.1.0";
inline constexpr const char kParserModule[] = "css";

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitParseFailure = 1;
inline constexpr int kExitUsage = 2;
inline constexpr int kExitUnreadableInput = 3;

}  // namespace minicss::core::config

#endif  // MINICSS_CORE_CONFIG_H
