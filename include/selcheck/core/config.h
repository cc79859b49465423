#ifndef SELCHECK_CORE_CONFIG_H
#define SELCHECK_CORE_CONFIG_H

namespace selcheck::core::config {

inline constexpr const char kProgramName[] = "selcheck";
inline constexpr const char kVersionString[] = "selcheck 0.1.0";

// Low-specificity budget suited to BEM-style stylesheets.
inline constexpr const char kDefaultThreshold[] = "0,1,3,3";
inline constexpr int kDefaultThresholdInline = 0;
inline constexpr int kDefaultThresholdId = 1;
inline constexpr int kDefaultThresholdClass = 3;
inline constexpr int kDefaultThresholdType = 3;

inline constexpr const char kDefaultFormat[] = "text";

// Source name used when analyzing a literal selector instead of a file.
inline constexpr const char kSelectorSourceName[] = "<selector>";

}  // namespace selcheck::core::config

#endif  // SELCHECK_CORE_CONFIG_H
