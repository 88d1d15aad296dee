#ifndef __TH_JSON_LIB__
#define __TH_JSON_LIB__

#include "nlohmann/json.hpp"

/**
 * @brief Snapshots, control params and the JSON metrics export all use
 * `nlohmann::json` under this alias.
 */
using json = nlohmann::json;

#endif  // __TH_JSON_LIB__
