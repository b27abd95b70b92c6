#pragma once
#include <string>

namespace elicit {

/// Returns the current UTC time as an ISO 8601 string, such as "2026-10-19T08:15:00Z".
std::string utc_timestamp();

}
