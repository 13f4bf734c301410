#pragma once
#include <ctime>
#include <string>

// Station timezones arrive as "GMT -8", "GMT+8" or "GMT+5:30".
// Returns false for anything else; callers fall back to UTC.
bool parseGmtOffset(const std::string& timezone, int& offset_minutes);

// Calendar date (YYYY-MM-DD) at the station for the given instant.
std::string localDate(std::time_t now, const std::string& timezone);
