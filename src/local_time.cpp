#include "../include/local_time.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>

bool parseGmtOffset(const std::string& timezone, int& offset_minutes) {
    size_t i = 0;
    while (i < timezone.size() && isspace((unsigned char)timezone[i])) ++i;
    if (timezone.compare(i, 3, "GMT") != 0 && timezone.compare(i, 3, "UTC") != 0) return false;
    i += 3;
    while (i < timezone.size() && isspace((unsigned char)timezone[i])) ++i;
    if (i == timezone.size()) {
        offset_minutes = 0;
        return true;
    }
    int sign = 1;
    if (timezone[i] == '+') {
        ++i;
    } else if (timezone[i] == '-') {
        sign = -1;
        ++i;
    } else {
        return false;
    }
    while (i < timezone.size() && isspace((unsigned char)timezone[i])) ++i;
    if (i == timezone.size() || !isdigit((unsigned char)timezone[i])) return false;
    int hours = 0;
    while (i < timezone.size() && isdigit((unsigned char)timezone[i])) {
        hours = hours * 10 + (timezone[i] - '0');
        ++i;
    }
    int minutes = 0;
    if (i < timezone.size() && timezone[i] == ':') {
        ++i;
        while (i < timezone.size() && isdigit((unsigned char)timezone[i])) {
            minutes = minutes * 10 + (timezone[i] - '0');
            ++i;
        }
    }
    if (hours > 14 || minutes > 59) return false;
    offset_minutes = sign * (hours * 60 + minutes);
    return true;
}

std::string localDate(std::time_t now, const std::string& timezone) {
    int offset = 0;
    if (!parseGmtOffset(timezone, offset)) offset = 0;
    std::time_t shifted = now + (std::time_t)offset * 60;
    std::tm tm_local;
    gmtime_r(&shifted, &tm_local);
    char buf[16];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02d", tm_local.tm_year + 1900, tm_local.tm_mon + 1, tm_local.tm_mday);
    return buf;
}
