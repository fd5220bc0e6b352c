#include <chrono>
#include <date/date.h>
#include "TimeFormat.hpp"

std::string formatUtc(std::int64_t epochSeconds)
{
    date::sys_seconds tp{std::chrono::seconds{epochSeconds}};
    return date::format("%F %T+00:00", tp);
}
