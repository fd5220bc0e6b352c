#pragma once
#include <string>
#include <cstdint>

// "YYYY-MM-DD HH:MM:SS+00:00" for an epoch second.
std::string formatUtc(std::int64_t epochSeconds);
