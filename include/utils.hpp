#pragma once
#include <chrono>
#include <string>

using time_point = std::chrono::time_point<std::chrono::steady_clock>;

// Wall clock seconds since the epoch, as stored in persisted records.
double epoch_seconds();

double seconds_between(time_point start, time_point end);

std::string truncate(const std::string& str, std::size_t max_len);

std::string format_fixed(double value, int precision);

std::string zero_pad(int value, int width);

// 1234567 -> "1,234,567"
std::string with_thousands(long long value);

// Local time as YYYYMMDD_HHMMSS, used to name result files.
std::string timestamp_for_filename();

std::string& rtrim(std::string& s);
