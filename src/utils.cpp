#include "utils.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

double epoch_seconds() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::duration<double>>(since_epoch).count();
}

double seconds_between(time_point start, time_point end) {
    return std::chrono::duration_cast<std::chrono::duration<double>>(end - start).count();
}

std::string truncate(const std::string& str, std::size_t max_len) {
    if (str.size() <= max_len) {
        return str;
    }
    return str.substr(0, max_len);
}

std::string format_fixed(double value, int precision) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value;
    return out.str();
}

std::string zero_pad(int value, int width) {
    std::ostringstream out;
    out << std::setw(width) << std::setfill('0') << value;
    return out.str();
}

std::string with_thousands(long long value) {
    std::string digits = std::to_string(value < 0 ? -value : value);
    std::string out;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            out.insert(out.begin(), ',');
        }
        out.insert(out.begin(), *it);
        count++;
    }
    if (value < 0) {
        out.insert(out.begin(), '-');
    }
    return out;
}

std::string timestamp_for_filename() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream out;
    out << std::put_time(&local, "%Y%m%d_%H%M%S");
    return out.str();
}

// These trimming functions are from:
// https://stackoverflow.com/a/25385766/8825740
const char* ws = " \t\n\r\f\v";

std::string& rtrim(std::string& s) {
    s.erase(s.find_last_not_of(ws) + 1);
    return s;
}
