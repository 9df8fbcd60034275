#include "util.hpp"
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

std::string format_date(const std::chrono::system_clock::time_point& tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    gmtime_r(&tt, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d");
    return ss.str();
}

std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& iso_string) {
    std::tm tm = {};
    std::stringstream ss(iso_string);
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (ss.fail()) {
        return std::nullopt;
    }

    // Optional time of day
    char sep = 0;
    if (ss >> sep && (sep == 'T' || sep == ' ')) {
        ss >> std::get_time(&tm, "%H:%M:%S");
        if (ss.fail()) {
            return std::nullopt;
        }
    }

    // Handle fractional seconds
    int fractional_ms = 0;
    char dot = 0;
    if (ss >> dot && dot == '.') {
        std::string digits;
        char c = 0;
        while (ss.get(c) && std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
        }
        digits = digits.substr(0, 3);
        while (digits.size() < 3) {
            digits.push_back('0');
        }
        fractional_ms = std::stoi(digits);
    }

    auto time = std::chrono::system_clock::from_time_t(timegm(&tm));
    time += std::chrono::milliseconds(fractional_ms);
    return time;
}

int days_until(const std::chrono::system_clock::time_point& to,
               const std::chrono::system_clock::time_point& from) {
    using seconds = std::chrono::duration<double>;
    double days = std::chrono::duration_cast<seconds>(to - from).count() / 86400.0;
    return static_cast<int>(std::ceil(days));
}

bool is_finite_positive(double value) {
    return std::isfinite(value) && value > 0.0;
}

double safe_ratio(double numerator, double denominator, double fallback) {
    if (!std::isfinite(numerator) || !std::isfinite(denominator) || denominator == 0.0) {
        return fallback;
    }
    double ratio = numerator / denominator;
    return std::isfinite(ratio) ? ratio : fallback;
}
