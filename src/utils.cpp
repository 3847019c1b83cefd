#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

std::string current_iso_time_str() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;

    std::tm local_tm{};
    localtime_r(&in_time_t, &local_tm);

    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros;
    return ss.str();
}

std::string current_display_time_str() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);

    std::tm local_tm{};
    localtime_r(&in_time_t, &local_tm);

    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

bool ends_with(const std::string& value, const std::string& ending) {
    if (ending.size() > value.size()) return false;
    return std::equal(ending.rbegin(), ending.rend(), value.rbegin());
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string join_names(const std::vector<std::string>& names, const std::string& fallback) {
    if (names.empty()) return fallback;
    std::string joined;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) joined += ',';
        joined += names[i];
    }
    return joined;
}

float dot(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        std::cerr << "error: dot product vector sizes do not match.\n";
        return 0;
    }

    float s = 0.0f;
    for (size_t i = 0; i < a.size(); ++i) {
        s += a[i] * b[i];
    }
    return s;
}

void l2_normalize(std::vector<float>& v) {
    float norm = 0.f;
    for (float val : v) norm += val * val;
    norm = std::sqrt(norm);
    if (norm <= 0.f) return;
    for (float& val : v) val /= norm;
}
