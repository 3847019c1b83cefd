#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <vector>

std::string current_iso_time_str();
std::string current_display_time_str();

bool ends_with(const std::string& value, const std::string& ending);
std::string to_lower(std::string value);

// "a,b,c", or fallback when names is empty
std::string join_names(const std::vector<std::string>& names, const std::string& fallback);

float dot(const std::vector<float>& a, const std::vector<float>& b);
void l2_normalize(std::vector<float>& v);

#endif
