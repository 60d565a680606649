#pragma once

#include <string>
#include <vector>

std::string trim(std::string value);
std::string toLower(std::string value);
bool startsWith(const std::string &value, const std::string &prefix);
bool endsWith(const std::string &value, const std::string &suffix);
std::vector<std::string> split(const std::string &value, char separator);
std::string join(const std::vector<std::string> &parts, const std::string &separator);
