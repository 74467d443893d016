#pragma once
#include <string>

std::string getenv_valid(const char* name);
std::string getenv_or(const char* name, const std::string& fallback);
