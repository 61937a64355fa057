#pragma once

#include <string>

void set_log_file(const std::string &path);
void logMessage(const std::string &message);
