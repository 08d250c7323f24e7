// Constants and definitions
#pragma once

namespace scaffix {

constexpr const char *VERSION = "1.0.0";

// Configuration
constexpr const char *CONFIG_FILENAME = ".scaffix.conf";
constexpr const char *DEFAULT_INDENT = "    ";

// Written next to the target and renamed over it
constexpr const char *TEMP_FILE_SUFFIX = ".scaffix-tmp.";

// Plan file syntax
constexpr char PLAN_COMMENT = '#';
constexpr char PLAN_FIELD_SEPARATOR = '|';

// Exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

} // namespace scaffix
