#ifndef INCLUDE_DSBOX_CONFIG_H_
#define INCLUDE_DSBOX_CONFIG_H_

#include <string>
#include <filesystem>

#include "executor.h"

// Keys are read from the unnamed section of an INI file; absent keys keep
// their current value. Return false if the file cannot be opened.
bool ParseConfig(const std::filesystem::path&, ExecutorConfig&);

// DSBOX_RUNNER_IMAGE and DSBOX_EXECUTOR_DATA_DIR override the file
void ApplyEnvironment(ExecutorConfig&);

// "<n>[b|k|m|g]" (case-insensitive); return false if malformed
bool ParseMemoryLimit(const std::string&, long& bytes);

#endif  // INCLUDE_DSBOX_CONFIG_H_
