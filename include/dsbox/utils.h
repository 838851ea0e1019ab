#ifndef INCLUDE_DSBOX_UTILS_H_
#define INCLUDE_DSBOX_UTILS_H_

#include <string>

#include "result.h"
#include "executor.h"

const char* ResultTypeName(ResultType);
// return false if the name is unknown
bool GetResultType(const std::string&, ResultType&);

// logging
const char* ExecutorModeName(ExecutorMode);
const char* SandboxKindName(SandboxKind);
const char* ExecuteOutcomeName(ExecuteOutcome);

#endif  // INCLUDE_DSBOX_UTILS_H_
