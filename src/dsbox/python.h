#ifndef DSBOX_PYTHON_H_
#define DSBOX_PYTHON_H_

#include <string>
#include <optional>

// Start the embedded interpreter once per process and release the GIL.
// Every later use must hold pybind11::gil_scoped_acquire.
void EnsureInterpreter();

// nullopt if code compiles; otherwise "syntax error at line L col C: <msg>"
std::optional<std::string> CheckSyntax(const std::string& code);

#endif  // DSBOX_PYTHON_H_
