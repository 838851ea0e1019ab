#ifndef INCLUDE_DSBOX_LOGGER_H_
#define INCLUDE_DSBOX_LOGGER_H_

// Must be called before any sandbox is launched in a multithreaded program:
// keeps the console sink lock consistent across fork().
void InitLogger();

#endif  // INCLUDE_DSBOX_LOGGER_H_
