#ifndef INCLUDE_CODEBOX_LOGGER_H_
#define INCLUDE_CODEBOX_LOGGER_H_

// 0 = warn, 1 = info, 2+ = debug
// Logs go to stderr so that program output on stdout stays clean.
void InitLogger(int verbosity);

#endif  // INCLUDE_CODEBOX_LOGGER_H_
