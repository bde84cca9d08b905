#ifndef LOGGING_HPP
#define LOGGING_HPP

// Installs the stderr logger. Debug output is enabled when the DEBUG
// environment variable is set.
void init_logging();

#endif
