#ifndef INCLUDE_ISOBOX_LOGGER_H_
#define INCLUDE_ISOBOX_LOGGER_H_

// Makes the default logger usable in forked children; call before starting threads
void InitLogger();

#endif  // INCLUDE_ISOBOX_LOGGER_H_
