/*
 *
 *  debug.h
 *
 *  Logging macros writing to a stdio stream
 *
 */

#ifndef RDC_DEBUG_H_
#define RDC_DEBUG_H_

#include <stdio.h>
#include <time.h>

#ifdef DEBUG
#define debug(stream, fmt, ...) \
  fprintf(stream, "[debug][%s:%d] " fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#else
#define debug(stream, fmt, ...) do {} while (0)
#endif

#define info(stream, fmt, ...) fprintf(stream, fmt, ##__VA_ARGS__)

#define info_wtime(stream, fmt, ...)                                          \
  do {                                                                        \
    struct timespec _rdc_ts;                                                  \
    clock_gettime(CLOCK_REALTIME, &_rdc_ts);                                  \
    fprintf(stream, "[%ld.%06ld]" fmt, (long)_rdc_ts.tv_sec,                  \
        (long)(_rdc_ts.tv_nsec / 1000), ##__VA_ARGS__);                       \
  } while (0)

#endif // RDC_DEBUG_H_
