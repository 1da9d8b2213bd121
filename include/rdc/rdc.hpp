/*
 *
 *  rdc.hpp
 *
 *  Process wide client. Every call returns 0 or the value of a StatusCode.
 *
 *  The client is configured from RDC_* environment variables when first used.
 *
 */

#ifndef RDC_RDC_HPP_
#define RDC_RDC_HPP_

namespace rdc {

int Initialize();

// Writes length bytes at buffer to the named queue. The buffer must stay
// valid until the queue is idle.
int PostWrite(const char *queue, const void *buffer, unsigned long length);

int WaitIdle(const char *queue, unsigned long timeout_ms);

int Shutdown();

}

#endif // RDC_RDC_HPP_
