#pragma once

#include <string>
#include <core/deadline.hpp>
#include <core/errors.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// Last error message recorded on the session, "unknown error" if none.
std::string libssh2_error(LIBSSH2_SESSION* session);

// Block until the session socket is ready in the direction libssh2 is
// waiting for, or a short interval passes. Returns false once the deadline
// has expired or the batch was cancelled.
bool wait_session(LIBSSH2_SESSION* session, socket_t sock, const Deadline& deadline);

// Error for a deadline that ran out, `timeout_kind` unless it was cancelled.
RemoteError deadline_error(const Deadline& deadline, ErrorKind timeout_kind,
                           const std::string& what);
