#pragma once

#include <string>
#include <vector>
#include <core/deadline.hpp>
#include <core/errors.hpp>
#include <core/logger.hpp>
#include <platform/socket_util.hpp>
#include <remote/remote_descriptor.hpp>

// libssh2 forward declaration
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// Transport-level user authentication for one hop.
//
// With a secret: password, then keyboard-interactive answering every
// prompt with the secret. Then each existing identity file, using the
// secret as passphrase. Fails with AuthenticationFailed when nothing is
// accepted, LoginTimedOut/Cancelled when the deadline wins.
RemoteResult<void> authenticate(LIBSSH2_SESSION* session,
                                socket_t sock,
                                const RemoteDescriptor& hop,
                                const std::vector<std::string>& identity_files,
                                const Deadline& deadline,
                                const Logger& log);

// Login name for a hop: the descriptor's user or the local user.
std::string login_name(const RemoteDescriptor& hop);
