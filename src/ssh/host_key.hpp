#pragma once

#include <string>
#include <core/errors.hpp>
#include <core/logger.hpp>
#include <remote/remote_descriptor.hpp>

// libssh2 forward declaration
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// Check the key the server presented during the handshake against an
// OpenSSH known_hosts file, keyed by the hop's own host and port.
//
// strict: unknown, changed or uncheckable keys fail with HostKeyRejected.
// otherwise: the key is accepted and the reduced assurance is logged.
RemoteResult<void> verify_host_key(LIBSSH2_SESSION* session,
                                   const RemoteDescriptor& hop,
                                   const std::string& known_hosts_path,
                                   bool strict,
                                   const Logger& log);

// "SHA256:<base64>" fingerprint of the session host key, or "" if unavailable.
std::string host_key_fingerprint(LIBSSH2_SESSION* session);
