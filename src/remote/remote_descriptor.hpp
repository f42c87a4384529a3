#pragma once

#include <string>
#include <optional>
#include <core/errors.hpp>

enum class HopRole {
    Jump,
    End,
};

// One hop of a chain: where to connect and as whom.
struct RemoteDescriptor {
    std::string scheme = "ssh";
    std::optional<std::string> user;
    std::optional<std::string> secret;   // password, or key passphrase
    std::string host;
    int port = 22;
    HopRole role = HopRole::End;

    // user@host:port, never includes the secret
    std::string identity() const;
};

// Parse "ssh://[user[:secret]@]host[:port]". Pure, no I/O.
// IPv6 literals go in brackets: ssh://user@[fe80::1]:2222
RemoteResult<RemoteDescriptor> parse_remote_uri(const std::string& uri);

// True if the string carries a scheme ("xyz://...").
bool is_remote_uri(const std::string& s);

// Parse either a full URI, or a bare host merged into `tmpl`
// (scheme, user, secret and port are inherited, only host changes).
RemoteResult<RemoteDescriptor> parse_remote(const std::string& text,
                                            const std::optional<RemoteDescriptor>& tmpl);
