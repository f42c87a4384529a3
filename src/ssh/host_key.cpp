#include "host_key.hpp"
#include "libssh2_util.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <filesystem>
#include <memory>

std::string host_key_fingerprint(LIBSSH2_SESSION* session) {
    const char* hash = libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA256);
    if (!hash) return "";
    std::string b64 = base64_encode(std::string(hash, 32));
    while (!b64.empty() && b64.back() == '=') b64.pop_back();
    return "SHA256:" + b64;
}

static int known_host_key_mask(int hostkey_type) {
    switch (hostkey_type) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:       return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:       return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
    case LIBSSH2_HOSTKEY_TYPE_ED25519:   return LIBSSH2_KNOWNHOST_KEY_ED25519;
    default:                             return LIBSSH2_KNOWNHOST_KEY_UNKNOWN;
    }
}

RemoteResult<void> verify_host_key(LIBSSH2_SESSION* session,
                                   const RemoteDescriptor& hop,
                                   const std::string& known_hosts_path,
                                   bool strict,
                                   const Logger& log) {
    const std::string fingerprint = host_key_fingerprint(session);
    LogFields fields{{"host", hop.host}, {"port", std::to_string(hop.port)},
                     {"fingerprint", fingerprint}};

    auto reject_or_accept = [&](const std::string& reason) -> RemoteResult<void> {
        if (strict) {
            return RemoteResult<void>::Err(ErrorKind::HostKeyRejected,
                fmt::format("{}:{} {} ({})", hop.host, hop.port, reason, fingerprint));
        }
        log.warning(fmt::format("Host key not verified: {}", reason), fields);
        return RemoteResult<void>::Ok();
    };

    size_t key_len = 0;
    int key_type = 0;
    const char* key = libssh2_session_hostkey(session, &key_len, &key_type);
    if (!key) {
        return reject_or_accept("server presented no host key");
    }

    std::unique_ptr<LIBSSH2_KNOWNHOSTS, decltype(&libssh2_knownhost_free)> known(
        libssh2_knownhost_init(session), libssh2_knownhost_free);
    if (!known) {
        return reject_or_accept("cannot initialize known hosts store");
    }

    auto path = platform::expand_user(known_hosts_path);
    std::error_code ec;
    if (known_hosts_path.empty() || !std::filesystem::exists(path, ec)) {
        return reject_or_accept(fmt::format("known hosts file '{}' not found", path.string()));
    }
    if (libssh2_knownhost_readfile(known.get(), path.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
        return reject_or_accept(fmt::format("known hosts file '{}' unreadable: {}",
                                            path.string(), libssh2_error(session)));
    }

    struct libssh2_knownhost* entry = nullptr;
    int check = libssh2_knownhost_checkp(known.get(), hop.host.c_str(), hop.port,
                                         key, key_len,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN |
                                         LIBSSH2_KNOWNHOST_KEYENC_RAW |
                                         known_host_key_mask(key_type),
                                         &entry);
    switch (check) {
    case LIBSSH2_KNOWNHOST_CHECK_MATCH:
        log.debug("Host key matches known hosts", fields);
        return RemoteResult<void>::Ok();
    case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
        return reject_or_accept("host is not in known hosts");
    case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
        return reject_or_accept("host key CHANGED since it was recorded");
    case LIBSSH2_KNOWNHOST_CHECK_FAILURE:
    default:
        return reject_or_accept("known hosts check failed");
    }
}
