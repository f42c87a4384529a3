#include "auth.hpp"
#include "libssh2_util.hpp"
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <pwd.h>
#include <unistd.h>

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// libssh2 keyboard-interactive callback: every prompt gets the secret
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

std::string login_name(const RemoteDescriptor& hop) {
    if (hop.user && !hop.user->empty()) return *hop.user;
    if (const char* u = std::getenv("USER")) {
        if (*u) return u;
    }
    if (struct passwd* pw = getpwuid(getuid())) {
        if (pw->pw_name) return pw->pw_name;
    }
    return "root";
}

RemoteResult<void> authenticate(LIBSSH2_SESSION* session,
                                socket_t sock,
                                const RemoteDescriptor& hop,
                                const std::vector<std::string>& identity_files,
                                const Deadline& deadline,
                                const Logger& log) {
    const std::string user = login_name(hop);
    const std::string where = fmt::format("Authenticating {}@{}:{}", user, hop.host, hop.port);

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session, user.c_str(),
                                              static_cast<unsigned int>(user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session) != LIBSSH2_ERROR_EAGAIN) break;
        if (!wait_session(session, sock, deadline)) {
            return RemoteResult<void>::Err(deadline_error(deadline, ErrorKind::LoginTimedOut, where));
        }
    }

    if (!auth_list && libssh2_userauth_authenticated(session)) {
        log.debug("Server accepted 'none' authentication", {{"host", hop.identity()}});
        return RemoteResult<void>::Ok();
    }

    std::string methods = auth_list ? auth_list : "";
    log.debug("Auth methods offered", {{"host", hop.identity()}, {"methods", methods}});

    std::vector<std::string> tried;
    int ret;

    if (hop.secret && !hop.secret->empty()) {
        if (methods.empty() || methods.find("password") != std::string::npos) {
            tried.push_back("password");
            while ((ret = libssh2_userauth_password(session, user.c_str(),
                                                    hop.secret->c_str())) == LIBSSH2_ERROR_EAGAIN) {
                if (!wait_session(session, sock, deadline)) {
                    return RemoteResult<void>::Err(deadline_error(deadline, ErrorKind::LoginTimedOut, where));
                }
            }
            if (ret == 0) {
                log.debug("Password authentication succeeded", {{"host", hop.identity()}});
                return RemoteResult<void>::Ok();
            }
        }

        if (methods.find("keyboard-interactive") != std::string::npos) {
            tried.push_back("keyboard-interactive");

            KbdAuthData kbd_data;
            kbd_data.password = *hop.secret;
            kbd_data.prompt_round = 0;
            void** abstract = libssh2_session_abstract(session);
            void* saved = *abstract;
            *abstract = &kbd_data;

            while ((ret = libssh2_userauth_keyboard_interactive(session,
                    user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
                if (!wait_session(session, sock, deadline)) {
                    *abstract = saved;
                    return RemoteResult<void>::Err(deadline_error(deadline, ErrorKind::LoginTimedOut, where));
                }
            }
            *abstract = saved;

            if (ret == 0) {
                log.debug("Keyboard-interactive authentication succeeded", {{"host", hop.identity()}});
                return RemoteResult<void>::Ok();
            }
        }
    }

    if (methods.empty() || methods.find("publickey") != std::string::npos) {
        const char* passphrase = (hop.secret && !hop.secret->empty()) ? hop.secret->c_str() : nullptr;
        for (const auto& file : identity_files) {
            auto key_path = platform::expand_user(file);
            std::error_code ec;
            if (!std::filesystem::exists(key_path, ec)) continue;

            std::string key = key_path.string();
            tried.push_back("publickey:" + key);
            while ((ret = libssh2_userauth_publickey_fromfile_ex(
                        session, user.c_str(), static_cast<unsigned int>(user.length()),
                        nullptr, key.c_str(), passphrase)) == LIBSSH2_ERROR_EAGAIN) {
                if (!wait_session(session, sock, deadline)) {
                    return RemoteResult<void>::Err(deadline_error(deadline, ErrorKind::LoginTimedOut, where));
                }
            }
            if (ret == 0) {
                log.debug("Public key authentication succeeded", {{"host", hop.identity()}, {"key", key}});
                return RemoteResult<void>::Ok();
            }
            log.debug("Public key rejected", {{"host", hop.identity()}, {"key", key},
                                              {"error", libssh2_error(session)}});
        }
    }

    std::string tried_list;
    for (const auto& t : tried) {
        if (!tried_list.empty()) tried_list += ", ";
        tried_list += t;
    }
    if (tried_list.empty()) tried_list = "none applicable";

    return RemoteResult<void>::Err(ErrorKind::AuthenticationFailed,
        fmt::format("{}@{}:{} rejected all methods (offered: {}; tried: {})",
                    user, hop.host, hop.port, methods.empty() ? "?" : methods, tried_list));
}
