#include "remote_descriptor.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <core/logger.hpp>
#include <fmt/format.h>

std::string RemoteDescriptor::identity() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (user && !user->empty()) {
        return fmt::format("{}@{}:{}", *user, h, port);
    }
    return fmt::format("{}:{}", h, port);
}

bool is_remote_uri(const std::string& s) {
    return s.find("://") != std::string::npos;
}

static RemoteResult<RemoteDescriptor> malformed(const std::string& what, const std::string& input) {
    // Never echo the credentials back
    return RemoteResult<RemoteDescriptor>::Err(
        ErrorKind::MalformedRemoteSpec, fmt::format("{}: '{}'", what, clean_uri(input)));
}

RemoteResult<RemoteDescriptor> parse_remote_uri(const std::string& uri) {
    auto scheme_end = uri.find("://");
    if (scheme_end == std::string::npos) {
        return malformed("Missing scheme", uri);
    }

    RemoteDescriptor d;
    std::string scheme = to_lower(uri.substr(0, scheme_end));
    if (scheme != SSH_SCHEME) {
        return malformed(fmt::format("Unsupported scheme '{}'", scheme), uri);
    }
    d.scheme = scheme;

    std::string rest = uri.substr(scheme_end + 3);

    // Only an empty path or "/" is meaningful for a shell remote
    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        if (slash != rest.size() - 1) {
            return malformed("Unexpected path", uri);
        }
        rest.erase(slash);
    }

    // userinfo ends at the last '@' so secrets may contain '@' unescaped
    auto at = rest.rfind('@');
    std::string hostport = rest;
    if (at != std::string::npos) {
        std::string userinfo = rest.substr(0, at);
        hostport = rest.substr(at + 1);
        auto colon = userinfo.find(':');
        if (colon != std::string::npos) {
            d.user = percent_decode(userinfo.substr(0, colon));
            d.secret = percent_decode(userinfo.substr(colon + 1));
        } else {
            d.user = percent_decode(userinfo);
        }
        if (d.user->empty()) d.user.reset();
    }

    std::string port_str;
    if (!hostport.empty() && hostport[0] == '[') {
        auto close = hostport.find(']');
        if (close == std::string::npos) {
            return malformed("Unterminated IPv6 literal", uri);
        }
        d.host = hostport.substr(1, close - 1);
        std::string tail = hostport.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':') return malformed("Garbage after IPv6 literal", uri);
            port_str = tail.substr(1);
            if (port_str.empty()) return malformed("Empty port", uri);
        }
    } else {
        auto colon = hostport.rfind(':');
        if (colon != std::string::npos) {
            d.host = hostport.substr(0, colon);
            port_str = hostport.substr(colon + 1);
            if (port_str.empty()) return malformed("Empty port", uri);
        } else {
            d.host = hostport;
        }
    }

    if (d.host.empty()) {
        return malformed("Empty host", uri);
    }

    d.port = SSH_DEFAULT_PORT;
    if (!port_str.empty()) {
        int port = safe_stoi(port_str, -1);
        if (port < 1 || port > 65535) {
            return malformed(fmt::format("Invalid port '{}'", port_str), uri);
        }
        d.port = port;
    }

    return RemoteResult<RemoteDescriptor>::Ok(d);
}

RemoteResult<RemoteDescriptor> parse_remote(const std::string& text,
                                            const std::optional<RemoteDescriptor>& tmpl) {
    std::string s = text;
    trim(s);

    if (is_remote_uri(s)) {
        return parse_remote_uri(s);
    }

    if (!tmpl) {
        return malformed("First remote must be a complete URL", s);
    }
    if (s.empty()) {
        return malformed("Empty host", s);
    }
    if (s.find_first_of("@/ \t") != std::string::npos) {
        return malformed("Bare remote must be a host name or address", s);
    }

    RemoteDescriptor d = *tmpl;
    d.host = (s.size() > 2 && s.front() == '[' && s.back() == ']') ? s.substr(1, s.size() - 2) : s;
    return RemoteResult<RemoteDescriptor>::Ok(d);
}
