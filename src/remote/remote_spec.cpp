#include "remote_spec.hpp"
#include <core/logger.hpp>
#include <fmt/format.h>

std::vector<RemoteDescriptor> RemoteSpec::hops() const {
    std::vector<RemoteDescriptor> all = jump_hosts;
    all.push_back(end_host);
    return all;
}

RemoteResult<void> RemoteSpec::validate() const {
    if (login_timeout.count() <= 0) {
        return RemoteResult<void>::Err(ErrorKind::MalformedRemoteSpec, "login timeout must be positive");
    }
    if (cmd_timeout.count() <= 0) {
        return RemoteResult<void>::Err(ErrorKind::MalformedRemoteSpec, "command timeout must be positive");
    }
    if (end_host.role != HopRole::End) {
        return RemoteResult<void>::Err(ErrorKind::MalformedRemoteSpec, "end host is not marked as end");
    }
    for (const auto& j : jump_hosts) {
        if (j.role != HopRole::Jump) {
            return RemoteResult<void>::Err(ErrorKind::MalformedRemoteSpec,
                                           fmt::format("jump host {} is not marked as jump", j.identity()));
        }
        if (j.host.empty()) {
            return RemoteResult<void>::Err(ErrorKind::MalformedRemoteSpec, "jump host has an empty host");
        }
    }
    if (end_host.host.empty()) {
        return RemoteResult<void>::Err(ErrorKind::MalformedRemoteSpec, "end host has an empty host");
    }
    return RemoteResult<void>::Ok();
}

RemoteResult<std::vector<RemoteSpec>> resolve_remote_specs(const RemoteOptions& options) {
    using Specs = RemoteResult<std::vector<RemoteSpec>>;

    if (options.remotes.empty()) {
        return Specs::Err(ErrorKind::MalformedRemoteSpec, "At least one remote is required");
    }
    if (options.cmd_timeout <= 0 || options.login_timeout <= 0) {
        return Specs::Err(ErrorKind::MalformedRemoteSpec, "Timeouts must be positive");
    }

    std::vector<RemoteDescriptor> jumps;
    for (const auto& j : options.jump_hosts) {
        if (!is_remote_uri(j)) {
            return Specs::Err(ErrorKind::MalformedRemoteSpec,
                              fmt::format("Jump host must be a complete URL: '{}'", clean_uri(j)));
        }
        auto parsed = parse_remote_uri(j);
        if (parsed.is_err()) return Specs::Err(parsed.error);
        parsed.value.role = HopRole::Jump;
        jumps.push_back(parsed.value);
    }

    std::vector<RemoteSpec> specs;
    std::optional<RemoteDescriptor> tmpl;
    for (const auto& r : options.remotes) {
        auto parsed = parse_remote(r, tmpl);
        if (parsed.is_err()) return Specs::Err(parsed.error);
        if (is_remote_uri(r)) tmpl = parsed.value;

        RemoteSpec spec;
        spec.jump_hosts = jumps;
        spec.end_host = parsed.value;
        spec.end_host.role = HopRole::End;
        spec.login_timeout = std::chrono::seconds(options.login_timeout);
        spec.cmd_timeout = std::chrono::seconds(options.cmd_timeout);
        spec.strict_host_key_checking = options.strict_host_key_checking;

        if (options.sudo) {
            if (!spec.end_host.secret || spec.end_host.secret->empty()) {
                return Specs::Err(ErrorKind::MalformedRemoteSpec,
                                  fmt::format("--sudo needs a password in the remote URL for {}",
                                              spec.end_host.identity()));
            }
            spec.sudo_password = spec.end_host.secret;
        }

        auto valid = spec.validate();
        if (valid.is_err()) return Specs::Err(valid.error);
        specs.push_back(std::move(spec));
    }

    return Specs::Ok(std::move(specs));
}
