// Basic types shared between the engine and the core for sessions and SFTP
// metadata. Kept as plain structs so they can travel across threads freely.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace openxfer {

// known_hosts validation policy for the server host key.
enum class KnownHostsPolicy {
    Strict,    // Requires an exact match in known_hosts.
    AcceptNew, // TOFU: accept and store new hosts; reject changed keys.
    Off        // No verification (not recommended).
};

struct FileInfo {
    std::string name; // base name
    bool is_dir = false;
    std::uint64_t size = 0;  // bytes (if applicable)
    std::uint64_t mtime = 0; // epoch (seconds)
    std::uint32_t mode = 0;  // POSIX bits (permissions/type)
    std::uint32_t uid = 0;
    std::uint32_t gid = 0;
};

// Callback answering keyboard-interactive prompts. Must return true and fill
// one response per prompt; on false the backend falls back to user/password.
using KbdIntPromptsCB =
    std::function<bool(const std::string &name, const std::string &instruction,
                       const std::vector<std::string> &prompts,
                       std::vector<std::string> &responses)>;

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Blocking-call timeout applied to the SSH session, in milliseconds.
    int timeout_ms = 20000;

    // Fingerprint confirmation (TOFU) when known_hosts has no entry.
    std::function<bool(const std::string &host, std::uint16_t port,
                       const std::string &algorithm,
                       const std::string &fingerprint)>
        hostkey_confirm_cb;

    KbdIntPromptsCB keyboard_interactive_cb;
};

} // namespace openxfer
