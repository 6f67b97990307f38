// SPDX-License-Identifier: Apache-2.0
// identity_provider.hpp
// Pluggable identity seam: maps a join token to an opaque user id and a display name.
#pragma once
#include <memory>
#include <string>
#include <string_view>

namespace strafe::auth {

struct Identity
{
    bool ok{false};
    std::string user_id; // opaque, filled when ok
    std::string display_name; // sanitized, filled when ok
    std::string reason; // error reason when !ok
};

class IIdentityProvider
{
public:
    virtual ~IIdentityProvider() = default;
    virtual Identity resolve(std::string_view token, std::string_view requested_name) = 0;
};

// Modes: "disabled" (accept everyone) and "stub" (non-empty token required, prefixed user id).
// Throws std::invalid_argument for an unknown mode.
std::unique_ptr<IIdentityProvider> make_provider(const std::string &mode, const std::string &stub_prefix);

// Printable ASCII only, trimmed to 24 characters; falls back to `fallback` when nothing is left.
std::string sanitize_display_name(std::string_view requested, std::string_view fallback);

// Global pointer set once at startup before the listener accepts connections.
void set_provider(IIdentityProvider *p) noexcept;
IIdentityProvider *provider() noexcept;

} // namespace strafe::auth
