// SPDX-License-Identifier: Apache-2.0
#include "server/auth/identity_provider.hpp"

#include <atomic>
#include <stdexcept>

namespace strafe::auth {

namespace {

constexpr size_t kMaxDisplayName = 24;

class DisabledProvider : public IIdentityProvider
{
public:
    Identity resolve(std::string_view token, std::string_view requested_name) override
    {
        Identity id;
        id.ok = true;
        id.user_id = token.empty() ? "anon_" + std::to_string(++m_anon) : std::string(token.substr(0, 16));
        id.display_name = sanitize_display_name(requested_name, id.user_id);
        return id;
    }

private:
    std::atomic<uint64_t> m_anon{0};
};

class StubProvider : public IIdentityProvider
{
public:
    explicit StubProvider(std::string prefix) : m_prefix(std::move(prefix)) {}

    Identity resolve(std::string_view token, std::string_view requested_name) override
    {
        Identity id;
        if (token.empty()) {
            id.reason = "empty_token";
            return id;
        }
        id.ok = true;
        id.user_id = m_prefix + std::string(token.substr(0, 10));
        id.display_name = sanitize_display_name(requested_name, id.user_id);
        return id;
    }

private:
    std::string m_prefix;
};

std::atomic<IIdentityProvider *> g_provider{nullptr};

} // namespace

std::string sanitize_display_name(std::string_view requested, std::string_view fallback)
{
    std::string out;
    for (char c : requested) {
        if (out.size() >= kMaxDisplayName)
            break;
        if (c >= 0x20 && c < 0x7f)
            out.push_back(c);
    }
    while (!out.empty() && out.back() == ' ')
        out.pop_back();
    while (!out.empty() && out.front() == ' ')
        out.erase(out.begin());
    if (out.empty())
        out = std::string(fallback.substr(0, kMaxDisplayName));
    return out;
}

std::unique_ptr<IIdentityProvider> make_provider(const std::string &mode, const std::string &stub_prefix)
{
    if (mode == "disabled")
        return std::make_unique<DisabledProvider>();
    if (mode == "stub")
        return std::make_unique<StubProvider>(stub_prefix);
    throw std::invalid_argument("unknown auth_mode '" + mode + "'");
}

void set_provider(IIdentityProvider *p) noexcept
{
    g_provider.store(p, std::memory_order_release);
}

IIdentityProvider *provider() noexcept
{
    return g_provider.load(std::memory_order_acquire);
}

} // namespace strafe::auth
