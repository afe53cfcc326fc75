#include "provider.hpp"

static hookgate::ProviderRegistrar reg_github(hookgate::ProviderSpec{
    "github",
    "GitHub",
    "x-github-event",
    "x-hub-signature-256",
    "x-github-delivery",
    {
        {"push",         hookgate::EventKind::Push},
        {"pull_request", hookgate::EventKind::PullRequest},
    }
});
