#include "policy/policy_engine.hpp"
#include "core/utils.hpp"

#include <format>

namespace redactguard {

PolicyEngine::PolicyEngine()
    : store_(std::make_shared<const PolicySet>()) {}

PolicyEngine::PolicyEngine(PolicySet policies)
    : store_(std::make_shared<const PolicySet>(std::move(policies))) {}

void PolicyEngine::reload(PolicySet policies) {
    auto new_store = std::make_shared<const PolicySet>(std::move(policies));
    const std::string version = new_store->version();
    std::atomic_store_explicit(&store_, std::move(new_store), std::memory_order_release);
    utils::log::info(std::format("Policy set reloaded: {}", version.empty() ? "<empty>" : version));
}

std::shared_ptr<const PolicySet> PolicyEngine::snapshot() const {
    return std::atomic_load_explicit(&store_, std::memory_order_acquire);
}

Result<std::shared_ptr<const PolicySet>> PolicyEngine::acquire(Tier requested_tier) const {
    auto store = snapshot();
    if (!store->find(requested_tier)) {
        return Result<std::shared_ptr<const PolicySet>>::error(
            ErrorCategory::POLICY_CONFIG_ERROR,
            std::format("No valid policy manifest loaded for tier {}", tier_to_string(requested_tier)));
    }
    return Result<std::shared_ptr<const PolicySet>>::ok(std::move(store));
}

PolicyDecision PolicyEngine::decide(const PolicySet& policies,
                                    const std::string& label,
                                    Tier entity_tier) {
    PolicyDecision decision;

    const PolicyManifest* manifest = policies.find(entity_tier);
    if (!manifest) {
        decision.action = Action::REDACT;
        decision.fail_closed = true;
        return decision;
    }

    const auto it = manifest->labels.find(label);
    if (it != manifest->labels.end()) {
        decision.action = it->second.enabled ? it->second.action : Action::ALLOW;
        return decision;
    }

    if (manifest->default_action) {
        decision.action = *manifest->default_action;
        return decision;
    }

    decision.action = Action::REDACT;
    decision.fail_closed = true;
    return decision;
}

size_t PolicyEngine::manifest_count() const {
    return snapshot()->manifests.size();
}

} // namespace redactguard
