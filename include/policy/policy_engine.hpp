#pragma once

#include "core/error.hpp"
#include "policy/policy_types.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace redactguard {

/**
 * @brief Policy Engine - maps (label, entity tier) to an action
 *
 * Lookup is done in the manifest of the entity's own tier:
 * 1. Label configured and enabled  -> its action
 * 2. Label configured but disabled -> allow
 * 3. Label not configured          -> manifest default_action
 * 4. No default or no manifest     -> redact (fail closed)
 *
 * Thread-safety: hot-reloadable via RCU (atomic shared_ptr). An operation
 * acquires a snapshot once and uses it for every entity, so a concurrent
 * reload never changes the rules mid-operation.
 */
class PolicyEngine {
public:
    PolicyEngine();
    explicit PolicyEngine(PolicySet policies);

    /// Swap in a new policy set (RCU update)
    void reload(PolicySet policies);

    /// Current snapshot; never null
    [[nodiscard]] std::shared_ptr<const PolicySet> snapshot() const;

    /**
     * @brief Snapshot for an operation at `requested_tier`
     * @return POLICY_CONFIG_ERROR if that tier has no valid manifest
     */
    [[nodiscard]] Result<std::shared_ptr<const PolicySet>> acquire(Tier requested_tier) const;

    /// Pure lookup against a given snapshot
    [[nodiscard]] static PolicyDecision decide(const PolicySet& policies,
                                               const std::string& label,
                                               Tier entity_tier);

    [[nodiscard]] size_t manifest_count() const;

private:
    std::shared_ptr<const PolicySet> store_;
};

} // namespace redactguard
