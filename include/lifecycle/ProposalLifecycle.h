#pragma once

#include "common/Types.h"
#include "lifecycle/Proposal.h"

namespace stratlab {
namespace lifecycle {

enum class ProposalEvent { APPROVE, REJECT, EXPIRE };

struct ProposalTransitionResult {
    ProposalStatus status = ProposalStatus::PENDING;
    bool accepted = false;
    bool terminal = false;
};

// pending -> approved | rejected | expired; every non-pending state is final
class ProposalLifecycle {
public:
    static ProposalTransitionResult transition(ProposalStatus current, ProposalEvent event);

    // Pending and past its approval deadline
    static bool isExpired(const Proposal& proposal, Timestamp now);

    // Applies the event at `now`; an approval arriving after the deadline expires the proposal instead
    static Proposal apply(const Proposal& proposal, ProposalEvent event, Timestamp now);

    static bool isTerminal(ProposalStatus status);
};

} // namespace lifecycle
} // namespace stratlab
