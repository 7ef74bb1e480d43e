#include "lifecycle/ProposalLifecycle.h"
#include "common/Logger.h"

namespace stratlab {
namespace lifecycle {

bool ProposalLifecycle::isTerminal(ProposalStatus status) {
    return status != ProposalStatus::PENDING;
}

ProposalTransitionResult ProposalLifecycle::transition(ProposalStatus current, ProposalEvent event) {
    ProposalTransitionResult result;
    result.status = current;

    if (isTerminal(current)) {
        result.terminal = true;
        return result;
    }

    switch (event) {
        case ProposalEvent::APPROVE:
            result.status = ProposalStatus::APPROVED;
            break;
        case ProposalEvent::REJECT:
            result.status = ProposalStatus::REJECTED;
            break;
        case ProposalEvent::EXPIRE:
            result.status = ProposalStatus::EXPIRED;
            break;
    }
    result.accepted = true;
    result.terminal = true;
    return result;
}

bool ProposalLifecycle::isExpired(const Proposal& proposal, Timestamp now) {
    return proposal.status == ProposalStatus::PENDING && now > proposal.approval_deadline;
}

Proposal ProposalLifecycle::apply(const Proposal& proposal, ProposalEvent event, Timestamp now) {
    Proposal next = proposal;
    const ProposalEvent effective = isExpired(proposal, now) ? ProposalEvent::EXPIRE : event;

    const auto result = transition(proposal.status, effective);
    if (!result.accepted) {
        LOG_WARN("Proposal {} is already {}, event ignored", proposal.proposal_id, toString(proposal.status));
        return next;
    }
    if (effective != event) {
        LOG_WARN("Proposal {} passed its approval deadline, marking expired", proposal.proposal_id);
    }

    next.status = result.status;
    return next;
}

} // namespace lifecycle
} // namespace stratlab
