#include "lifecycle/OrderLifecycleStateMachine.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace stratlab {
namespace lifecycle {

namespace {
std::string normalizeEvent(std::string event) {
    std::transform(event.begin(), event.end(), event.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return event;
}

[[noreturn]] void violation(const std::string& order_id, const std::string& message) {
    LOG_ERROR("Order {}: {}", order_id, message);
    throw ContractViolation("order " + order_id + ": " + message);
}
} // namespace

std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::STAGED: return "staged";
        case OrderStatus::SUBMITTED: return "submitted";
        case OrderStatus::PARTIALLY_FILLED: return "partial";
        case OrderStatus::FILLED: return "filled";
        case OrderStatus::REJECTED: return "rejected";
        case OrderStatus::CANCELED: return "canceled";
    }
    return "staged";
}

bool OrderLifecycleStateMachine::isTerminal(OrderStatus status) {
    switch (status) {
        case OrderStatus::FILLED:
        case OrderStatus::REJECTED:
        case OrderStatus::CANCELED:
            return true;
        case OrderStatus::STAGED:
        case OrderStatus::SUBMITTED:
        case OrderStatus::PARTIALLY_FILLED:
            return false;
    }
    return false;
}

bool OrderLifecycleStateMachine::isWorking(OrderStatus status) {
    return status == OrderStatus::SUBMITTED || status == OrderStatus::PARTIALLY_FILLED;
}

OrderLifecycleTransitionResult OrderLifecycleStateMachine::transition(
    const std::string& event,
    OrderStatus current,
    double current_filled_qty,
    double order_qty,
    double executed_qty,
    double remaining_qty
) {
    OrderLifecycleTransitionResult result;
    result.status = current;
    result.filled_qty = current_filled_qty;

    if (isTerminal(current)) {
        result.terminal = true;
        result.accepted = false;
        return result;
    }

    const std::string normalized_event = normalizeEvent(event);

    if (normalized_event == "cancel" || normalized_event == "canceled" || normalized_event == "cancelled") {
        result.status = OrderStatus::CANCELED;
        result.terminal = true;
        return result;
    }

    if (normalized_event == "rejected" || normalized_event == "reject") {
        result.status = OrderStatus::REJECTED;
        result.terminal = true;
        return result;
    }

    if (current == OrderStatus::STAGED) {
        if (normalized_event == "submit" || normalized_event == "submitted" ||
            normalized_event == "new" || normalized_event == "pending") {
            result.status = OrderStatus::SUBMITTED;
        } else {
            // Fills cannot arrive before the broker has the order
            result.accepted = false;
        }
        return result;
    }

    if (executed_qty > 0.0) {
        result.filled_qty = std::max(result.filled_qty, executed_qty);
    }
    if (remaining_qty > 0.0 && order_qty > remaining_qty) {
        result.filled_qty = std::max(result.filled_qty, order_qty - remaining_qty);
    }

    if (normalized_event == "filled" || normalized_event == "fill") {
        result.status = OrderStatus::FILLED;
        result.filled_qty = order_qty;
        result.terminal = true;
        return result;
    }

    if (normalized_event == "partially_filled" || normalized_event == "partial_fill" ||
        normalized_event == "partial") {
        if (result.filled_qty >= order_qty - 1e-8) {
            result.status = OrderStatus::FILLED;
            result.terminal = true;
        } else if (result.filled_qty > 0.0) {
            result.status = OrderStatus::PARTIALLY_FILLED;
        } else {
            result.status = OrderStatus::SUBMITTED;
        }
        return result;
    }

    if (normalized_event == "submitted" || normalized_event == "pending" || normalized_event == "new") {
        result.status = (result.filled_qty > 0.0) ? OrderStatus::PARTIALLY_FILLED : OrderStatus::SUBMITTED;
        return result;
    }

    result.accepted = false;
    return result;
}

Order OrderLifecycleStateMachine::stage(
    const Proposal& proposal,
    const std::string& order_id,
    double qty,
    int max_reprices
) {
    if (proposal.status != ProposalStatus::APPROVED) {
        violation(order_id, "proposal " + proposal.proposal_id + " is " + toString(proposal.status) +
                            ", only approved proposals can be staged");
    }
    if (!std::isfinite(qty) || qty <= 0.0) {
        violation(order_id, "qty must be positive");
    }
    if (max_reprices < 1) {
        violation(order_id, "max_reprices must be at least 1");
    }

    Order order;
    order.order_id = order_id;
    order.proposal_id = proposal.proposal_id;
    order.qty = qty;
    order.max_reprices = max_reprices;

    // Net per-unit limit at mid
    double units = 0.0;
    for (const auto& leg : proposal.legs) {
        units = std::max(units, leg.qty * analytics::PayoffEngine::contractMultiplier(leg.type));
    }
    order.limit_price = (units > 0.0) ? proposal.pricing.net_mid / units : proposal.pricing.net_mid;
    return order;
}

Order OrderLifecycleStateMachine::apply(
    const Order& order,
    const std::string& event,
    double executed_qty,
    double remaining_qty
) {
    const auto result = transition(event, order.status, order.filled_qty, order.qty, executed_qty, remaining_qty);
    if (!result.accepted) {
        LOG_WARN("Order {} ignored event '{}' in state {}", order.order_id, event, toString(order.status));
        return order;
    }

    Order next = order;
    next.status = result.status;
    next.filled_qty = result.filled_qty;
    return next;
}

Order OrderLifecycleStateMachine::reprice(const Order& order, double new_limit_price) {
    if (!isWorking(order.status)) {
        violation(order.order_id, "cannot reprice an order that is " + toString(order.status));
    }
    if (order.attempts >= order.max_reprices) {
        violation(order.order_id, "reprice limit reached (" + std::to_string(order.max_reprices) + ")");
    }
    if (!std::isfinite(new_limit_price)) {
        violation(order.order_id, "limit price must be finite");
    }

    Order next = order;
    next.limit_price = new_limit_price;
    next.attempts++;
    LOG_INFO("Order {} repriced to {:.2f} (attempt {}/{})",
             next.order_id, new_limit_price, next.attempts, next.max_reprices);
    return next;
}

} // namespace lifecycle
} // namespace stratlab
