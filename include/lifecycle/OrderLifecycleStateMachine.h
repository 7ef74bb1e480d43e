#pragma once

#include <string>

#include "lifecycle/Proposal.h"

namespace stratlab {
namespace lifecycle {

enum class OrderStatus {
    STAGED,
    SUBMITTED,
    PARTIALLY_FILLED,
    FILLED,
    REJECTED,
    CANCELED
};

std::string toString(OrderStatus status);

struct Order {
    std::string order_id;
    std::string proposal_id;
    OrderStatus status = OrderStatus::STAGED;
    double qty = 1.0;               // multi-leg units
    double filled_qty = 0.0;
    double limit_price = 0.0;       // net per unit, credit positive
    int attempts = 0;               // reprices so far
    int max_reprices = 1;
};

struct OrderLifecycleTransitionResult {
    OrderStatus status = OrderStatus::STAGED;
    double filled_qty = 0.0;
    bool terminal = false;
    bool accepted = true;
};

class OrderLifecycleStateMachine {
public:
    // Broker event names are matched case-insensitively
    static OrderLifecycleTransitionResult transition(
        const std::string& event,
        OrderStatus current,
        double current_filled_qty,
        double order_qty,
        double executed_qty = 0.0,
        double remaining_qty = 0.0
    );

    // Stages an order for an approved proposal; throws ContractViolation otherwise
    static Order stage(const Proposal& proposal, const std::string& order_id, double qty, int max_reprices);

    static Order apply(const Order& order, const std::string& event,
                       double executed_qty = 0.0, double remaining_qty = 0.0);

    // Moves the working limit; throws ContractViolation past max_reprices or on a non-working order
    static Order reprice(const Order& order, double new_limit_price);

    static bool isTerminal(OrderStatus status);
    static bool isWorking(OrderStatus status);
};

} // namespace lifecycle
} // namespace stratlab
