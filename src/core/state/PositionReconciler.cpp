#include "core/state/PositionReconciler.h"

#include <chrono>
#include <cmath>
#include <set>

namespace scalpengine {
namespace core {

const char* toString(ReconciliationStatus status) {
    switch (status) {
        case ReconciliationStatus::SYNCED: return "SYNCED";
        case ReconciliationStatus::MISSING_LOCAL: return "MISSING_LOCAL";
        case ReconciliationStatus::MISSING_REMOTE: return "MISSING_REMOTE";
        case ReconciliationStatus::QUANTITY_MISMATCH: return "QUANTITY_MISMATCH";
    }
    return "SYNCED";
}

int ReconciliationReport::driftCount() const {
    int count = 0;
    for (const auto& entry : entries) {
        if (entry.status != ReconciliationStatus::SYNCED) {
            count++;
        }
    }
    return count;
}

PositionReconciler::PositionReconciler(double quantity_tolerance)
    : quantity_tolerance_(quantity_tolerance) {
}

ReconciliationReport PositionReconciler::reconcile(const std::map<std::string, double>& local_signed_qty,
                                                   const std::vector<BrokerPosition>& remote) const {
    ReconciliationReport report;
    report.ts_ms = toEpochMs(std::chrono::system_clock::now());

    std::map<std::string, double> remote_qty;
    for (const auto& pos : remote) {
        remote_qty[pos.symbol] += pos.quantity;
    }

    std::set<std::string> symbols;
    for (const auto& [symbol, qty] : local_signed_qty) symbols.insert(symbol);
    for (const auto& [symbol, qty] : remote_qty) symbols.insert(symbol);

    for (const auto& symbol : symbols) {
        PositionDrift drift;
        drift.symbol = symbol;

        auto local_it = local_signed_qty.find(symbol);
        auto remote_it = remote_qty.find(symbol);
        const bool has_local = local_it != local_signed_qty.end() && std::abs(local_it->second) > quantity_tolerance_;
        const bool has_remote = remote_it != remote_qty.end() && std::abs(remote_it->second) > quantity_tolerance_;
        drift.local_qty = has_local ? local_it->second : 0.0;
        drift.remote_qty = has_remote ? remote_it->second : 0.0;

        if (!has_local && !has_remote) {
            continue;
        }
        if (has_local && !has_remote) {
            drift.status = ReconciliationStatus::MISSING_REMOTE;
        } else if (!has_local && has_remote) {
            drift.status = ReconciliationStatus::MISSING_LOCAL;
        } else if (std::abs(drift.local_qty - drift.remote_qty) > quantity_tolerance_) {
            drift.status = ReconciliationStatus::QUANTITY_MISMATCH;
        } else {
            drift.status = ReconciliationStatus::SYNCED;
        }

        report.positions_checked++;
        report.entries.push_back(drift);
    }

    return report;
}

} // namespace core
} // namespace scalpengine
