#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/Types.h"

namespace scalpengine {
namespace core {

enum class ReconciliationStatus {
    SYNCED,
    MISSING_LOCAL,      // 브로커에만 존재
    MISSING_REMOTE,     // 로컬에만 존재
    QUANTITY_MISMATCH
};

const char* toString(ReconciliationStatus status);

struct PositionDrift {
    std::string symbol;
    ReconciliationStatus status = ReconciliationStatus::SYNCED;
    double local_qty = 0.0;     // signed
    double remote_qty = 0.0;    // signed
};

struct ReconciliationReport {
    long long ts_ms = 0;
    int positions_checked = 0;
    std::vector<PositionDrift> entries;

    int driftCount() const;
    bool inSync() const { return driftCount() == 0; }
};

// 로컬 포지션과 브로커 포지션 비교
class PositionReconciler {
public:
    explicit PositionReconciler(double quantity_tolerance = 1e-6);

    ReconciliationReport reconcile(const std::map<std::string, double>& local_signed_qty,
                                   const std::vector<BrokerPosition>& remote) const;

private:
    double quantity_tolerance_;
};

} // namespace core
} // namespace scalpengine
