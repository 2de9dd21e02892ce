#include "ResticTypes.hpp"

namespace Rbum {

QString toString(ResticOperationType type) {
    switch (type) {
        case ResticOperationType::Init: return "init";
        case ResticOperationType::Backup: return "backup";
        case ResticOperationType::Snapshots: return "snapshots";
        case ResticOperationType::Restore: return "restore";
        case ResticOperationType::Check: return "check";
        case ResticOperationType::Custom: return "custom";
    }
    return "custom";
}

QString toString(ResticOperationStatus status) {
    switch (status) {
        case ResticOperationStatus::Pending: return "pending";
        case ResticOperationStatus::Running: return "running";
        case ResticOperationStatus::Completed: return "completed";
        case ResticOperationStatus::Failed: return "failed";
        case ResticOperationStatus::Cancelled: return "cancelled";
    }
    return "pending";
}

ResticOperationType operationTypeForCommand(const QString& command) {
    if (command == "init") return ResticOperationType::Init;
    if (command == "backup") return ResticOperationType::Backup;
    if (command == "snapshots") return ResticOperationType::Snapshots;
    if (command == "restore") return ResticOperationType::Restore;
    if (command == "check") return ResticOperationType::Check;
    return ResticOperationType::Custom;
}

} // namespace Rbum
