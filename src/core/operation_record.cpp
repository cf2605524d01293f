/*!
 * \file operation_record.cpp
 * \brief Строковые представления типов и итогов операций.
 */
#include "operation_record.h"

#include <algorithm>
#include <cctype>

std::string operationKindToString(OperationKind kind) {
    switch (kind) {
        case OperationKind::BACKUP:  return "BACKUP";
        case OperationKind::DELETE:  return "DELETE";
        case OperationKind::RESTORE: return "RESTORE";
    }
    return "UNKNOWN";
}

std::optional<OperationKind> operationKindFromString(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    if (upper == "BACKUP") return OperationKind::BACKUP;
    if (upper == "DELETE") return OperationKind::DELETE;
    if (upper == "RESTORE") return OperationKind::RESTORE;
    return std::nullopt;
}

std::string operationOutcomeToString(OperationOutcome outcome) {
    switch (outcome) {
        case OperationOutcome::SUCCESS:   return "SUCCESS";
        case OperationOutcome::FAILURE:   return "FAILURE";
        case OperationOutcome::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}
