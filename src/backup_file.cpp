#include "backup_file.hpp"

namespace BackupLens {

std::string ChangeDescriptor::toString() const {
    switch (kind) {
        case Kind::Baseline:
            return "N/A";
        case Kind::Error:
            return "Error";
        case Kind::Changed:
            break;
    }

    std::string sign = direction > 0 ? "+" : direction < 0 ? "-" : "";
    return sign + std::to_string(changedLines) + " lines";
}

} // namespace BackupLens
