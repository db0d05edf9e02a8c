#include "models/file_selector.h"

#include "utils/string_utils.h"

namespace airdl {

std::string selectionDecisionToString(SelectionDecision decision) {
    switch (decision) {
        case SelectionDecision::Included:
            return "included";
        case SelectionDecision::SkippedCompanion:
            return "skipped-as-companion";
        case SelectionDecision::SkippedUnsafe:
            return "skipped-as-unsafe";
        case SelectionDecision::SkippedConstraintMismatch:
            return "skipped-as-constraint-mismatch";
        case SelectionDecision::SkippedOtherType:
            return "skipped-other-type";
    }
    return "unknown";
}

bool isModelFile(const FileDescriptor& file) {
    return file.type == "Model";
}

bool isCompanionFile(const FileDescriptor& file) {
    return file.type == "VAE" || file.type == "Other";
}

bool isSafeFormat(const std::optional<std::string>& format) {
    return format.has_value() && equalsIgnoreCase(trimAscii(*format), kSafeFormat);
}

bool matchesConstraints(const FileDescriptor& file, const SelectionConstraints& constraints) {
    if (constraints.size && file.metadata.size != constraints.size) {
        return false;
    }
    if (constraints.fp && file.metadata.fp != constraints.fp) {
        return false;
    }
    return true;
}

SelectionReport selectFilesWithReport(const std::vector<FileDescriptor>& files,
                                      const SelectionConstraints& constraints) {
    SelectionReport report;
    std::vector<FileDescriptor> companions;
    report.decisions.reserve(files.size());

    for (const auto& file : files) {
        FileDecision decision{file.name, file.type, SelectionDecision::Included};
        if (isModelFile(file)) {
            // size/fp first, then the safety gate on whatever survived
            if (!matchesConstraints(file, constraints)) {
                decision.decision = SelectionDecision::SkippedConstraintMismatch;
            } else if (!constraints.allow_unsafe_format && !isSafeFormat(file.metadata.format)) {
                decision.decision = SelectionDecision::SkippedUnsafe;
            } else {
                report.selected.push_back(file);
            }
        } else if (isCompanionFile(file)) {
            if (constraints.include_companions) {
                companions.push_back(file);
            } else {
                decision.decision = SelectionDecision::SkippedCompanion;
            }
        } else {
            decision.decision = SelectionDecision::SkippedOtherType;
        }
        report.decisions.push_back(std::move(decision));
    }

    report.selected.insert(report.selected.end(), companions.begin(), companions.end());
    return report;
}

std::vector<FileDescriptor> selectFiles(const std::vector<FileDescriptor>& files,
                                        const SelectionConstraints& constraints) {
    return selectFilesWithReport(files, constraints).selected;
}

}  // namespace airdl
