#pragma once

#include <optional>
#include <string>
#include <vector>

#include "models/version_metadata.h"

namespace airdl {

/// The only serialization format that passes the safety gate (case-insensitive).
inline constexpr const char* kSafeFormat = "SafeTensor";

struct SelectionConstraints {
    std::optional<std::string> size;  // "full" | "pruned"
    std::optional<int> fp;            // 8 | 16 | 32
    bool include_companions{false};
    bool allow_unsafe_format{false};

    bool hasFileConstraints() const { return size.has_value() || fp.has_value(); }
};

enum class SelectionDecision {
    Included,
    SkippedCompanion,
    SkippedUnsafe,
    SkippedConstraintMismatch,
    SkippedOtherType,
};

std::string selectionDecisionToString(SelectionDecision decision);

struct FileDecision {
    std::string name;
    std::string type;
    SelectionDecision decision{SelectionDecision::Included};
};

struct SelectionReport {
    std::vector<FileDescriptor> selected;   // models first, then companions
    std::vector<FileDecision> decisions;    // one per manifest entry, manifest order
};

bool isModelFile(const FileDescriptor& file);
bool isCompanionFile(const FileDescriptor& file);
bool isSafeFormat(const std::optional<std::string>& format);
bool matchesConstraints(const FileDescriptor& file, const SelectionConstraints& constraints);

/// Filter the manifest. Never fails; an empty selection means nothing matched.
SelectionReport selectFilesWithReport(const std::vector<FileDescriptor>& files,
                                      const SelectionConstraints& constraints);

std::vector<FileDescriptor> selectFiles(const std::vector<FileDescriptor>& files,
                                        const SelectionConstraints& constraints);

}  // namespace airdl
