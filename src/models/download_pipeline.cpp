#include "models/download_pipeline.h"

#include <spdlog/spdlog.h>

#include "utils/string_utils.h"

namespace airdl {

namespace {

struct PlannedTransfer {
    DownloadTarget target;
    std::string label;  // file name from the manifest, or the URL
};

std::string fetchErrorMessage(const FetchError& error, const std::string& version_id) {
    switch (error.kind) {
        case FetchErrorKind::kHttp:
            return "metadata for version " + version_id + " failed with HTTP " + std::to_string(error.status);
        case FetchErrorKind::kDecode:
            return "metadata for version " + version_id + " could not be decoded: " + error.message;
        case FetchErrorKind::kNetwork:
            break;
    }
    return "metadata for version " + version_id + " unavailable: " + error.message;
}

}  // namespace

DownloadPipeline::DownloadPipeline(const DownloadConfig& config,
                                   std::optional<std::string> auth_token,
                                   std::filesystem::path destination_dir,
                                   SelectionConstraints constraints)
    : registry_(RegistryInfo::fromConfig(config)),
      fetcher_(registry_, auth_token, config.timeout, config.user_agent),
      downloader_(registry_, std::move(auth_token), config.timeout, config.chunk_size, config.max_redirects,
                  config.user_agent),
      destination_dir_(std::move(destination_dir)),
      constraints_(std::move(constraints)) {}

SelectionConstraints DownloadPipeline::constraintsFor(const ResourceRef& ref) const {
    SelectionConstraints out = constraints_;
    if (const auto* url = std::get_if<UrlRef>(&ref)) {
        if (!out.size && url->query_size) {
            out.size = toLowerAscii(*url->query_size);
        }
        if (!out.fp && url->query_fp) {
            out.fp = normalizeFp(nlohmann::json(*url->query_fp));
        }
    }
    return out;
}

bool DownloadPipeline::canSkipMetadata(const ResourceRef& ref, const SelectionConstraints& constraints) {
    return formatOf(ref).has_value() && !constraints.hasFileConstraints() && !constraints.include_companions;
}

ReferenceReport DownloadPipeline::processReference(const std::string& raw) const {
    ReferenceReport report;
    report.raw = raw;

    auto fail = [&](DownloadErrorCode code, std::string message) {
        report.code = code;
        report.message = std::move(message);
        spdlog::warn("DownloadPipeline: {} failed: {} ({})", raw, report.message, to_string(code));
        if (callbacks_.on_reference_failed) {
            callbacks_.on_reference_failed(raw, code, report.message);
        }
        return report;
    };

    auto resolved = resolveReference(raw, registry_, mode_);
    if (!resolved.ok()) {
        return fail(resolved.error->code(), resolved.error->message);
    }
    report.ref = resolved.ref;
    const ResourceRef& ref = *resolved.ref;
    const std::string version_id = versionIdOf(ref);
    const SelectionConstraints constraints = constraintsFor(ref);
    spdlog::info("DownloadPipeline: resolved '{}' -> {}", raw, describeReference(ref));

    std::vector<PlannedTransfer> planned;
    if (canSkipMetadata(ref, constraints)) {
        const std::string format = *formatOf(ref);
        std::string type = "Model";
        std::string url;
        if (const auto* url_ref = std::get_if<UrlRef>(&ref)) {
            type = url_ref->query_type.value_or("Model");
            url = url_ref->raw_url;
        } else {
            url = buildDownloadUrl(registry_, version_id, std::string("Model"), format);
        }

        FileDecision decision{url, type, SelectionDecision::Included};
        const bool gated = equalsIgnoreCase(type, "Model");
        if (gated && !constraints.allow_unsafe_format && !isSafeFormat(format)) {
            decision.decision = SelectionDecision::SkippedUnsafe;
        }
        report.decisions.push_back(decision);
        if (callbacks_.on_selection) callbacks_.on_selection(raw, report.decisions);
        if (decision.decision != SelectionDecision::Included) {
            return fail(DownloadErrorCode::kNoMatchingFiles,
                        "format '" + format + "' is not " + kSafeFormat + " (use --force-unsafe to allow it)");
        }
        if (callbacks_.on_resolved) callbacks_.on_resolved(raw, url, format);
        planned.push_back(PlannedTransfer{DownloadTarget{url, true}, url});
    } else {
        auto fetched = fetcher_.fetch(version_id);
        if (!fetched.ok()) {
            return fail(DownloadErrorCode::kMetadataFetchFailed, fetchErrorMessage(*fetched.error, version_id));
        }
        const VersionMetadata& metadata = *fetched.metadata;

        auto selection = selectFilesWithReport(metadata.files, constraints);
        report.decisions = selection.decisions;
        for (const auto& d : report.decisions) {
            spdlog::debug("DownloadPipeline: {} [{}] {}", d.name, d.type, selectionDecisionToString(d.decision));
        }
        if (callbacks_.on_selection) callbacks_.on_selection(raw, report.decisions);

        if (callbacks_.on_resolved) {
            const std::string url = std::holds_alternative<UrlRef>(ref) ? std::get<UrlRef>(ref).raw_url
                                                                       : buildDownloadUrl(registry_, version_id);
            std::optional<std::string> format = formatOf(ref);
            if (!selection.selected.empty() && selection.selected.front().metadata.format) {
                format = selection.selected.front().metadata.format;
            }
            callbacks_.on_resolved(raw, url, format);
        }

        if (selection.selected.empty()) {
            return fail(DownloadErrorCode::kNoMatchingFiles,
                        "no files of version " + version_id + " ('" + metadata.name + "') match the constraints");
        }
        for (const auto& file : selection.selected) {
            std::string url = file.download_url
                                  ? *file.download_url
                                  : buildDownloadUrl(registry_, version_id, file.type, file.metadata.format,
                                                     file.metadata.size, file.metadata.fp);
            planned.push_back(PlannedTransfer{DownloadTarget{std::move(url), true}, file.name});
        }
    }

    std::optional<TransferReport> first_failure;
    for (const auto& plan : planned) {
        if (cancelled()) {
            report.transfers.push_back(
                TransferReport{plan.target.url, DownloadErrorCode::kCancelled, "cancelled before start", std::nullopt});
            if (!first_failure) first_failure = report.transfers.back();
            break;
        }
        spdlog::info("DownloadPipeline: downloading {} from {}", plan.label, plan.target.url);
        if (callbacks_.on_transfer_start) callbacks_.on_transfer_start(plan.target.url);

        ProgressCallback progress;
        if (callbacks_.on_progress) {
            progress = [this, &plan](size_t downloaded, size_t total) {
                callbacks_.on_progress(plan.target.url, downloaded, total);
            };
        }
        auto outcome = downloader_.transfer(plan.target, destination_dir_, progress, cancel_);

        TransferReport transfer{plan.target.url, outcome.code, outcome.message, outcome.data};
        if (outcome.ok()) {
            if (callbacks_.on_transfer_complete) callbacks_.on_transfer_complete(*outcome.data);
        } else {
            spdlog::warn("DownloadPipeline: {} failed: {} ({})", plan.target.url, outcome.message,
                         to_string(outcome.code));
            if (callbacks_.on_transfer_failed) {
                callbacks_.on_transfer_failed(plan.target.url, outcome.code, outcome.message);
            }
            if (!first_failure) first_failure = transfer;
        }
        report.transfers.push_back(std::move(transfer));
        if (outcome.code == DownloadErrorCode::kCancelled) break;
    }

    if (first_failure) {
        return fail(first_failure->code, first_failure->message);
    }
    return report;
}

std::vector<ReferenceReport> DownloadPipeline::processAll(const std::vector<std::string>& raws) const {
    std::vector<ReferenceReport> reports;
    reports.reserve(raws.size());
    for (const auto& raw : raws) {
        if (cancelled()) {
            spdlog::info("DownloadPipeline: cancelled, {} reference(s) not processed", raws.size() - reports.size());
            break;
        }
        reports.push_back(processReference(raw));
    }
    return reports;
}

int DownloadPipeline::exitCodeFor(const std::vector<ReferenceReport>& reports) {
    for (const auto& r : reports) {
        if (!r.ok()) return 1;
    }
    return 0;
}

int DownloadPipeline::run(const std::vector<std::string>& raws) const {
    auto reports = processAll(raws);
    if (reports.size() < raws.size()) {
        return 1;
    }
    return exitCodeFor(reports);
}

}  // namespace airdl
