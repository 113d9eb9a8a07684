/*
 * mediafetch/src/cli/cmd_download.cpp
 *
 * `mediafetch download <manifest.json> -o <output>`
 * - The manifest is resolved through JsonManifestResolver (fixed-file mode).
 * - The item identity comes from the manifest's "item" object unless overridden by flags.
 * - The ledger gates the job (dedup) and records it on success.
 * - Ctrl+C cancels the job cooperatively; exit code 130.
 *
 * Integration notes:
 * - Exposes: void mediafetch::cli::registerDownloadCommand(CLI::App&, std::shared_ptr<CliRuntime>)
 */

#include <mediafetch/cli/commands.h>
#include <mediafetch/downloader/download_service.hpp>
#include <mediafetch/downloader/manifest_json.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace mediafetch::cli {

namespace {

struct DownloadOpts {
    fs::path manifest;
    fs::path output;

    // Item identity overrides
    std::optional<std::string> item_id;
    std::optional<std::string> source_type;
    std::optional<std::string> source_id;
    std::optional<std::string> source_name;

    std::optional<std::size_t> concurrency;
    bool force{false};
    bool emit_json{false};
};

json resultToJson(const downloader::JobResult& r) {
    json out = {{"type", "result"},
                {"job_id", r.jobId},
                {"item_id", r.itemId},
                {"state", downloader::jobStateToString(r.state)},
                {"destination", r.destination.string()},
                {"bytes_written", r.bytesWritten},
                {"ledger_recorded", r.ledgerRecorded},
                {"elapsed_ms", r.elapsed.count()},
                {"category", categoryToString(r.category)}};
    if (r.skipReason != downloader::SkipReason::None) {
        out["skip_reason"] = r.skipReason == downloader::SkipReason::AlreadyDownloaded
                                 ? "already_downloaded"
                                 : "destination_exists";
    }
    if (r.failedChunk)
        out["failed_chunk"] = *r.failedChunk;
    else
        out["failed_chunk"] = nullptr;
    if (r.error) {
        out["error"] = {{"code", errorToString(r.error->code)}, {"message", r.error->message}};
    } else {
        out["error"] = nullptr;
    }
    return out;
}

void printHuman(const downloader::JobResult& r) {
    using downloader::JobState;
    switch (r.state) {
        case JobState::Completed:
            fmt::print("Downloaded {} -> {} ({} bytes, {} ms)\n", r.itemId, r.destination.string(),
                       r.bytesWritten, r.elapsed.count());
            if (!r.ledgerRecorded)
                fmt::print("Warning: download history could not be updated\n");
            break;
        case JobState::Skipped:
            if (r.skipReason == downloader::SkipReason::AlreadyDownloaded) {
                fmt::print("Skipped {}: already downloaded (use --force to download again)\n",
                           r.itemId);
            } else {
                fmt::print("Skipped {}: {} already exists\n", r.itemId, r.destination.string());
            }
            break;
        case JobState::Cancelled:
            fmt::print("Cancelled {}\n", r.itemId);
            break;
        case JobState::Failed:
            fmt::print("Failed {} [{}]{}: {}\n", r.itemId, categoryToString(r.category),
                       r.failedChunk ? " at chunk " + std::to_string(*r.failedChunk)
                                     : std::string{},
                       r.error ? r.error->message : std::string{"unknown error"});
            break;
        default:
            break;
    }
}

int exitCodeFor(downloader::JobState state) {
    switch (state) {
        case downloader::JobState::Completed:
        case downloader::JobState::Skipped:
            return kExitOk;
        case downloader::JobState::Cancelled:
            return kExitInterrupted;
        default:
            return kExitFailure;
    }
}

int runDownload(const DownloadOpts& opts, CliRuntime& rt) {
    auto doc = downloader::loadManifestDocument(opts.manifest);
    if (!doc) {
        spdlog::error("{}", doc.error().message);
        return kExitFailure;
    }

    Item item = doc.value().item.value_or(Item{});
    if (opts.item_id)
        item.itemId = *opts.item_id;
    if (opts.source_type) {
        auto overridden = makeItemFromTag(item.itemId, *opts.source_type);
        item.sourceKind = overridden.sourceKind;
        item.sourceSubtype = overridden.sourceSubtype;
    }
    if (opts.source_id)
        item.sourceId = *opts.source_id;
    if (opts.source_name)
        item.sourceLabel = *opts.source_name;
    if (item.itemId.empty()) {
        spdlog::error("No item id: the manifest has no \"item.id\" and --item-id was not given");
        return kExitUsage;
    }

    auto cfg = rt.config().downloader;
    if (opts.concurrency)
        cfg.concurrency = *opts.concurrency;

    downloader::DownloadService::Collaborators collab;
    collab.resolver = std::make_unique<downloader::JsonManifestResolver>(opts.manifest);
    downloader::DownloadService service(rt.ledger(), cfg, std::move(collab));

    downloader::JobRequest request;
    request.item = item;
    request.destination = opts.output;
    request.force = opts.force;

    auto handle = service.submitJob(std::move(request));
    if (!handle) {
        spdlog::error("Cannot start download: {}", handle.error().message);
        return kExitFailure;
    }

    auto future = handle.value().result;
    bool cancelSent = false;
    while (future.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
        if (g_interrupted.load() && !cancelSent) {
            spdlog::warn("Interrupted; cancelling download of {}", item.itemId);
            service.cancelAll();
            cancelSent = true;
        }
        auto ev = service.events().pop_for(std::chrono::milliseconds(200));
        if (!ev)
            continue;
        if (ev->kind == downloader::JobEventKind::ChunkCompleted && !opts.emit_json) {
            spdlog::info("{}: {}/{} chunks", ev->itemId, ev->chunksDone, ev->chunksTotal);
        } else if (ev->kind == downloader::JobEventKind::StateChanged) {
            spdlog::debug("{}: {}", ev->itemId, downloader::jobStateToString(ev->state));
        }
    }

    const auto& result = future.get();
    if (opts.emit_json) {
        // Strictly JSON to stdout
        fmt::print("{}\n", resultToJson(result).dump());
    } else {
        printHuman(result);
    }
    return exitCodeFor(result.state);
}

} // namespace

void registerDownloadCommand(CLI::App& app, std::shared_ptr<CliRuntime> runtime) {
    auto* sub = app.add_subcommand(
        "download", "Download one item described by a manifest file, decrypting and reassembling "
                    "its chunks into the output file.");

    auto opts = std::make_shared<DownloadOpts>();

    sub->add_option("manifest", opts->manifest, "Path to the item's manifest (JSON).")
        ->required()
        ->check(CLI::ExistingFile);
    sub->add_option("-o,--output", opts->output, "Destination file.")->required();

    sub->add_option("--item-id", opts->item_id, "Item id (overrides manifest item.id).");
    sub->add_option("--source-type", opts->source_type,
                    "Source tag: manual, playlist, album, mix, ... (overrides manifest).");
    sub->add_option("--source-id", opts->source_id, "Id of the originating collection.");
    sub->add_option("--source-name", opts->source_name, "Display name of the source.");

    sub->add_option("-c,--concurrency", opts->concurrency, "Parallel chunk downloads.")
        ->check(CLI::Range(1, 64));
    sub->add_flag("--force", opts->force,
                  "Download even if already in the history or the output exists.");
    sub->add_flag("--json", opts->emit_json,
                  "Emit final result as JSON to stdout (logs to stderr).");

    sub->callback([opts, runtime]() {
        if (auto r = runtime->init(); !r) {
            spdlog::error("{}", r.error().message);
            runtime->exitCode = kExitFailure;
            return;
        }
        runtime->exitCode = runDownload(*opts, *runtime);
    });

    sub->footer(R"(Behavior:
  - Items already in the download history are skipped unless --force is given
    (toggle globally with `mediafetch history dedup on|off`).
  - The output only appears once every chunk is written and verified; failed or
    cancelled downloads leave nothing behind.
  - Use --json for machine-readable output (final result on stdout; logs on stderr).)");
}

} // namespace mediafetch::cli
