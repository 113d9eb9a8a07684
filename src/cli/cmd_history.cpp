/*
 * mediafetch/src/cli/cmd_history.cpp
 *
 * `mediafetch history <status|remove|dedup|export|import|stats|list|clear>`
 * Management of the download history (dedup ledger).
 */

#include <mediafetch/cli/commands.h>
#include <mediafetch/core/timestamp.h>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <functional>
#include <string>

namespace mediafetch::cli {

using json = nlohmann::json;

namespace {

// Runs `body` once the runtime is ready, storing its exit code.
std::function<void()> withRuntime(std::shared_ptr<CliRuntime> runtime,
                                  std::function<int(CliRuntime&)> body) {
    return [runtime, body = std::move(body)]() {
        if (auto r = runtime->init(); !r) {
            spdlog::error("{}", r.error().message);
            runtime->exitCode = kExitFailure;
            return;
        }
        runtime->exitCode = body(*runtime);
    };
}

std::string describeEntry(const ledger::LedgerEntry& e) {
    std::string out = e.itemId + "  " + formatIso8601(e.completedAt) + "  " + e.sourceTag();
    if (e.sourceId)
        out += ":" + *e.sourceId;
    if (e.sourceLabel)
        out += "  \"" + *e.sourceLabel + "\"";
    return out;
}

int reportFailure(const Error& err) {
    spdlog::error("{}", err.message);
    return kExitFailure;
}

} // namespace

void registerHistoryCommand(CLI::App& app, std::shared_ptr<CliRuntime> runtime) {
    auto* history = app.add_subcommand("history", "Inspect and manage the download history.");
    history->require_subcommand(1);

    // status
    {
        auto* sub = history->add_subcommand("status", "Show whether an item was downloaded.");
        auto id = std::make_shared<std::string>();
        sub->add_option("item_id", *id, "Item id")->required();
        sub->callback(withRuntime(runtime, [id](CliRuntime& rt) {
            auto& ledger = rt.ledger();
            auto entry = ledger.entry(*id);
            if (entry) {
                fmt::print("{}: downloaded\n  {}\n", *id, describeEntry(*entry));
            } else {
                fmt::print("{}: not downloaded\n", *id);
            }
            fmt::print("Duplicate prevention: {}{}\n", ledger.dedupEnabled() ? "on" : "off",
                       entry && ledger.dedupEnabled() ? " (a new download would be skipped)"
                                                      : "");
            return kExitOk;
        }));
    }

    // remove
    {
        auto* sub = history->add_subcommand("remove", "Forget an item so it can be downloaded "
                                                      "again.");
        auto id = std::make_shared<std::string>();
        sub->add_option("item_id", *id, "Item id")->required();
        sub->callback(withRuntime(runtime, [id](CliRuntime& rt) {
            if (!rt.ledger().remove(*id)) {
                fmt::print("{} is not in the history\n", *id);
                return kExitFailure;
            }
            fmt::print("Removed {} from the history\n", *id);
            return kExitOk;
        }));
    }

    // dedup on|off
    {
        auto* sub = history->add_subcommand("dedup", "Turn duplicate prevention on or off.");
        auto mode = std::make_shared<std::string>();
        sub->add_option("mode", *mode, "on or off")
            ->required()
            ->check(CLI::IsMember({"on", "off"}));
        sub->callback(withRuntime(runtime, [mode](CliRuntime& rt) {
            const bool enabled = *mode == "on";
            if (auto r = rt.ledger().setDedupEnabled(enabled); !r)
                return reportFailure(r.error());
            fmt::print("Duplicate prevention {}\n", enabled ? "enabled" : "disabled");
            return kExitOk;
        }));
    }

    // export
    {
        auto* sub = history->add_subcommand("export", "Write the history to a JSON file.");
        auto path = std::make_shared<std::string>();
        sub->add_option("path", *path, "Target file")->required();
        sub->callback(withRuntime(runtime, [path](CliRuntime& rt) {
            if (auto r = rt.ledger().exportTo(*path); !r)
                return reportFailure(r.error());
            fmt::print("Exported {} entries to {}\n", rt.ledger().size(), *path);
            return kExitOk;
        }));
    }

    // import
    {
        auto* sub = history->add_subcommand("import", "Merge (or replace) history from a file.");
        auto path = std::make_shared<std::string>();
        auto replace = std::make_shared<bool>(false);
        sub->add_option("path", *path, "Source file")->required()->check(CLI::ExistingFile);
        sub->add_flag("--replace", *replace, "Replace the whole history instead of merging.");
        sub->callback(withRuntime(runtime, [path, replace](CliRuntime& rt) {
            auto r = rt.ledger().importFrom(
                *path, *replace ? ledger::ImportMode::Replace : ledger::ImportMode::Merge);
            if (!r)
                return reportFailure(r.error());
            fmt::print("{} ({} total)\n", r.value().message, r.value().total);
            return kExitOk;
        }));
    }

    // stats
    {
        auto* sub = history->add_subcommand("stats", "Summarize the history.");
        auto asJson = std::make_shared<bool>(false);
        sub->add_flag("--json", *asJson, "Emit JSON to stdout.");
        sub->callback(withRuntime(runtime, [asJson](CliRuntime& rt) {
            const auto stats = rt.ledger().statistics();
            const bool dedup = rt.ledger().dedupEnabled();
            if (*asJson) {
                json bySource = json::object();
                for (const auto& [tag, n] : stats.bySourceTag)
                    bySource[tag] = n;
                json out = {{"total_entries", stats.totalEntries},
                            {"dedup_enabled", dedup},
                            {"by_source_type", bySource},
                            {"oldest", stats.oldest ? json(formatIso8601(*stats.oldest)) : json()},
                            {"newest", stats.newest ? json(formatIso8601(*stats.newest)) : json()},
                            {"path", rt.ledger().path().string()}};
                fmt::print("{}\n", out.dump(2));
                return kExitOk;
            }
            fmt::print("History file: {}\n", rt.ledger().path().string());
            fmt::print("Total downloads: {}\n", stats.totalEntries);
            fmt::print("Duplicate prevention: {}\n", dedup ? "on" : "off");
            for (const auto& [tag, n] : stats.bySourceTag)
                fmt::print("  {}: {}\n", tag, n);
            if (stats.oldest)
                fmt::print("Oldest: {}\n", formatIso8601(*stats.oldest));
            if (stats.newest)
                fmt::print("Newest: {}\n", formatIso8601(*stats.newest));
            return kExitOk;
        }));
    }

    // list
    {
        auto* sub = history->add_subcommand("list", "List downloads grouped by source.");
        sub->callback(withRuntime(runtime, [](CliRuntime& rt) {
            const auto groups = rt.ledger().groupBySource();
            if (groups.empty()) {
                fmt::print("History is empty\n");
                return kExitOk;
            }
            for (const auto& [key, entries] : groups) {
                const auto& first = entries.front();
                fmt::print("{} ({} items){}\n", key, entries.size(),
                           first.sourceLabel ? " - " + *first.sourceLabel : std::string{});
                for (const auto& e : entries)
                    fmt::print("  {}\n", describeEntry(e));
            }
            return kExitOk;
        }));
    }

    // clear
    {
        auto* sub = history->add_subcommand("clear", "Delete every history entry.");
        auto yes = std::make_shared<bool>(false);
        sub->add_flag("--yes", *yes, "Confirm clearing the history.");
        sub->callback(withRuntime(runtime, [yes](CliRuntime& rt) {
            if (!*yes) {
                spdlog::error("Refusing to clear the history without --yes");
                return kExitUsage;
            }
            const auto n = rt.ledger().size();
            if (auto r = rt.ledger().clear(); !r)
                return reportFailure(r.error());
            fmt::print("Cleared {} entries\n", n);
            return kExitOk;
        }));
    }
}

} // namespace mediafetch::cli
