#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <snipvault/config/store_config.h>
#include <snipvault/logging/logging.h>
#include <snipvault/store/migration.h>
#include <snipvault/store/store.h>
#include <snipvault/version.hpp>

#include <functional>
#include <iostream>
#include <memory>
#include <string>

using json = nlohmann::json;

namespace snipvault::admin {

namespace {

class AdminCli {
public:
    int run(int argc, char** argv) {
        CLI::App app{"snipvault-admin - maintenance for the item store"};
        app.set_version_flag("--version", SNIPVAULT_VERSION_STRING);
        app.require_subcommand(1);

        app.add_option("-c,--config", configPath_, "Config file (default: XDG config dir)");
        app.add_option("--db", dbOverride_, "Database path, overrides config");
        app.add_option("--log-level", logLevel_, "trace, debug, info, warn, error");
        app.add_flag("--json", jsonOutput_, "Print machine-readable JSON");

        app.add_subcommand("init", "Create the database and content key")
            ->callback([this] { dispatch("init", [this] { return cmdInit(); }); });

        app.add_subcommand("stats", "Show row counts and tag statistics")
            ->callback([this] { dispatch("stats", [this] { return cmdStats(); }); });

        auto* tags = app.add_subcommand("tags", "List tags with usage counts");
        tags->add_flag("--by-usage", byUsage_, "Sort by usage count");
        tags->callback([this] { dispatch("tags", [this] { return cmdTags(); }); });

        app.add_subcommand("prune-tags", "Delete tags with no items")
            ->callback([this] { dispatch("prune-tags", [this] { return cmdPruneTags(); }); });

        app.add_subcommand("recount-tags", "Recompute every tag's usage count")
            ->callback([this] { dispatch("recount-tags", [this] { return cmdRecountTags(); }); });

        auto* renumber = app.add_subcommand("renumber", "Close gaps in a list's positions");
        renumber->add_option("list_id", targetId_, "List id")->required();
        renumber->callback([this] { dispatch("renumber", [this] { return cmdRenumber(); }); });

        auto* check = app.add_subcommand("check-list", "Check that positions are contiguous");
        check->add_option("list_id", targetId_, "List id")->required();
        check->callback([this] { dispatch("check-list", [this] { return cmdCheckList(); }); });

        auto* exportTable = app.add_subcommand("export-table", "Print a table as a JSON matrix");
        exportTable->add_option("table_id", targetId_, "Table id")->required();
        exportTable->callback(
            [this] { dispatch("export-table", [this] { return cmdExportTable(); }); });

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return app.exit(e);
        }
        return exitCode_;
    }

private:
    std::string configPath_;
    std::string dbOverride_;
    std::string logLevel_;
    bool jsonOutput_ = false;
    bool byUsage_ = false;
    int64_t targetId_ = 0;
    int exitCode_ = 0;
    std::unique_ptr<store::Store> store_;

    void dispatch(const char* name, const std::function<Result<void>()>& command) {
        auto result = command();
        if (!result) {
            spdlog::error("{} failed: {} ({})", name, result.error().message, result.error().code);
            exitCode_ = 1;
        }
    }

    Result<void> openStore() {
        auto config = config::resolveStoreConfig(configPath_);
        if (!config) {
            return config.error();
        }
        auto cfg = std::move(config).value();
        if (!dbOverride_.empty()) {
            cfg.databasePath = dbOverride_;
        }
        if (!logLevel_.empty()) {
            cfg.logging.level = logLevel_;
        }

        auto logged = logging::configureLogging(cfg.logging);
        if (!logged) {
            return logged.error();
        }

        auto opened = store::openStore(cfg);
        if (!opened) {
            return opened.error();
        }
        store_ = std::move(opened).value();
        return {};
    }

    Result<void> cmdInit() {
        if (auto r = openStore(); !r) {
            return r;
        }
        auto version = store_->schemaVersion();
        if (!version) {
            return version.error();
        }
        if (jsonOutput_) {
            std::cout << json{{"database", store_->database().path()},
                              {"schema_version", version.value()}}
                             .dump(2)
                      << "\n";
        } else {
            std::cout << "Initialized " << store_->database().path() << " (schema v"
                      << version.value() << ")\n";
        }
        return {};
    }

    Result<void> cmdStats() {
        if (auto r = openStore(); !r) {
            return r;
        }
        auto stats = store_->repository().statistics();
        if (!stats) {
            return stats.error();
        }
        const auto& s = stats.value();
        json out{{"collections", s.collections},
                 {"lists", s.lists},
                 {"tables", s.tables},
                 {"items",
                  {{"total", s.items},
                   {"standalone", s.standaloneItems},
                   {"list_steps", s.listSteps},
                   {"table_cells", s.tableCells},
                   {"sensitive", s.sensitiveItems}}},
                 {"tags",
                  {{"total", s.tags.totalTags},
                   {"in_use", s.tags.tagsInUse},
                   {"unused", s.tags.unusedTags},
                   {"associations", s.tags.totalAssociations},
                   {"avg_per_item", s.tags.averageTagsPerItem}}}};
        if (jsonOutput_) {
            std::cout << out.dump(2) << "\n";
            return {};
        }
        std::cout << "Collections: " << s.collections << "\n"
                  << "Lists:       " << s.lists << "\n"
                  << "Tables:      " << s.tables << "\n"
                  << "Items:       " << s.items << " (" << s.standaloneItems << " standalone, "
                  << s.listSteps << " steps, " << s.tableCells << " cells, " << s.sensitiveItems
                  << " sensitive)\n"
                  << "Tags:        " << s.tags.totalTags << " (" << s.tags.unusedTags
                  << " unused, " << s.tags.totalAssociations << " associations)\n";
        return {};
    }

    Result<void> cmdTags() {
        if (auto r = openStore(); !r) {
            return r;
        }
        auto tags = store_->repository().tagManager().listTags(byUsage_ ? store::TagOrder::Usage
                                                                        : store::TagOrder::Name);
        if (!tags) {
            return tags.error();
        }
        if (jsonOutput_) {
            json out = json::array();
            for (const auto& tag : tags.value()) {
                json entry{{"name", tag.name}, {"usage_count", tag.usageCount}};
                if (tag.lastUsed) {
                    entry["last_used"] = store::toUnixSeconds(*tag.lastUsed);
                }
                out.push_back(std::move(entry));
            }
            std::cout << out.dump(2) << "\n";
            return {};
        }
        for (const auto& tag : tags.value()) {
            std::cout << tag.name << "\t" << tag.usageCount << "\n";
        }
        return {};
    }

    Result<void> cmdPruneTags() {
        if (auto r = openStore(); !r) {
            return r;
        }
        auto pruned = store_->repository().tagManager().pruneUnusedTags();
        if (!pruned) {
            return pruned.error();
        }
        std::cout << "Pruned " << pruned.value() << " unused tag(s)\n";
        return {};
    }

    Result<void> cmdRecountTags() {
        if (auto r = openStore(); !r) {
            return r;
        }
        auto corrected = store_->repository().tagManager().recountAllTags();
        if (!corrected) {
            return corrected.error();
        }
        std::cout << "Corrected " << corrected.value() << " tag count(s)\n";
        return {};
    }

    Result<void> cmdRenumber() {
        if (auto r = openStore(); !r) {
            return r;
        }
        auto changed = store_->repository().renumberList(targetId_);
        if (!changed) {
            return changed.error();
        }
        std::cout << "Renumbered " << changed.value() << " step(s) in list " << targetId_ << "\n";
        return {};
    }

    Result<void> cmdCheckList() {
        if (auto r = openStore(); !r) {
            return r;
        }
        auto contiguous = store_->repository().checkListContiguity(targetId_);
        if (!contiguous) {
            return contiguous.error();
        }
        if (jsonOutput_) {
            std::cout << json{{"list_id", targetId_}, {"contiguous", contiguous.value()}}.dump(2)
                      << "\n";
        } else {
            std::cout << "List " << targetId_
                      << (contiguous.value() ? " is contiguous\n" : " has gaps or duplicates\n");
        }
        if (!contiguous.value()) {
            exitCode_ = 2;
        }
        return {};
    }

    Result<void> cmdExportTable() {
        if (auto r = openStore(); !r) {
            return r;
        }
        auto matrix = store_->repository().exportTable(targetId_);
        if (!matrix) {
            return matrix.error();
        }
        json out{{"columns", matrix.value().columns}, {"rows", matrix.value().rows}};
        std::cout << out.dump(2) << "\n";
        return {};
    }
};

} // namespace

} // namespace snipvault::admin

int main(int argc, char** argv) {
    spdlog::set_level(spdlog::level::warn);
    snipvault::admin::AdminCli cli;
    return cli.run(argc, argv);
}
