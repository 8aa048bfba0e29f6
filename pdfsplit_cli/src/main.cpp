#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "cli/exit_status.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libpdfsplit/include/event_bus.hpp"
#include "../../libpdfsplit/include/events.hpp"
#include "../../libpdfsplit/include/logger.hpp"
#include "../../libpdfsplit/include/page_list.hpp"
#include "../../libpdfsplit/include/qpdf_backend.hpp"
#include "../../libpdfsplit/include/split_config.hpp"
#include "../../libpdfsplit/include/split_error.hpp"
#include "../../libpdfsplit/include/splitter.hpp"

using namespace pdfsplit;

static std::atomic<bool> interrupted{false};
static Splitter* g_splitter = nullptr;

// handle ctrl+c or termination signals
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        if (g_splitter) {
            g_splitter->request_stop();
        }
        interrupted.store(true);
    }
}

namespace {

void setup_logging(const Settings& settings) {
    Logger::clear_sinks();

    if (!settings.log_file.empty()) {
        auto file_sink = std::make_unique<FileLogSink>(settings.log_file);
        if (!file_sink->is_open()) {
            std::cerr << YELLOW << "Warning: cannot open log file '" << settings.log_file.string()
                      << "'" << RESET << std::endl;
        } else {
            Logger::add_sink(std::move(file_sink));
        }
    }

    if (!settings.quiet) {
        auto console_sink = std::make_unique<ConsoleLogSink>();
        console_sink->log_level = Logger::string_to_level(settings.log_level).value_or(LogLevel::Warning);
        Logger::add_sink(std::move(console_sink));
    }
}

void print_plan(const SplitConfig& config, const std::vector<PageRange>& ranges) {
    const std::string stem = config.source_path().stem().string();
    std::size_t would_create = 0;
    for (const auto& range : ranges) {
        if (!range.in_range) {
            std::cout << YELLOW << "Would skip: page " << range.start << " is out of range" << RESET
                      << std::endl;
            continue;
        }
        std::cout << "Would create: " << (config.destination_dir() / chapter_file_name(stem, range)).string()
                  << " (pages " << range.start << "-" << range.end << ")" << std::endl;
        ++would_create;
    }
    std::cout << "\nDry run: " << would_create << " file(s) would be created" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {

    CLI::App app{"pdfsplit: Split a PDF into chapters by specified page numbers."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        app.exit(e);
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    setup_logging(settings);

    QpdfBackend backend;
    EventBus bus;

    if (!settings.quiet) {
        bus.subscribe<ChapterWrittenEvent>([](const ChapterWrittenEvent& e) {
            std::cout << GREEN << "Created: " << e.path.string()
                      << " (pages " << e.start << "-" << e.end << ")" << RESET << std::endl;
        });
        bus.subscribe<SplitCompleteEvent>([](const SplitCompleteEvent& e) {
            std::cout << "\nSplit complete: " << e.files_created << " file(s) created";
            if (e.ranges_skipped > 0) {
                std::cout << YELLOW << ", " << e.ranges_skipped << " page(s) skipped" << RESET;
            }
            std::cout << std::endl;
        });
    }

    Splitter splitter(backend, bus);

    try {
        auto break_pages = parse_page_list(settings.pages);
        const auto config = SplitConfig::build(settings.input_path,
                                               settings.output_dir,
                                               std::move(break_pages));

        if (settings.dry_run) {
            print_plan(config, splitter.plan(config));
            return 0;
        }

        g_splitter = &splitter;
        if (interrupted.load()) {
            splitter.request_stop();
        }
        // the summary comes from the SplitCompleteEvent subscriber
        splitter.split(config);
        g_splitter = nullptr;

        if (interrupted.load()) {
            std::cerr << "\nInterrupted" << std::endl;
            return EXIT_INTERRUPTED;
        }
    } catch (const SplitError& e) {
        g_splitter = nullptr;
        Logger::log(LogLevel::Debug, std::string("split failed: ") + error_kind_name(e.kind()), "main");
        return report_failure(e, std::cerr);
    } catch (const std::exception& e) {
        g_splitter = nullptr;
        Logger::log(LogLevel::Debug, std::string("unexpected failure: ") + e.what(), "main");
        return report_failure(e, std::cerr);
    }

    return 0;
}
