#include "cli_parser.hpp"
#include <CLI/CLI.hpp>

#ifndef PDFSPLIT_VERSION
#define PDFSPLIT_VERSION "0.0.0"
#endif

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", PDFSPLIT_VERSION);
    app.footer("Examples:\n"
               "  pdfsplit -i input.pdf -o output/ -p 1,10,20,30\n"
               "  pdfsplit --input book.pdf --output chapters/ --pages 1,50,100");

    // --- Required options ---
    app.add_option("-i,--input", settings.input_path, "Input PDF file path.")
        ->required()
        ->option_text("FILE");

    app.add_option("-o,--output", settings.output_dir, "Output directory path.")
        ->required()
        ->option_text("DIR");

    app.add_option("-p,--pages", settings.pages,
                   "Chapter start page numbers (comma-separated, e.g., 1,10,20,30).")
        ->required()
        ->option_text("PAGES");

    // --- Flags (booleans) ---
    app.add_flag("--dry-run", settings.dry_run,
                 "Print the chapters that would be written without writing them.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output.");

    // --- Logging ---
    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG.")
        ->default_val("WARNING")
        ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Append logs to a file (default: no file logging).");

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.quiet && settings.dry_run) {
            throw CLI::ValidationError("--quiet and --dry-run cannot be used together.");
        }
    });
}
