#include "Application.h"
#include "ArgumentParser.h"
#include "ConfigValidator.h"
#include "FileCollector.h"
#include "JSONWriter.h"
#include "Logging.h"
#include "PathFilter.h"
#include "Report.h"
#include "ScanRunner.h"
#include "TextWriter.h"
#include "Utils.h"
#include <fstream>
#include <iostream>

namespace inviscan {

int Application::run(int argc, char** argv) {
    auto& log = Logger::instance();
    log.set_level(LogLevel::Info);

    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) return parser.exit_code();
    if(cfg.patterns.empty()) {
        ArgumentParser::print_help(std::cout);
        return 0;
    }
    ConfigValidator validator;
    if(!validator.validate(cfg)) return exit_code(Verdict::OperationalError);

    if(cfg.verbose) log.set_level(LogLevel::Debug);
    if(!cfg.log_level.empty()) {
        LogLevel lvl;
        if(parse_log_level(cfg.log_level, lvl)) log.set_level(lvl);
    }

    for(const auto& p : cfg.patterns) log.info("Scanning files matching: " + utils::make_visible(p));
    log.debug(std::string("Options: json=") + (cfg.json ? "true" : "false") + ", sarif=" + (cfg.sarif ? "true" : "false")
              + ", scan_bundles=" + (cfg.scan_bundles ? "true" : "false") + ", fail_on_skip=" + (cfg.fail_on_skip ? "true" : "false")
              + ", parallel=" + (cfg.parallel ? "true" : "false"));

    PathFilter filter(cfg.scan_bundles, cfg.ignore_dirs);
    FileCollector collector(filter);
    CollectedFiles collected;
    try {
        collected = collector.collect(cfg.patterns);
    } catch(const InputResolutionError& ex) {
        log.error(utils::make_visible(ex.what()));
        return exit_code(Verdict::OperationalError);
    }
    for(const auto& p : collected.ignored) log.debug("(ignored) " + utils::make_visible(p));
    if(collected.files.empty()) {
        log.warn("All matched files are excluded by the path filter" + std::string(cfg.scan_bundles ? "" : " (use --scan-bundles for build output)"));
    }

    ScanRunner runner(cfg);
    Report report = Report::aggregate(runner.run(collected.files), cfg.fail_on_skip);
    log.debug("Scanned: " + std::to_string(report.total_files_scanned()) + " files, Skipped: "
              + std::to_string(report.skipped_files().size()) + " files, Ignored: " + std::to_string(collected.ignored.size()));
    for(const auto& s : report.skipped_files()) {
        log.log(cfg.fail_on_skip ? LogLevel::Warn : LogLevel::Debug, "Could not scan " + utils::make_visible(s.path) + ": " + s.reason);
    }

    std::string rendered;
    if(cfg.json || cfg.sarif) rendered = JSONWriter().write(report, cfg);
    else rendered = TextWriter().write(report, cfg);

    if(cfg.output_file.empty()) {
        out_ << rendered;
        out_.flush();
    } else {
        std::ofstream ofs(cfg.output_file, std::ios::binary | std::ios::trunc);
        if(!ofs) {
            log.error("Cannot open output file: " + utils::make_visible(cfg.output_file));
            return exit_code(Verdict::OperationalError);
        }
        ofs << rendered;
        if(!ofs.flush()) {
            log.error("Failed writing output file: " + utils::make_visible(cfg.output_file));
            return exit_code(Verdict::OperationalError);
        }
    }

    if(report.verdict() == Verdict::OperationalError) {
        log.error(std::to_string(report.skipped_files().size()) + " file(s) were skipped (--fail-on-skip enabled)");
    }
    return exit_code(report.verdict());
}

}
