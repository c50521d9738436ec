#include "ScanRunner.h"
#include "Logging.h"
#include "Utils.h"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <optional>
#include <thread>

namespace fs = std::filesystem;

namespace inviscan {

ScanRunner::ScanRunner(const Config& cfg)
    : cfg_(cfg), scanner_(cfg.verbose ? kVerboseContextRadius : kDefaultContextRadius) {}

size_t ScanRunner::worker_count(size_t file_count) const {
    if(!cfg_.parallel || file_count < 2) return 1;
    size_t n = cfg_.parallel_max_threads > 0 ? static_cast<size_t>(cfg_.parallel_max_threads)
                                             : std::thread::hardware_concurrency();
    if(n == 0) n = 1;
    return std::min(n, file_count);
}

ScanResult ScanRunner::scan_file(const std::string& path) const {
    try {
        std::error_code ec;
        auto size = fs::file_size(path, ec);
        if(ec) return scanner_.scan_unreadable(path, "cannot stat file: " + ec.message());
        if(cfg_.max_file_size > 0 && size > static_cast<uintmax_t>(cfg_.max_file_size)) {
            return scanner_.scan_unreadable(path, "file exceeds max size (" + std::to_string(cfg_.max_file_size) + " bytes)");
        }
        std::string content, err;
        if(!utils::read_file(path, content, err)) return scanner_.scan_unreadable(path, err);

        ScanResult r = scanner_.scan(path, content);
        if(!r.skipped()) r.sha256 = utils::sha256_hex(content);
        return r;
    } catch(const std::exception& ex) {
        return scanner_.scan_unreadable(path, std::string("scan failed: ") + ex.what());
    }
}

std::vector<ScanResult> ScanRunner::run(const std::vector<std::string>& files) const {
    auto& log = Logger::instance();
    std::vector<std::optional<ScanResult>> slots(files.size());
    std::atomic<size_t> next{0};
    std::atomic<bool> stop{false};

    auto worker = [&]() {
        while(!stop.load()) {
            size_t i = next.fetch_add(1);
            if(i >= files.size()) break;
            log.debug("Scanning " + utils::make_visible(files[i]));
            ScanResult r = scan_file(files[i]);
            // Stop only once the final verdict can no longer change: with
            // fail_on_skip a skip decides it, otherwise the first finding does.
            if(r.skipped()) {
                log.debug("Skipped " + utils::make_visible(files[i]) + ": " + *r.decode_error);
                if(cfg_.fail_fast && cfg_.fail_on_skip) stop.store(true);
            } else if(!r.findings.empty()) {
                log.debug("Findings in " + utils::make_visible(files[i]) + ": " + std::to_string(r.findings.size()));
                if(cfg_.fail_fast && !cfg_.fail_on_skip) stop.store(true);
            }
            slots[i] = std::move(r);
        }
    };

    size_t workers = worker_count(files.size());
    if(workers <= 1) {
        worker();
    } else {
        log.debug("Scanning " + std::to_string(files.size()) + " files on " + std::to_string(workers) + " threads");
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for(size_t t = 0; t < workers; ++t) pool.emplace_back(worker);
        for(auto& th : pool) th.join();
    }

    std::vector<ScanResult> results;
    results.reserve(files.size());
    for(auto& s : slots) if(s) results.push_back(std::move(*s));
    if(stop.load() && results.size() < files.size()) {
        log.info("Stopped early, verdict already decided; " + std::to_string(files.size() - results.size()) + " file(s) not scanned");
    }
    return results;
}

}
