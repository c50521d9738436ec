#include "FileCollector.h"
#include "Logging.h"
#include "Utils.h"
#include <algorithm>
#include <filesystem>
#include <fnmatch.h>
#include <system_error>

namespace fs = std::filesystem;

namespace inviscan {

namespace {

std::string join(const std::string& dir, const std::string& name) {
    if(dir.empty()) return name;
    if(dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

bool is_dir(const std::string& p) { std::error_code ec; return fs::is_directory(p.empty() ? "." : p, ec); }
bool is_file(const std::string& p) { std::error_code ec; return fs::is_regular_file(p, ec); }
bool is_link(const std::string& p) { std::error_code ec; return fs::is_symlink(p, ec); }

} // namespace

bool FileCollector::has_wildcard(const std::string& s) {
    return s.find_first_of("*?[") != std::string::npos;
}

void FileCollector::validate_pattern(const std::string& pattern) {
    if(pattern.empty()) throw InputResolutionError("Invalid glob pattern: empty pattern");
    std::string comp;
    auto check = [&](const std::string& c) {
        if(c.find("**") != std::string::npos && c != "**")
            throw InputResolutionError("Invalid glob pattern '" + pattern + "': recursive wildcards must form a single path component");
        for(size_t i = 0; i < c.size(); ++i) {
            if(c[i] != '[') continue;
            size_t j = i + 1;
            if(j < c.size() && (c[j] == '!' || c[j] == '^')) ++j;
            if(j < c.size() && c[j] == ']') ++j; // leading ']' is literal
            while(j < c.size() && c[j] != ']') ++j;
            if(j >= c.size())
                throw InputResolutionError("Invalid glob pattern '" + pattern + "': unterminated character class");
            i = j;
        }
    };
    for(char ch : pattern) {
        if(ch == '/') { check(comp); comp.clear(); }
        else comp.push_back(ch);
    }
    check(comp);
}

CollectedFiles FileCollector::collect(const std::vector<std::string>& patterns) const {
    Acc acc;
    for(const auto& p : patterns) {
        validate_pattern(p);
        size_t before = acc.out.files.size() + acc.out.ignored.size();
        expand(p, acc);
        if(acc.out.files.size() + acc.out.ignored.size() == before)
            Logger::instance().warn("No files matched pattern: " + utils::make_visible(p));
    }
    if(acc.out.files.empty() && acc.out.ignored.empty()) {
        std::string all;
        for(size_t i = 0; i < patterns.size(); ++i) { if(i) all += ", "; all += patterns[i]; }
        throw InputResolutionError("No files matched pattern(s): " + all);
    }
    return std::move(acc.out);
}

void FileCollector::expand(const std::string& pattern, Acc& acc) const {
    std::string base = (pattern[0] == '/') ? "/" : "";
    std::vector<std::string> comps;
    {
        std::string cur;
        for(char c : pattern) {
            if(c == '/') { if(!cur.empty()) comps.push_back(cur); cur.clear(); }
            else cur.push_back(c);
        }
        if(!cur.empty()) comps.push_back(cur);
    }

    size_t first_wild = 0;
    while(first_wild < comps.size() && !has_wildcard(comps[first_wild])) {
        base = join(base, comps[first_wild]);
        ++first_wild;
    }

    if(first_wild == comps.size()) {
        // Literal path: a file, or a directory walked in full.
        if(is_file(base)) add_match(base, acc);
        else if(!base.empty() && is_dir(base)) {
            list_dir(base, true);
            walk_all(base, acc);
        }
        return;
    }
    if(!is_dir(base)) return;
    list_dir(base, true); // surface an unreadable base directory up front
    match(base, comps, first_wild, acc);
}

void FileCollector::match(const std::string& dir, const std::vector<std::string>& comps, size_t idx, Acc& acc) const {
    const std::string& comp = comps[idx];
    const bool last = idx + 1 == comps.size();

    if(comp == "**") {
        if(last) { walk_all(dir, acc); return; }
        match(dir, comps, idx + 1, acc);
        for(const auto& name : list_dir(dir, false)) {
            std::string sub = join(dir, name);
            if(filter_.is_ignored_component(name) || is_link(sub) || !is_dir(sub)) continue;
            match(sub, comps, idx, acc);
        }
        return;
    }

    if(has_wildcard(comp)) {
        for(const auto& name : list_dir(dir, false)) {
            if(fnmatch(comp.c_str(), name.c_str(), 0) != 0) continue;
            std::string p = join(dir, name);
            if(last) { if(is_file(p)) add_match(p, acc); }
            else if(is_dir(p)) match(p, comps, idx + 1, acc);
        }
        return;
    }

    std::string p = join(dir, comp);
    if(last) { if(is_file(p)) add_match(p, acc); }
    else if(is_dir(p)) match(p, comps, idx + 1, acc);
}

void FileCollector::walk_all(const std::string& dir, Acc& acc) const {
    for(const auto& name : list_dir(dir, false)) {
        std::string p = join(dir, name);
        if(is_file(p)) add_match(p, acc);
        else if(!filter_.is_ignored_component(name) && !is_link(p) && is_dir(p)) walk_all(p, acc);
    }
}

void FileCollector::add_match(const std::string& path, Acc& acc) const {
    if(!acc.seen.insert(path).second) return;
    if(filter_.should_ignore(path)) acc.out.ignored.push_back(path);
    else acc.out.files.push_back(path);
}

std::vector<std::string> FileCollector::list_dir(const std::string& dir, bool is_base) const {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(dir.empty() ? "." : dir, ec);
    if(ec) {
        std::string msg = "cannot list directory " + (dir.empty() ? std::string(".") : dir) + ": " + ec.message();
        if(is_base) throw InputResolutionError(msg);
        Logger::instance().warn(utils::make_visible(msg));
        return names;
    }
    for(; it != fs::directory_iterator(); it.increment(ec)) {
        if(ec) break;
        names.push_back(it->path().filename().string());
    }
    if(ec) Logger::instance().warn("error while listing " + utils::make_visible(dir) + ": " + ec.message());
    std::sort(names.begin(), names.end());
    return names;
}

}
