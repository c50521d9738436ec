#include "JSONWriter.h"
#include "BuildInfo.h"
#include "Classifier.h"
#include "JsonUtil.h"
#include "Severity.h"
#include <map>
#include <sstream>
#include <vector>

namespace inviscan {
namespace {

    struct CanonVal {
        enum Type { T_OBJ, T_ARR, T_STR, T_NUM, T_BOOL } type = T_OBJ;
        std::map<std::string, CanonVal> obj;
        std::vector<CanonVal> arr;
        std::string str; // string, number or bool token text
        CanonVal() = default;
        explicit CanonVal(Type t): type(t) {}
    };

    static void canon_emit(const CanonVal& v, std::ostream& os);

    using jsonutil::escape;

    static void put_str(CanonVal& o, const std::string& k, const std::string& v) {
        o.obj[k].type = CanonVal::T_STR;
        o.obj[k].str = v;
    }

    static void put_num(CanonVal& o, const std::string& k, unsigned long long v) {
        o.obj[k].type = CanonVal::T_NUM;
        o.obj[k].str = std::to_string(v);
    }

    static void put_bool(CanonVal& o, const std::string& k, bool v) {
        o.obj[k].type = CanonVal::T_BOOL;
        o.obj[k].str = v ? "true" : "false";
    }

    static CanonVal text_obj(const std::string& text) {
        CanonVal m{CanonVal::T_OBJ};
        put_str(m, "text", text);
        return m;
    }

    static void emit_array(const CanonVal& v, std::ostream& os) {
        os << '[';
        bool first = true;
        for (const auto& e : v.arr) {
            if (!first) os << ',';
            first = false;
            canon_emit(e, os);
        }
        os << ']';
    }

    static void emit_object(const CanonVal& v, std::ostream& os) {
        os << '{';
        bool first = true;
        for (const auto& kv : v.obj) {
            if (!first) os << ',';
            first = false;
            os << '"' << escape(kv.first) << '"' << ':';
            canon_emit(kv.second, os);
        }
        os << '}';
    }

    static void canon_emit(const CanonVal& v, std::ostream& os) {
        switch (v.type) {
            case CanonVal::T_STR:
                os << '"' << escape(v.str) << '"';
                break;
            case CanonVal::T_NUM:
            case CanonVal::T_BOOL:
                os << v.str;
                break;
            case CanonVal::T_ARR:
                emit_array(v, os);
                break;
            case CanonVal::T_OBJ:
                emit_object(v, os);
                break;
        }
    }

    static CanonVal build_meta_object() {
        CanonVal meta{CanonVal::T_OBJ};
        put_str(meta, "json_schema_version", "1");
        put_str(meta, "tool", "inviscan");
        put_str(meta, "tool_version", buildinfo::APP_VERSION);
        return meta;
    }

    static CanonVal build_finding_object(const Finding& f) {
        CanonVal fv{CanonVal::T_OBJ};
        put_num(fv, "byte_offset", f.byte_offset);
        put_str(fv, "category", category_label(f.category));
        put_str(fv, "code_point", format_code_point(f.code_point));
        put_num(fv, "code_point_value", f.code_point);
        put_num(fv, "column", f.column);
        put_str(fv, "context", f.context);
        put_str(fv, "description", code_point_description(f.code_point));
        put_str(fv, "file_path", f.file_path);
        put_num(fv, "line", f.line);
        put_str(fv, "name", code_point_name(f.code_point));
        put_str(fv, "severity", severity_to_string(category_severity(f.category)));
        return fv;
    }

    static CanonVal build_per_file_array(const Report& report) {
        CanonVal files{CanonVal::T_ARR};
        for (const auto& r : report.per_file()) {
            CanonVal rv{CanonVal::T_OBJ};
            put_str(rv, "file_path", r.file_path);
            put_num(rv, "byte_size", r.byte_size);
            if (r.decode_error) put_str(rv, "decode_error", *r.decode_error);
            if (!r.sha256.empty()) put_str(rv, "sha256", r.sha256);
            put_num(rv, "finding_count", r.findings.size());
            CanonVal findings{CanonVal::T_ARR};
            for (const auto& f : r.findings) findings.arr.push_back(build_finding_object(f));
            rv.obj["findings"] = std::move(findings);
            files.arr.push_back(std::move(rv));
        }
        return files;
    }

    static CanonVal build_skipped_array(const Report& report) {
        CanonVal skipped{CanonVal::T_ARR};
        for (const auto& s : report.skipped_files()) {
            CanonVal sv{CanonVal::T_OBJ};
            put_str(sv, "path", s.path);
            put_str(sv, "reason", s.reason);
            skipped.arr.push_back(std::move(sv));
        }
        return skipped;
    }

    static CanonVal build_severity_counts(const Report& report) {
        std::map<std::string, size_t> counts;
        for (RiskCategory c : risk_categories()) counts[severity_to_string(category_severity(c))] = 0;
        for (const auto& r : report.per_file())
            for (const auto& f : r.findings) ++counts[severity_to_string(category_severity(f.category))];
        CanonVal sev{CanonVal::T_OBJ};
        for (const auto& kv : counts) put_num(sev, kv.first, kv.second);
        return sev;
    }

    static CanonVal build_canonical(const Report& report) {
        CanonVal root{CanonVal::T_OBJ};
        root.obj["meta"] = build_meta_object();
        put_num(root, "total_files_scanned", report.total_files_scanned());
        put_num(root, "total_findings", report.total_findings());
        CanonVal by_cat{CanonVal::T_OBJ};
        for (const auto& kv : report.findings_by_category()) put_num(by_cat, kv.first, kv.second);
        root.obj["findings_by_category"] = std::move(by_cat);
        root.obj["findings_by_severity"] = build_severity_counts(report);
        root.obj["per_file"] = build_per_file_array(report);
        root.obj["skipped_files"] = build_skipped_array(report);
        put_str(root, "verdict", verdict_to_string(report.verdict()));
        put_num(root, "exit_code", static_cast<unsigned long long>(exit_code(report.verdict())));
        return root;
    }

    static CanonVal build_sarif_rules() {
        CanonVal rules{CanonVal::T_ARR};
        for (RiskCategory c : risk_categories()) {
            CanonVal rule{CanonVal::T_OBJ};
            put_str(rule, "id", category_label(c));
            put_str(rule, "name", category_label(c));
            rule.obj["shortDescription"] = text_obj(category_title(c));
            CanonVal conf{CanonVal::T_OBJ};
            put_str(conf, "level", severity_to_sarif_level(category_severity(c)));
            rule.obj["defaultConfiguration"] = std::move(conf);
            CanonVal props{CanonVal::T_OBJ};
            put_str(props, "severity", severity_to_string(category_severity(c)));
            rule.obj["properties"] = std::move(props);
            rules.arr.push_back(std::move(rule));
        }
        return rules;
    }

    // Relative URI reference for a file path: unreserved characters and '/'
    // pass through, every other byte is percent-encoded.
    static std::string path_to_uri(const std::string& path) {
        static const char* hx = "0123456789ABCDEF";
        std::string out;
        out.reserve(path.size());
        for (char ch : path) {
            auto c = static_cast<unsigned char>(ch);
            bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
                              || c == '-' || c == '.' || c == '_' || c == '~' || c == '/';
            if (unreserved) {
                out.push_back(ch);
            } else {
                out.push_back('%');
                out.push_back(hx[c >> 4]);
                out.push_back(hx[c & 0xF]);
            }
        }
        return out;
    }

    static CanonVal build_sarif_result(const Finding& f) {
        CanonVal res{CanonVal::T_OBJ};
        put_str(res, "ruleId", category_label(f.category));
        put_str(res, "level", severity_to_sarif_level(category_severity(f.category)));
        res.obj["message"] = text_obj(code_point_name(f.code_point) + " (" + format_code_point(f.code_point) + ") - "
                                      + code_point_description(f.code_point));

        CanonVal artifact{CanonVal::T_OBJ};
        put_str(artifact, "uri", path_to_uri(f.file_path));
        CanonVal region{CanonVal::T_OBJ};
        put_num(region, "startLine", f.line);
        put_num(region, "startColumn", f.column);
        put_num(region, "byteOffset", f.byte_offset);
        region.obj["snippet"] = text_obj(f.context);
        CanonVal physical{CanonVal::T_OBJ};
        physical.obj["artifactLocation"] = std::move(artifact);
        physical.obj["region"] = std::move(region);
        CanonVal loc{CanonVal::T_OBJ};
        loc.obj["physicalLocation"] = std::move(physical);
        CanonVal locs{CanonVal::T_ARR};
        locs.arr.push_back(std::move(loc));
        res.obj["locations"] = std::move(locs);
        return res;
    }

    static std::string pretty_print_json(const std::string& compact_json) {
        std::string out;
        out.reserve(compact_json.size() * 2);
        int depth = 0;
        bool in_string = false;
        bool esc = false;

        auto indent = [&](int d) {
            for (int i = 0; i < d; i++) out.append("  ");
        };

        for (size_t i = 0; i < compact_json.size(); ++i) {
            char c = compact_json[i];
            if (!in_string && (c == '}' || c == ']')) {
                // keep empty containers on one line
                if (!out.empty() && (out.back() == '{' || out.back() == '[')) {
                    out.push_back(c);
                    depth--;
                    continue;
                }
                out.push_back('\n');
                depth--;
                if (depth < 0) depth = 0;
                indent(depth);
                out.push_back(c);
                continue;
            }
            if (!in_string && (c == '{' || c == '[')) {
                out.push_back(c);
                depth++;
                char n = (i + 1 < compact_json.size()) ? compact_json[i + 1] : '\0';
                if (n != '}' && n != ']') {
                    out.push_back('\n');
                    indent(depth);
                }
                continue;
            }
            out.push_back(c);

            if (esc) {
                esc = false;
                continue;
            }
            if (c == '\\') {
                esc = true;
                continue;
            }
            if (c == '"') {
                in_string = !in_string;
                continue;
            }
            if (in_string) continue;

            if (c == ',') {
                out.push_back('\n');
                indent(depth);
            } else if (c == ':') {
                out.push_back(' ');
            }
        }
        out.push_back('\n');
        return out;
    }

    static std::string finish(const CanonVal& root, const Config& cfg) {
        std::ostringstream os;
        canon_emit(root, os);
        if (cfg.compact) return os.str() + "\n";
        return pretty_print_json(os.str());
    }

} // namespace

std::string JSONWriter::write(const Report& report, const Config& cfg) const {
    if (cfg.sarif) return write_sarif(report, cfg);
    return finish(build_canonical(report), cfg);
}

std::string JSONWriter::write_sarif(const Report& report, const Config& cfg) const {
    CanonVal driver{CanonVal::T_OBJ};
    put_str(driver, "name", "inviscan");
    put_str(driver, "version", buildinfo::APP_VERSION);
    driver.obj["rules"] = build_sarif_rules();
    CanonVal tool{CanonVal::T_OBJ};
    tool.obj["driver"] = std::move(driver);

    CanonVal results{CanonVal::T_ARR};
    for (const auto& r : report.per_file())
        for (const auto& f : r.findings) results.arr.push_back(build_sarif_result(f));

    CanonVal notifications{CanonVal::T_ARR};
    for (const auto& s : report.skipped_files()) {
        CanonVal n{CanonVal::T_OBJ};
        put_str(n, "level", report.fail_on_skip() ? "error" : "warning");
        n.obj["message"] = text_obj(s.path + ": " + s.reason);
        notifications.arr.push_back(std::move(n));
    }
    CanonVal invocation{CanonVal::T_OBJ};
    put_bool(invocation, "executionSuccessful", report.verdict() != Verdict::OperationalError);
    put_num(invocation, "exitCode", static_cast<unsigned long long>(exit_code(report.verdict())));
    invocation.obj["toolExecutionNotifications"] = std::move(notifications);
    CanonVal invocations{CanonVal::T_ARR};
    invocations.arr.push_back(std::move(invocation));

    CanonVal run{CanonVal::T_OBJ};
    run.obj["tool"] = std::move(tool);
    run.obj["results"] = std::move(results);
    run.obj["invocations"] = std::move(invocations);
    put_str(run, "columnKind", "unicodeCodePoints");
    CanonVal runs{CanonVal::T_ARR};
    runs.arr.push_back(std::move(run));

    CanonVal root{CanonVal::T_OBJ};
    put_str(root, "$schema", "https://json.schemastore.org/sarif-2.1.0.json");
    put_str(root, "version", "2.1.0");
    root.obj["runs"] = std::move(runs);
    return finish(root, cfg);
}

}
