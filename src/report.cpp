#include "conclave/report.hpp"

#include <cstdio>
#include <sstream>

#include "conclave/jsonlite.hpp"
#include "conclave/version.hpp"

namespace conclave {

std::string to_string(RunPhase p) {
  switch (p) {
    case RunPhase::idle: return "idle";
    case RunPhase::planning: return "planning";
    case RunPhase::executing: return "executing";
    case RunPhase::reviewing: return "reviewing";
    case RunPhase::integrating: return "integrating";
    case RunPhase::completed: return "completed";
    case RunPhase::failed: return "failed";
  }
  return "unknown";
}

const TicketReportRow* RunReport::find(const std::string& id) const {
  for (const auto& row : tickets) {
    if (row.id == id) return &row;
  }
  return nullptr;
}

uint64_t RunReport::count(TicketStatus s) const {
  auto it = counts_by_status.find(to_string(s));
  return it == counts_by_status.end() ? 0 : it->second;
}

namespace {

jsonlite::Array string_array(const std::vector<std::string>& v) {
  jsonlite::Array a;
  a.reserve(v.size());
  for (const auto& s : v) a.emplace_back(s);
  return a;
}

jsonlite::Object row_object(const TicketReportRow& row) {
  jsonlite::Object o;
  o["id"] = row.id;
  o["title"] = row.title;
  o["status"] = to_string(row.status);
  o["reason"] = row.reason;
  o["wave"] = row.wave ? jsonlite::Value(static_cast<std::uint64_t>(*row.wave)) : jsonlite::Value();
  o["generation"] = static_cast<std::uint64_t>(row.generation);
  o["parent_id"] = row.parent_id;
  o["alignment_score"] = row.alignment_score ? jsonlite::Value(*row.alignment_score) : jsonlite::Value();
  o["error_code"] = row.error_code;
  o["runner_id"] = row.runner_id;
  o["duration_ms"] = row.duration_ms;
  return o;
}

// Embeds an already-serialized JSON object. Unparseable input becomes null.
jsonlite::Value embedded(const std::string& json) {
  if (json.empty()) return jsonlite::Value();
  std::optional<jsonlite::JsonError> err;
  jsonlite::Object o = jsonlite::parse(json, &err);
  if (err) return jsonlite::Value();
  return jsonlite::Value(std::move(o));
}

std::string format_score(double v) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%.2f", v);
  return buf;
}

}  // namespace

std::string report_to_json(const RunReport& report) {
  jsonlite::Object o;
  o["format"] = static_cast<std::uint64_t>(version::REPORT_FORMAT_VERSION);
  o["run_id"] = report.run_id;
  o["phase"] = to_string(report.phase);
  o["success"] = report.success;
  o["stopped"] = report.stopped;
  o["error_code"] = to_string(report.error_code);
  o["fatal_reason"] = report.fatal_reason;

  jsonlite::Array rows;
  rows.reserve(report.tickets.size());
  for (const auto& row : report.tickets) rows.emplace_back(row_object(row));
  o["tickets"] = std::move(rows);

  jsonlite::Object counts;
  for (const auto& [status, n] : report.counts_by_status) counts[status] = n;
  o["counts_by_status"] = std::move(counts);

  o["review"] = embedded(summary_to_json(report.review));
  o["aggregate_alignment"] = report.aggregate_alignment;

  jsonlite::Array gens;
  for (const auto& g : report.generations) {
    jsonlite::Object go;
    go["generation"] = static_cast<std::uint64_t>(g.generation);
    go["review"] = embedded(summary_to_json(g.review));
    go["follow_ups_created"] = g.follow_ups_created;
    gens.emplace_back(std::move(go));
  }
  o["generations"] = std::move(gens);
  o["waves"] = static_cast<std::uint64_t>(report.waves);

  if (report.integration) {
    jsonlite::Object io;
    io["ok"] = report.integration->ok;
    io["applied"] = string_array(report.integration->applied);
    io["log"] = string_array(report.integration->log);
    io["error_message"] = report.integration->error_message;
    o["integration"] = std::move(io);
  } else {
    o["integration"] = nullptr;
  }
  if (report.final_test) {
    jsonlite::Object fo;
    fo["passed"] = report.final_test->passed;
    fo["summary"] = report.final_test->summary;
    o["final_test"] = std::move(fo);
  } else {
    o["final_test"] = nullptr;
  }

  o["snapshot_digest"] = report.snapshot_digest;
  o["config_warnings"] = string_array(report.config_warnings);
  o["duration_ms"] = report.duration_ms;

  jsonlite::Object events;
  events["published"] = report.events_published;
  events["dropped"] = report.events_dropped;
  o["events"] = std::move(events);

  jsonlite::Object audit;
  audit["records"] = report.audit_records;
  audit["failures"] = report.audit_failures;
  audit["head"] = report.audit_head;
  o["audit"] = std::move(audit);

  o["stats"] = embedded(report.stats_json);
  o["versions"] = embedded(version::manifest_to_json(version::current_manifest()));
  return jsonlite::to_json(o);
}

std::string render_text(const RunReport& report) {
  std::ostringstream out;
  out << "run " << report.run_id << ": " << to_string(report.phase)
      << (report.success ? " (success)" : " (not successful)") << "\n";
  if (report.error_code != ErrorCode::none) {
    out << "  error: " << to_string(report.error_code);
    if (!report.fatal_reason.empty()) out << ": " << report.fatal_reason;
    out << "\n";
  }
  if (report.stopped) out << "  stopped before completion\n";

  out << "  tickets: " << report.tickets.size() << " in " << report.waves << " wave(s)";
  for (const auto& [status, n] : report.counts_by_status) out << ", " << status << "=" << n;
  out << "\n";
  out << "  reviews: " << report.review.approved << "/" << report.review.total_reviews
      << " approved, approval rate " << format_score(report.review.approval_rate)
      << ", aggregate alignment " << format_score(report.aggregate_alignment) << "\n";

  for (const auto& row : report.tickets) {
    out << "  - " << row.id << " [" << to_string(row.status) << "]";
    if (row.wave) out << " wave " << *row.wave;
    if (row.alignment_score) out << " score " << format_score(*row.alignment_score);
    if (!row.reason.empty()) out << ": " << row.reason;
    out << "\n";
  }

  if (report.integration) {
    out << "  integration: " << (report.integration->ok ? "ok" : "failed") << ", "
        << report.integration->applied.size() << " applied";
    if (!report.integration->error_message.empty()) {
      out << " (" << report.integration->error_message << ")";
    }
    out << "\n";
  }
  if (report.final_test) {
    out << "  final test: " << report.final_test->summary << "\n";
  }
  for (const auto& w : report.config_warnings) out << "  warning: " << w << "\n";
  return out.str();
}

}  // namespace conclave
