#include "app/Render.hpp"
#include "util/TimeFormat.hpp"
#include <algorithm>
#include <charconv>
#include <cstdio>

namespace {

using netstatus::model::CheckRecord;
using netstatus::model::ConnectivityState;

void append_double(std::string& out, double v) {
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec == std::errc{}) {
    out.append(buf, ptr);
  } else {
    out += '0';
  }
}

void append_fixed1(std::string& out, double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f", v);
  out += buf;
}

void append_uint(std::string& out, uint64_t v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void emit_header(std::string& out, const char* name, const char* help, const char* type) {
  out += "# HELP ";  out += name;  out += ' ';  out += help;  out += '\n';
  out += "# TYPE ";  out += name;  out += ' ';  out += type;  out += '\n';
}

void emit_gauge_d(std::string& out, const char* name, double value) {
  out += name;  out += ' ';  append_double(out, value);  out += '\n';
}

void emit_gauge_u(std::string& out, const char* name, uint64_t value) {
  out += name;  out += ' ';  append_uint(out, value);  out += '\n';
}

void emit_labeled_d(std::string& out, const char* name,
                    const char* lk, std::string_view lv, double value) {
  out += name;  out += '{';  out += lk;  out += "=\"";
  out.append(lv.data(), lv.size());
  out += "\"} ";  append_double(out, value);  out += '\n';
}

void append_json_string(std::string& out, std::string_view sv) {
  out += '"';
  for (char c : sv) {
    if (c == '"' || c == '\\') { out += '\\'; out += c; }
    else if (c == '\n') out += "\\n";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
      out += buf;
    }
    else out += c;
  }
  out += '"';
}

void append_json_opt(std::string& out, const std::optional<double>& v) {
  if (v) append_double(out, *v); else out += "null";
}

void append_json_record(std::string& out, const CheckRecord& r) {
  out += "{\"timestamp\":";
  append_json_string(out, netstatus::util::format_local(r.timestamp));
  out += ",\"gateway_reachable\":";  out += r.gateway_reachable ? "true" : "false";
  out += ",\"internet_reachable\":"; out += r.internet_reachable ? "true" : "false";
  out += ",\"gateway_ms\":";  append_json_opt(out, r.gateway_latency_ms);
  out += ",\"internet_ms\":"; append_json_opt(out, r.internet_latency_ms);
  out += ",\"state\":";  append_json_string(out, netstatus::model::to_string(r.state));
  out += '}';
}

void append_html_escaped(std::string& out, std::string_view sv) {
  for (char c : sv) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      default: out += c;
    }
  }
}

const char* state_css(ConnectivityState s) {
  switch (s) {
    case ConnectivityState::Up:           return "up";
    case ConnectivityState::GatewayDown:  return "gw";
    case ConnectivityState::InternetDown: return "inet";
    case ConnectivityState::Unknown:      break;
  }
  return "unknown";
}

// Polyline segments for one series; a missing point ends the current segment
void append_svg_series(std::string& out, const std::vector<std::optional<double>>& ys,
                       double max_ms, int w, int h, const char* color) {
  const size_t n = ys.size();
  std::string pts;
  auto flush = [&]{
    if (pts.empty()) return;
    out += "<polyline fill=\"none\" stroke-width=\"1.5\" stroke=\"";
    out += color;
    out += "\" points=\"";
    out += pts;
    out += "\"/>";
    pts.clear();
  };
  for (size_t i = 0; i < n; ++i) {
    if (!ys[i]) { flush(); continue; }
    double x = n > 1 ? static_cast<double>(i) * w / static_cast<double>(n - 1) : w / 2.0;
    double y = h - (*ys[i] / max_ms) * h;
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%.1f,%.1f ", x, y);
    pts += buf;
  }
  flush();
}

} // anonymous namespace

namespace netstatus::app {

std::string view_to_prometheus(const DashboardView& v) {
  std::string out;
  out.reserve(2048);

  emit_header(out, "netstatus_state", "Current connectivity state (1 for the active state)", "gauge");
  for (auto s : {ConnectivityState::Up, ConnectivityState::GatewayDown,
                 ConnectivityState::InternetDown, ConnectivityState::Unknown}) {
    emit_labeled_d(out, "netstatus_state", "state", model::to_string(s), v.current == s ? 1.0 : 0.0);
  }

  emit_header(out, "netstatus_checks_total", "Checks in the history window", "gauge");
  emit_gauge_u(out, "netstatus_checks_total", v.stats.total);
  emit_header(out, "netstatus_gateway_down_checks", "Checks classified GATEWAY_DOWN", "gauge");
  emit_gauge_u(out, "netstatus_gateway_down_checks", v.stats.gateway_down);
  emit_header(out, "netstatus_internet_down_checks", "Checks classified INTERNET_DOWN", "gauge");
  emit_gauge_u(out, "netstatus_internet_down_checks", v.stats.internet_down);
  emit_header(out, "netstatus_uptime_percent", "Share of checks classified UP", "gauge");
  emit_gauge_d(out, "netstatus_uptime_percent", v.stats.uptime_pct);

  // Latency gauges only exist while the last probe got an answer
  if (v.latest && v.latest->gateway_latency_ms) {
    emit_header(out, "netstatus_gateway_latency_ms", "Last gateway round trip", "gauge");
    emit_gauge_d(out, "netstatus_gateway_latency_ms", *v.latest->gateway_latency_ms);
  }
  if (v.latest && v.latest->internet_latency_ms) {
    emit_header(out, "netstatus_internet_latency_ms", "Last internet host round trip", "gauge");
    emit_gauge_d(out, "netstatus_internet_latency_ms", *v.latest->internet_latency_ms);
  }
  return out;
}

std::string view_to_status_json(const DashboardView& v) {
  std::string out;
  out.reserve(256 + v.recent.size() * 160);
  out += "{\"state\":";
  append_json_string(out, model::to_string(v.current));
  out += ",\"stats\":{\"total\":";       append_uint(out, v.stats.total);
  out += ",\"up\":";                     append_uint(out, v.stats.up);
  out += ",\"gateway_down\":";           append_uint(out, v.stats.gateway_down);
  out += ",\"internet_down\":";          append_uint(out, v.stats.internet_down);
  out += ",\"uptime_percent\":";         append_fixed1(out, v.stats.uptime_pct);
  out += "},\"latest\":";
  if (v.latest) append_json_record(out, *v.latest); else out += "null";
  out += ",\"recent\":[";
  for (size_t i = 0; i < v.recent.size(); ++i) {
    if (i) out += ',';
    append_json_record(out, v.recent[i]);
  }
  out += "]}";
  return out;
}

std::string series_to_json(const model::ChartSeries& cs) {
  std::string out;
  out.reserve(64 + cs.labels.size() * 48);
  out += "{\"labels\":[";
  for (size_t i = 0; i < cs.labels.size(); ++i) {
    if (i) out += ',';
    append_json_string(out, cs.labels[i]);
  }
  out += "],\"gateway_ms\":[";
  for (size_t i = 0; i < cs.gateway_ms.size(); ++i) {
    if (i) out += ',';
    append_json_opt(out, cs.gateway_ms[i]);
  }
  out += "],\"internet_ms\":[";
  for (size_t i = 0; i < cs.internet_ms.size(); ++i) {
    if (i) out += ',';
    append_json_opt(out, cs.internet_ms[i]);
  }
  out += "]}";
  return out;
}

std::string view_to_html(const DashboardView& v, const PageInfo& info) {
  std::string out;
  out.reserve(8192 + v.recent.size() * 200);
  out += "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\">"
         "<meta http-equiv=\"refresh\" content=\"";
  append_uint(out, static_cast<uint64_t>(std::max(5LL, info.interval_seconds)));
  out += "\"><title>Network Status</title><style>"
         "body{font-family:sans-serif;margin:2em;color:#222}"
         "table{border-collapse:collapse}td,th{border:1px solid #ccc;padding:4px 8px}"
         ".up{color:#1a7f37}.gw{color:#cf222e}.inet{color:#bc4c00}.unknown{color:#6e7781}"
         ".badge{font-size:1.6em;font-weight:bold}"
         "</style></head><body>\n<h1>Network Status</h1>\n";

  out += "<p class=\"badge ";
  out += state_css(v.current);
  out += "\">";
  out += model::to_string(v.current);
  out += "</p>\n<p>Gateway ";
  append_html_escaped(out, info.gateway);
  out += ", internet host ";
  append_html_escaped(out, info.internet_host);
  out += ", checked every ";
  append_uint(out, static_cast<uint64_t>(std::max(0LL, info.interval_seconds)));
  out += "s.</p>\n";

  out += "<table><tr><th>Total checks</th><th>Gateway down</th><th>Internet down</th><th>Uptime</th></tr><tr><td>";
  append_uint(out, v.stats.total);
  out += "</td><td>";
  append_uint(out, v.stats.gateway_down);
  out += "</td><td>";
  append_uint(out, v.stats.internet_down);
  out += "</td><td>";
  append_fixed1(out, v.stats.uptime_pct);
  out += "%</td></tr></table>\n";

  // Latency chart
  constexpr int W = 800, H = 200;
  double max_ms = 1.0;
  for (const auto& y : v.series.gateway_ms) if (y) max_ms = std::max(max_ms, *y);
  for (const auto& y : v.series.internet_ms) if (y) max_ms = std::max(max_ms, *y);
  out += "<h2>Latency (ms)</h2>\n<svg width=\"";
  append_uint(out, W);
  out += "\" height=\"";
  append_uint(out, H + 20);
  out += "\" viewBox=\"0 0 800 220\" style=\"border:1px solid #ccc\">";
  append_svg_series(out, v.series.gateway_ms, max_ms, W, H, "#0969da");
  append_svg_series(out, v.series.internet_ms, max_ms, W, H, "#8250df");
  if (!v.series.labels.empty()) {
    out += "<text x=\"2\" y=\"216\" font-size=\"11\">";
    append_html_escaped(out, v.series.labels.front());
    out += "</text><text x=\"798\" y=\"216\" font-size=\"11\" text-anchor=\"end\">";
    append_html_escaped(out, v.series.labels.back());
    out += "</text>";
  }
  out += "<text x=\"4\" y=\"12\" font-size=\"11\">max ";
  append_fixed1(out, max_ms);
  out += " ms</text></svg>\n<p><span style=\"color:#0969da\">gateway</span> "
         "<span style=\"color:#8250df\">internet</span> (gaps = no reply)</p>\n";

  out += "<h2>Recent checks</h2>\n<table><tr><th>Time</th><th>Gateway</th><th>Internet</th><th>State</th></tr>\n";
  auto cell = [&](bool ok, const std::optional<double>& ms) {
    out += "<td>";
    if (!ok) { out += "down"; }
    else {
      out += "up";
      if (ms) { out += " ("; append_fixed1(out, *ms); out += " ms)"; }
    }
    out += "</td>";
  };
  for (const auto& r : v.recent) {
    out += "<tr><td>";
    out += netstatus::util::format_local(r.timestamp);
    out += "</td>";
    cell(r.gateway_reachable, r.gateway_latency_ms);
    cell(r.internet_reachable, r.internet_latency_ms);
    out += "<td class=\"";
    out += state_css(r.state);
    out += "\">";
    out += model::to_string(r.state);
    out += "</td></tr>\n";
  }
  out += "</table>\n</body></html>\n";
  return out;
}

} // namespace netstatus::app
