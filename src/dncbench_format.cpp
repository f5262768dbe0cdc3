// Pure formatting helpers for BatchResult
#include "dncbench/core.hpp"

#include <cstdio>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace dncbench {

static inline std::string esc_json(const std::string &s) {
  std::string o;
  o.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
    case '"': o += "\\\""; break;
    case '\\': o += "\\\\"; break;
    case '\n': o += "\\n"; break;
    case '\r': o += "\\r"; break;
    case '\t': o += "\\t"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buf[7];
        std::snprintf(buf, sizeof(buf), "\\u%04x", (int)(unsigned char)c);
        o += buf;
      } else {
        o += c;
      }
    }
  }
  return o;
}

static inline std::string fixed(double v, int prec) {
  std::ostringstream os;
  os.setf(std::ios::fixed);
  os << std::setprecision(prec) << v;
  return os.str();
}

std::string summary_key(const SummaryRow &row) {
  std::string k = row.algorithm;
  k += '_';
  k += row.pivot ? *row.pivot : std::string("N/A");
  k += '_';
  k += row.dataset;
  k += '_';
  k += std::to_string(row.size);
  return k;
}

std::string to_csv(const BatchResult &r, bool with_header) {
  std::ostringstream os;
  if (with_header)
    os << "algorithm,pivot,dataset,size,run,time_s,peak_mem_bytes,"
          "comparisons,swaps,seed\n";
  for (const auto &row : r.runs) {
    os << row.algorithm << ',' << row.pivot.value_or("") << ','
       << row.dataset << ',' << row.size << ',' << row.run << ','
       << fixed(row.metrics.time_s, 9) << ',' << row.metrics.peak_mem_bytes
       << ',';
    if (r.instrumented)
      os << row.metrics.comparisons << ',' << row.metrics.swaps;
    else
      os << ',';
    os << ',' << row.seed << '\n';
  }
  return os.str();
}

static void write_run_fields(std::ostream &os, const RunRecord &row,
                             bool instrumented) {
  os << "\"algorithm\":\"" << esc_json(row.algorithm) << "\",";
  if (row.pivot)
    os << "\"pivot\":\"" << esc_json(*row.pivot) << "\",";
  else
    os << "\"pivot\":null,";
  os << "\"dataset\":\"" << esc_json(row.dataset) << "\",";
  os << "\"size\":" << row.size << ",";
  os << "\"run\":" << row.run << ",";
  os << "\"time_s\":" << fixed(row.metrics.time_s, 9) << ",";
  os << "\"peak_mem_bytes\":" << row.metrics.peak_mem_bytes << ",";
  if (instrumented) {
    os << "\"comparisons\":" << row.metrics.comparisons << ",";
    os << "\"swaps\":" << row.metrics.swaps << ",";
  } else {
    os << "\"comparisons\":null,\"swaps\":null,";
  }
  os << "\"seed\":" << row.seed;
}

std::string to_json(const BatchResult &r, bool pretty) {
  std::ostringstream os;
  const char *nl = pretty ? "\n" : "";
  const char *in1 = pretty ? "  " : "";
  const char *in2 = pretty ? "    " : "";
  const char *sep = pretty ? ": " : ":";

  os << "{" << nl;
  for (std::size_t i = 0; i < r.summary.size(); ++i) {
    const auto &row = r.summary[i];
    const auto &s = row.stats;
    std::vector<std::pair<std::string, std::string>> fields;
    fields.emplace_back("time_mean_s", fixed(s.time_mean_s, 9));
    fields.emplace_back("time_std_s", fixed(s.time_std_s, 9));
    fields.emplace_back("time_best_s", fixed(s.time_best_s, 9));
    fields.emplace_back("time_worst_s", fixed(s.time_worst_s, 9));
    fields.emplace_back("memory_mean_bytes", fixed(s.memory_mean_bytes, 3));
    fields.emplace_back("memory_std_bytes", fixed(s.memory_std_bytes, 3));
    fields.emplace_back("memory_peak_bytes",
                        std::to_string(s.memory_peak_bytes));
    fields.emplace_back("runs", std::to_string(s.runs));
    if (s.comparisons_mean) {
      fields.emplace_back("comparisons_mean", fixed(*s.comparisons_mean, 3));
      fields.emplace_back("comparisons_std", fixed(*s.comparisons_std, 3));
    }
    if (s.swaps_mean) {
      fields.emplace_back("swaps_mean", fixed(*s.swaps_mean, 3));
      fields.emplace_back("swaps_std", fixed(*s.swaps_std, 3));
    }
    fields.emplace_back("algorithm", "\"" + esc_json(row.algorithm) + "\"");
    fields.emplace_back("pivot", row.pivot ? "\"" + esc_json(*row.pivot) + "\""
                                           : std::string("null"));
    fields.emplace_back("dataset", "\"" + esc_json(row.dataset) + "\"");
    fields.emplace_back("size", std::to_string(row.size));

    os << in1 << "\"" << esc_json(summary_key(row)) << "\"" << sep << "{"
       << nl;
    for (std::size_t f = 0; f < fields.size(); ++f) {
      os << in2 << "\"" << fields[f].first << "\"" << sep << fields[f].second;
      if (f + 1 != fields.size())
        os << ",";
      os << nl;
    }
    os << in1 << "}";
    if (i + 1 != r.summary.size())
      os << ",";
    os << nl;
  }
  os << "}" << nl;
  return os.str();
}

std::string to_jsonl(const BatchResult &r) {
  std::ostringstream os;
  for (const auto &row : r.runs) {
    os << '{';
    write_run_fields(os, row, r.instrumented);
    os << "}" << '\n';
  }
  return os.str();
}

} // namespace dncbench
