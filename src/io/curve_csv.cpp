#include "bw/io/curve_csv.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <unordered_map>

namespace {

// --- helpers texte ---
static inline std::string trim(std::string s) {
  auto notsp = [](int ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
  s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
  return s;
}
static inline std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}

// CSV splitter minimal qui gère les champs entre "..."
static std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> out;
  std::string field;
  bool in_quotes = false;
  for (size_t i=0;i<line.size();++i) {
    char c = line[i];
    if (c == '"') {
      if (in_quotes && i+1<line.size() && line[i+1] == '"') { field.push_back('"'); ++i; }
      else { in_quotes = !in_quotes; }
    } else if (c == ',' && !in_quotes) {
      out.push_back(trim(field)); field.clear();
    } else {
      field.push_back(c);
    }
  }
  out.push_back(trim(field));
  return out;
}

// parse double tolérant ("" ou "abc" -> NaN, "0.05xyz" -> NaN)
static double parse_double(const std::string& s) {
  if (s.empty()) return std::numeric_limits<double>::quiet_NaN();
  char* end=nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end==s.c_str() || *end != '\0') return std::numeric_limits<double>::quiet_NaN();
  return v;
}

// récupère index de colonne (synonymes acceptés)
static int col(const std::unordered_map<std::string,int>& idx, std::initializer_list<const char*> names) {
  for (auto* n: names) {
    auto it = idx.find(lower(n));
    if (it != idx.end()) return it->second;
  }
  return -1;
}

} // namespace

namespace bw::io {

std::vector<CurveRow>
read_zero_curve_csv(const std::string& path,
                    std::size_t* num_ignored,
                    std::vector<std::string>* warnings)
{
  if (num_ignored) *num_ignored = 0;
  std::vector<CurveRow> out;

  std::ifstream f(path);
  if (!f) {
    if (warnings) warnings->push_back("Impossible d'ouvrir le fichier: " + path);
    return out;
  }

  std::string line;
  bool header_seen = false;
  int iT = -1, iRate = -1;

  while (std::getline(f, line)) {
    if (!line.empty() && line.back()=='\r') line.pop_back();
    auto l = trim(line);
    if (l.empty() || l.rfind("#",0)==0) continue;

    auto cells = split_csv_line(l);

    if (!header_seen) {
      header_seen = true;
      std::unordered_map<std::string,int> idx;
      for (int i=0;i<(int)cells.size();++i) idx[lower(cells[i])] = i;
      iT    = col(idx, {"t","maturity","tenor"});
      iRate = col(idx, {"rate","zero_rate","zc"});
      if (iT < 0 || iRate < 0) {
        if (warnings) warnings->push_back("En-tête sans colonnes t/rate: " + l);
        return out;
      }
      continue;
    }

    auto get = [&](int i)->std::string {
      return (i>=0 && i<(int)cells.size()) ? cells[i] : std::string();
    };

    CurveRow row;
    row.t    = parse_double(get(iT));
    row.rate = parse_double(get(iRate));

    std::string why;
    if (!std::isfinite(row.t) || row.t <= 0.0) why = "t<=0 ou invalide";
    else if (!std::isfinite(row.rate))         why = "taux invalide";

    if (!why.empty()) {
      if (num_ignored) (*num_ignored)++;
      if (warnings) warnings->push_back("Ligne ignorée: " + why);
      continue;
    }
    out.push_back(row);
  }

  return out;
}

std::vector<double> curve_rates(const std::vector<CurveRow>& rows) {
  std::vector<double> r;
  r.reserve(rows.size());
  for (const auto& row : rows) r.push_back(row.rate);
  return r;
}

bool write_sweep_csv(const std::string& path,
                     const std::vector<bw::analytics::SweepPoint>& points,
                     std::string* err)
{
  std::ofstream f(path);
  if (!f) {
    if (err) *err = "cannot open for writing: " + path;
    return false;
  }
  f.setf(std::ios::fixed);
  f << "yield,price,macaulay,modified\n";
  for (const auto& p : points) {
    f << std::setprecision(6) << p.yield << ','
      << std::setprecision(4) << p.price << ','
      << p.macaulay << ','
      << p.modified << '\n';
  }
  if (!f) {
    if (err) *err = "write failed: " + path;
    return false;
  }
  return true;
}

} // namespace bw::io
