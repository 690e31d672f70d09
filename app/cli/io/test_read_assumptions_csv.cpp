#include "vw/io/assumptions_csv.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
using namespace std;

int main(int argc, char** argv) {
  const string path = (argc>1 ? argv[1] : "data/samples/sample_assumptions.csv");

  vector<string> warnings;
  const auto a = vw::io::read_assumptions_csv(path, &warnings);

  constexpr double EPS = 1e-12;
  assert(std::abs(a.current_revenue - 100.0) < EPS);
  assert(std::abs(a.growth_rates[0] - 0.15) < EPS);
  assert(std::abs(a.growth_rates[3] - 0.08) < EPS); // "8%"
  assert(std::abs(a.tax_rate - 0.25) < EPS);        // ligne "abc" ignorée
  assert(std::abs(a.terminal_growth - 0.03) < EPS); // synonyme "tg"
  assert(std::abs(a.fcf_conversion - 0.80) < EPS);

  auto has_warn = [&](const string& needle){
    return any_of(warnings.begin(), warnings.end(),
                  [&](const string& w){ return w.find(needle) != string::npos; });
  };
  assert(warnings.size() == 2);
  assert(has_warn("clé inconnue 'beta'"));
  assert(has_warn("valeur illisible pour tax_rate"));

  // Clé obligatoire absente + fcf_conversion par défaut
  const string tmp = "test_assumptions_missing.csv";
  {
    ofstream f(tmp);
    f << "revenue,50\ng1,0.1\ng2,0.1\ng3,0.1\ng4,0.1\ng5,0.1\nmargin,0.2\ntax,0.25\nwacc,0.09\n";
  }
  bool threw = false;
  try { (void)vw::io::read_assumptions_csv(tmp); }
  catch (const std::runtime_error& e) {
    threw = true;
    assert(string(e.what()).find("terminal_growth") != string::npos);
  }
  assert(threw);
  {
    ofstream f(tmp, ios::app);
    f << "terminal_growth,2.5%\n";
  }
  const auto b = vw::io::read_assumptions_csv(tmp);
  assert(std::abs(b.terminal_growth - 0.025) < EPS);
  assert(b.fcf_conversion == vw::model::kDefaultFcfConversion);
  std::remove(tmp.c_str());

  // Fichier absent
  threw = false;
  try { (void)vw::io::read_assumptions_csv("does/not/exist.csv"); }
  catch (const std::runtime_error&) { threw = true; }
  assert(threw);

  for (auto& w: warnings) cerr << "[warn] " << w << "\n";
  cout << "Assumptions CSV OK. warnings=" << warnings.size() << "\n";
  return 0;
}
