#include <bsg/config/report_config.hpp>
#include <bsg/io/scenario_json.hpp>
#include <bsg/market/contract.hpp>
#include <bsg/market/market_inputs.hpp>
#include <bsg/pricing/greeks.hpp>
#include <bsg/report/greeks_report.hpp>

#include <cctype>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

static void usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog
            << " [S K r t sigma]"
            << " [--call|--put]"
            << " [--scenario FILE]"
            << " [--json-out FILE]"
            << " [--days-per-year N]"
            << " [--scale X]"
            << " [--precision N]\n"
            << "Without market arguments nor --scenario, runs the reference case\n"
            << "(S=819.42 K=1020 r=0.01 t=42/365 sigma=0.6966).\n";
}

int main(int argc, char** argv) {
  std::string scenario_path, json_out;
  std::string contract;
  std::optional<double> days_per_year, scale;
  std::optional<int> precision;
  double pos[5] = {};
  int n_pos = 0;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if      (a == "--call") contract = "call";
      else if (a == "--put")  contract = "put";
      else if (a == "--scenario" && i+1 < argc)      scenario_path = argv[++i];
      else if (a == "--json-out" && i+1 < argc)      json_out = argv[++i];
      else if (a == "--days-per-year" && i+1 < argc) days_per_year = std::stod(argv[++i]);
      else if (a == "--scale" && i+1 < argc)         scale = std::stod(argv[++i]);
      else if (a == "--precision" && i+1 < argc)     precision = std::stoi(argv[++i]);
      else if (a == "-h" || a == "--help") { usage(argv[0]); return 0; }
      else if (!a.empty() && a[0] != '-' && n_pos < 5) pos[n_pos++] = std::stod(a);
      else if (n_pos < 5 && a.size() > 1 && (std::isdigit(static_cast<unsigned char>(a[1])) || a[1] == '.'))
        pos[n_pos++] = std::stod(a); // taux négatif
      else { std::cerr << "Unknown arg: " << a << "\n"; usage(argv[0]); return 1; }
    }
  } catch (const std::exception&) {
    usage(argv[0]);
    return 1;
  }

  if (n_pos != 0 && n_pos != 5) { usage(argv[0]); return 1; }
  if (n_pos == 5 && !scenario_path.empty()) {
    std::cerr << "Market arguments and --scenario are exclusive\n";
    usage(argv[0]);
    return 1;
  }

  try {
    bsg::config::ReportConfig cfg;
    std::unique_ptr<bsg::market::MarketInputs> in;

    if (!scenario_path.empty()) {
      const bsg::io::Scenario sc = bsg::io::load_scenario(scenario_path);
      in  = std::make_unique<bsg::market::MarketInputs>(sc.market);
      cfg = sc.report;
    } else if (n_pos == 5) {
      in = std::make_unique<bsg::market::MarketInputs>(pos[0], pos[1], pos[2], pos[3], pos[4]);
    } else {
      // cas de référence (TSLA, 42 jours)
      in = std::make_unique<bsg::market::MarketInputs>(819.42, 1020.0, 0.01, 42.0 / 365.0, 0.6966);
    }

    // les options de ligne de commande priment sur le scénario
    if (days_per_year) cfg.days_per_year = *days_per_year;
    if (scale)         cfg.display_scale = *scale;
    if (precision)     cfg.precision     = *precision;
    if (!contract.empty()) {
      cfg.contracts = bsg::market::parse_contract_type(contract) == bsg::market::ContractType::Call
                        ? bsg::config::ContractSelection::CallOnly
                        : bsg::config::ContractSelection::PutOnly;
    }

    const bsg::pricing::Valuation v = bsg::pricing::evaluate(*in);
    std::cout << bsg::report::format_report(v, *in, cfg);

    if (!json_out.empty()) {
      bsg::io::write_report_json(json_out, v, *in, cfg);
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
  return 0;
}
