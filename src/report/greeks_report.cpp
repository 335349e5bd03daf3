#include <bsg/report/greeks_report.hpp>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace bsg {
namespace report {

using bsg::config::ContractSelection;

double theta_per_day(double theta, double days_per_year) {
  if (!(days_per_year > 0.0)) {
    throw std::invalid_argument("theta_per_day: days_per_year must be > 0");
  }
  return theta / days_per_year;
}

double theta_display(double theta, const bsg::config::ReportConfig& cfg) {
  return theta_per_day(theta, cfg.days_per_year) * cfg.display_scale;
}

namespace {

void greeks_row(std::ostringstream& os, const char* label,
                const bsg::pricing::Greeks& g, double price,
                const bsg::config::ReportConfig& cfg) {
  os << std::setw(6)  << label << ' '
     << std::setw(13) << price   << ' '
     << std::setw(11) << g.delta << ' '
     << std::setw(11) << g.gamma << ' '
     << std::setw(13) << g.theta << ' '
     << std::setw(13) << theta_display(g.theta, cfg) << '\n';
}

} // unnamed namespace

std::string format_report(const bsg::pricing::Valuation& v,
                          const bsg::market::MarketInputs& in,
                          const bsg::config::ReportConfig& cfg) {
  std::ostringstream os;
  os.setf(std::ios::fixed);
  os << std::setprecision(cfg.precision);

  const double gap = bsg::pricing::put_call_parity_gap(v.prices.call, v.prices.put,
                                                       in.S, in.K, in.r, in.t);

  os << "S     : " << in.S     << "\n"
     << "K     : " << in.K     << "\n"
     << "r     : " << in.r     << "\n"
     << "t     : " << in.t     << "\n"
     << "sigma : " << in.sigma << "\n"
     << "d1    : " << v.aux.d1 << "\n"
     << "d2    : " << v.aux.d2 << "\n";
  os << std::scientific << std::setprecision(3)
     << "parity: " << gap << "\n";
  os << std::fixed << std::setprecision(cfg.precision);

  os << "  type         price       delta       gamma   theta/year   theta*"
     << std::setprecision(0) << cfg.display_scale << "/" << cfg.days_per_year << "\n"
     << std::setprecision(cfg.precision);
  os << "----------------------------------------------------------------------------\n";
  if (cfg.contracts != ContractSelection::PutOnly)  greeks_row(os, "call", v.call, v.prices.call, cfg);
  if (cfg.contracts != ContractSelection::CallOnly) greeks_row(os, "put",  v.put,  v.prices.put,  cfg);
  return os.str();
}

} // namespace report
} // namespace bsg
