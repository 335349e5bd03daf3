#include <bsg/io/scenario_json.hpp>
#include <bsg/core/errors.hpp>
#include <bsg/market/contract.hpp>
#include <bsg/pricing/analytic_bs.hpp>
#include <bsg/report/greeks_report.hpp>

#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QString>

#include <stdexcept>

namespace bsg {
namespace io {

using bsg::config::ContractSelection;
using bsg::config::ReportConfig;

namespace {

double require_number(const QJsonObject& o, const char* key) {
  const QJsonValue v = o.value(QLatin1String(key));
  if (!v.isDouble()) {
    throw bsg::core::InvalidInput(std::string("scenario: market.") + key + " missing or not a number");
  }
  return v.toDouble();
}

// clé "report" optionnelle : absente => défaut, présente mais non numérique => erreur
double optional_number(const QJsonObject& o, const char* key, double fallback) {
  if (!o.contains(QLatin1String(key))) return fallback;
  const QJsonValue v = o.value(QLatin1String(key));
  if (!v.isDouble()) {
    throw bsg::core::InvalidInput(std::string("scenario: report.") + key + " is not a number");
  }
  return v.toDouble();
}

ContractSelection parse_selection(const QString& s) {
  const QString t = s.trimmed().toLower();
  if (t.isEmpty() || t == "both") return ContractSelection::Both;
  // call / put passent par le parseur commun (InvalidContractType sinon)
  return bsg::market::parse_contract_type(t.toStdString()) == bsg::market::ContractType::Call
           ? ContractSelection::CallOnly
           : ContractSelection::PutOnly;
}

QString selection_to_string(ContractSelection c) {
  switch (c) {
    case ContractSelection::CallOnly: return "call";
    case ContractSelection::PutOnly:  return "put";
    case ContractSelection::Both:     break;
  }
  return "both";
}

QJsonObject greeks_json(const bsg::pricing::Greeks& g, double price, const ReportConfig& cfg) {
  return QJsonObject{
    {"price",         price},
    {"delta",         g.delta},
    {"gamma",         g.gamma},
    {"theta",         g.theta},
    {"theta_per_day", bsg::report::theta_per_day(g.theta, cfg.days_per_year)},
    {"theta_display", bsg::report::theta_display(g.theta, cfg)}
  };
}

} // unnamed namespace

Scenario scenario_from_json(const QJsonObject& root) {
  // report d'abord : days_per_year sert à convertir days_to_expiry
  ReportConfig cfg;
  if (auto rep = root.value("report").toObject(); !rep.isEmpty()) {
    cfg.days_per_year = optional_number(rep, "days_per_year", cfg.days_per_year);
    cfg.display_scale = optional_number(rep, "display_scale", cfg.display_scale);
    cfg.precision     = static_cast<int>(optional_number(rep, "precision", cfg.precision));
    if (rep.contains("contract") && !rep.value("contract").isString()) {
      throw bsg::core::InvalidInput("scenario: report.contract is not a string");
    }
    cfg.contracts     = parse_selection(rep.value("contract").toString());
    if (!(cfg.days_per_year > 0.0)) {
      throw bsg::core::InvalidInput("scenario: report.days_per_year must be > 0");
    }
  }

  const QJsonObject m = root.value("market").toObject();
  if (m.isEmpty()) {
    throw bsg::core::InvalidInput("scenario: missing \"market\" object");
  }

  double t = 0.0;
  if (m.contains("t")) {
    t = require_number(m, "t");
  } else {
    t = require_number(m, "days_to_expiry") / cfg.days_per_year;
  }

  return Scenario{
    bsg::market::MarketInputs(require_number(m, "S"), require_number(m, "K"),
                              require_number(m, "r"), t, require_number(m, "sigma")),
    cfg
  };
}

Scenario load_scenario(const std::string& path) {
  QFile f(QString::fromStdString(path));
  if (!f.open(QIODevice::ReadOnly)) {
    throw std::runtime_error("load_scenario: cannot open " + path);
  }
  QJsonParseError err;
  const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &err);
  if (err.error != QJsonParseError::NoError || !doc.isObject()) {
    throw std::runtime_error("load_scenario: invalid JSON in " + path + " (" +
                             err.errorString().toStdString() + ")");
  }
  qDebug() << "[Scenario] loaded" << QString::fromStdString(path);
  return scenario_from_json(doc.object());
}

QJsonObject scenario_to_json(const Scenario& s) {
  QJsonObject market{
    {"S",     s.market.S},
    {"K",     s.market.K},
    {"r",     s.market.r},
    {"t",     s.market.t},
    {"sigma", s.market.sigma}
  };
  QJsonObject report{
    {"days_per_year", s.report.days_per_year},
    {"display_scale", s.report.display_scale},
    {"precision",     s.report.precision},
    {"contract",      selection_to_string(s.report.contracts)}
  };
  QJsonObject root;
  root["market"] = market;
  root["report"] = report;
  return root;
}

QJsonObject report_to_json(const bsg::pricing::Valuation& v,
                           const bsg::market::MarketInputs& in,
                           const ReportConfig& cfg) {
  QJsonObject root = scenario_to_json(Scenario{in, cfg});

  root["auxiliaries"] = QJsonObject{ {"d1", v.aux.d1}, {"d2", v.aux.d2} };
  root["parity_gap"]  = bsg::pricing::put_call_parity_gap(v.prices.call, v.prices.put,
                                                           in.S, in.K, in.r, in.t);

  QJsonObject results;
  if (cfg.contracts != ContractSelection::PutOnly)
    results["call"] = greeks_json(v.call, v.prices.call, cfg);
  if (cfg.contracts != ContractSelection::CallOnly)
    results["put"] = greeks_json(v.put, v.prices.put, cfg);
  root["results"] = results;
  return root;
}

void write_report_json(const std::string& path,
                       const bsg::pricing::Valuation& v,
                       const bsg::market::MarketInputs& in,
                       const ReportConfig& cfg) {
  QFile f(QString::fromStdString(path));
  if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
    qWarning() << "[Report] cannot open" << QString::fromStdString(path) << ":" << f.errorString();
    throw std::runtime_error("write_report_json: cannot open " + path);
  }
  const QByteArray bytes = QJsonDocument(report_to_json(v, in, cfg)).toJson(QJsonDocument::Indented);
  if (f.write(bytes) != bytes.size()) {
    throw std::runtime_error("write_report_json: short write to " + path);
  }
  qDebug() << "[Report] written" << QString::fromStdString(path);
}

} // namespace io
} // namespace bsg
