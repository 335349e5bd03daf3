#include <bsg/market/contract.hpp>
#include <bsg/core/errors.hpp>

#include <algorithm>
#include <cctype>

namespace bsg {
namespace market {

namespace {
std::string lower_trim(std::string s) {
  auto notsp = [](unsigned char ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
  s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}
} // unnamed namespace

std::string to_string(ContractType type) {
  switch (type) {
    case ContractType::Call: return "call";
    case ContractType::Put:  return "put";
  }
  throw bsg::core::InvalidContractType("to_string: unknown contract type");
}

ContractType parse_contract_type(const std::string& text) {
  const std::string s = lower_trim(text);
  if (s == "c" || s == "call") return ContractType::Call;
  if (s == "p" || s == "put")  return ContractType::Put;
  throw bsg::core::InvalidContractType("parse_contract_type: expected call|put, got '" + text + "'");
}

} // namespace market
} // namespace bsg
