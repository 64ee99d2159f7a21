#include <cstring>

#include "sealdrop/error.hpp"

namespace sealdrop {

const char* kind_name(int kind){
  switch (kind){
    case ERR_NONE:      return "ok";
    case ERR_TRANSPORT: return "transport";
    case ERR_FRAMING:   return "framing";
    case ERR_AUTH:      return "authentication";
    case ERR_INTEGRITY: return "integrity";
    case ERR_LOCAL_IO:  return "local-io";
    case ERR_CRYPTO:    return "crypto";
    default:            return "unknown";
  }
}

int Error::set(int k, const std::string& s, int e, const std::string& d){
  kind = k;
  step = s;
  sys = e;
  detail = d;
  return k;
}

std::string Error::str() const {
  std::string out = kind_name(kind);
  if (!step.empty()) out += " error at '" + step + "'";
  if (sys != 0) {
    out += ": ";
    out += std::strerror(sys);
  }
  if (!detail.empty()) out += " (" + detail + ")";
  return out;
}

}
