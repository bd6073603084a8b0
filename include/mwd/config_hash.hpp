/**
 * @file config_hash.hpp
 * @brief Order-independent identity of a service's effective configuration.
 *
 * NormalizeConfig() maps any nlohmann::basic_json (ordered or not) onto a
 * std::map-backed nlohmann::json with integers folded to one signedness and
 * integral floats folded to integers.
 * CanonicalEncode() then writes a type-tagged, length-prefixed byte string
 * with object keys in sorted order, and ConfigHash() prints its 64-bit
 * FNV-1a digest as 16 lowercase hex digits.
 *
 * Encoding:
 * @code
 *   null    n          bool    t | f
 *   integer i<dec>;    float   d<%.17g>;
 *   string  s<len>:<bytes>
 *   array   a<count>[<elem>...]
 *   object  o<count>{<key as string><value>...}
 * @endcode
 */

#ifndef MWD_CONFIG_HASH_HPP_
#define MWD_CONFIG_HASH_HPP_

#include "mwd/platform.hpp"
#include "mwd/record.hpp"
#include "mwd/service_registry.hpp"

#include <nlohmann/json.hpp>

#include <cinttypes>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <string>

namespace mwd {

template <typename BasicJson>
nlohmann::json NormalizeConfig(const BasicJson& in) {
  if (in.is_object()) {
    nlohmann::json out = nlohmann::json::object();
    for (auto it = in.begin(); it != in.end(); ++it) {
      out[it.key()] = NormalizeConfig(it.value());
    }
    return out;
  }
  if (in.is_array()) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& item : in) out.push_back(NormalizeConfig(item));
    return out;
  }
  if (in.is_number_unsigned()) {
    const auto u = in.template get<uint64_t>();
    if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return nlohmann::json(static_cast<int64_t>(u));
    }
    return nlohmann::json(u);
  }
  if (in.is_number_integer()) return nlohmann::json(in.template get<int64_t>());
  if (in.is_number_float()) {
    // Integral floats hash like the integer they equal: 1.0 == 1.
    const double d = in.template get<double>();
    if (std::isfinite(d) && std::trunc(d) == d && d >= -9223372036854775808.0 &&
        d < 9223372036854775808.0) {
      return nlohmann::json(static_cast<int64_t>(d));
    }
    return nlohmann::json(d);
  }
  if (in.is_boolean()) return nlohmann::json(in.template get<bool>());
  if (in.is_string()) return nlohmann::json(in.template get<std::string>());
  if (in.is_binary()) {
    nlohmann::json out = nlohmann::json::array();
    for (auto b : in.get_binary()) out.push_back(static_cast<int64_t>(b));
    return out;
  }
  return nlohmann::json(nullptr);
}

namespace detail {

inline void EncodeString(const std::string& s, std::string& out) {
  out += 's';
  out += std::to_string(s.size());
  out += ':';
  out += s;
}

inline void EncodeCanonical(const nlohmann::json& j, std::string& out) {
  char buf[40];
  switch (j.type()) {
    case nlohmann::json::value_t::null:
      out += 'n';
      break;
    case nlohmann::json::value_t::boolean:
      out += j.get<bool>() ? 't' : 'f';
      break;
    case nlohmann::json::value_t::number_integer:
      std::snprintf(buf, sizeof(buf), "i%" PRId64 ";", j.get<int64_t>());
      out += buf;
      break;
    case nlohmann::json::value_t::number_unsigned:
      std::snprintf(buf, sizeof(buf), "i%" PRIu64 ";", j.get<uint64_t>());
      out += buf;
      break;
    case nlohmann::json::value_t::number_float:
      std::snprintf(buf, sizeof(buf), "d%.17g;", j.get<double>());
      out += buf;
      break;
    case nlohmann::json::value_t::string:
      EncodeString(j.get_ref<const std::string&>(), out);
      break;
    case nlohmann::json::value_t::array:
      out += 'a';
      out += std::to_string(j.size());
      out += '[';
      for (const auto& item : j) EncodeCanonical(item, out);
      out += ']';
      break;
    case nlohmann::json::value_t::object:
      // std::map storage: iteration is already key-sorted.
      out += 'o';
      out += std::to_string(j.size());
      out += '{';
      for (auto it = j.begin(); it != j.end(); ++it) {
        EncodeString(it.key(), out);
        EncodeCanonical(it.value(), out);
      }
      out += '}';
      break;
    default:
      out += 'n';
      break;
  }
}

}  // namespace detail

template <typename BasicJson>
std::string CanonicalEncode(const BasicJson& config) {
  std::string out;
  detail::EncodeCanonical(NormalizeConfig(config), out);
  return out;
}

template <typename BasicJson>
std::string ConfigHash(const BasicJson& config) {
  const std::string canonical = CanonicalEncode(config);
  char hex[17];
  std::snprintf(hex, sizeof(hex), "%016" PRIx64,
                Fnv1a64(canonical.data(), canonical.size()));
  return std::string(hex, 16);
}

/**
 * @brief Service configuration with the submission's per-service overrides
 *        applied as a JSON merge patch.
 */
inline nlohmann::json EffectiveServiceConfig(const Service& service,
                                             const Submission& submission) {
  nlohmann::json effective = service.Config();
  if (!effective.is_object()) effective = nlohmann::json::object();
  auto it = submission.service_params.find(service.Name());
  if (it != submission.service_params.end() && it->is_object()) {
    effective.merge_patch(*it);
  }
  return effective;
}

}  // namespace mwd

#endif  // MWD_CONFIG_HASH_HPP_
