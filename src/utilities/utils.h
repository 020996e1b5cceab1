#ifndef YADWH_UTILITIES_UTILS_H_
#define YADWH_UTILITIES_UTILS_H_

#include <string>

#include <json/json.h>

namespace yadwh {

struct Utils {
  static std::string toBase64(const std::string& data);
  // URL and filename safe alphabet (RFC 4648 §5), padded
  static std::string toBase64Url(const std::string& data);
  // throws std::invalid_argument if `base64` is not a valid padded base64 string
  static std::string fromBase64(std::string base64);

  // removes one pair of surrounding double quotes, TOML style string values are read verbatim by ini_parser
  static std::string stripQuotes(const std::string& value);

  static Json::Value parseJSON(const std::string& json_str);
  static std::string jsonToStr(const Json::Value& json);
};

}  // namespace yadwh

#endif  // YADWH_UTILITIES_UTILS_H_
