#include "utilities/utils.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>

namespace yadwh {

std::string Utils::toBase64(const std::string& data) {
  using base64_text = boost::archive::iterators::base64_from_binary<
      boost::archive::iterators::transform_width<std::string::const_iterator, 6, 8>>;
  std::string res{base64_text(data.begin()), base64_text(data.end())};
  res.append((3 - data.size() % 3) % 3, '=');
  return res;
}

std::string Utils::toBase64Url(const std::string& data) {
  std::string res{toBase64(data)};
  std::replace(res.begin(), res.end(), '+', '-');
  std::replace(res.begin(), res.end(), '/', '_');
  return res;
}

std::string Utils::fromBase64(std::string base64) {
  using base64_binary = boost::archive::iterators::transform_width<
      boost::archive::iterators::binary_from_base64<std::string::const_iterator>, 8, 6>;
  if (base64.empty() || base64.size() % 4 != 0) {
    throw std::invalid_argument("Invalid base64 string length: " + std::to_string(base64.size()));
  }
  std::replace(base64.begin(), base64.end(), '-', '+');
  std::replace(base64.begin(), base64.end(), '_', '/');
  const auto padding_begin{base64.find_last_not_of('=') + 1};
  const size_t padding{base64.size() - padding_begin};
  if (padding > 2) {
    throw std::invalid_argument("Invalid base64 padding");
  }
  std::fill(base64.begin() + static_cast<std::ptrdiff_t>(padding_begin), base64.end(), 'A');
  std::string res;
  try {
    res.assign(base64_binary(base64.cbegin()), base64_binary(base64.cend()));
  } catch (const std::exception& exc) {
    throw std::invalid_argument(std::string("Invalid base64 string: ") + exc.what());
  }
  res.erase(res.size() - padding);
  return res;
}

std::string Utils::stripQuotes(const std::string& value) {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

Json::Value Utils::parseJSON(const std::string& json_str) {
  Json::Value root;
  Json::CharReaderBuilder builder;
  std::string errs;
  std::istringstream stream{json_str};
  if (!Json::parseFromStream(builder, stream, &root, &errs)) {
    throw std::invalid_argument("Failed to parse JSON: " + errs);
  }
  return root;
}

std::string Utils::jsonToStr(const Json::Value& json) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, json);
}

}  // namespace yadwh
