#include "EngNotation.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <locale>
#include <map>
#include <sstream>
#include <system_error>
#include <unicode/utf8.h>

namespace EngNotation {

namespace {

// Keys are exponents of ten. The y/yy tokens repeat on purpose, the table
// is kept exactly as published.
const std::map<int, std::string_view>& prefixTable()
{
  static const std::map<int, std::string_view> table = {
    {-60, "yy"}, {-57, "yr"}, {-54, "yy"}, {-51, "yz"}, {-48, "ya"},
    {-45, "yf"}, {-42, "yp"}, {-39, "yn"}, {-36, "yμ"}, {-33, "ym"},
    {-30, "y"},  {-27, "r"},  {-24, "y"},  {-21, "z"},  {-18, "a"},
    {-15, "f"},  {-12, "p"},  {-9,  "n"},  {-6,  "μ"},  {-3,  "m"},
    {0,   ""},
    {3,   "k"},  {6,   "M"},  {9,   "G"},  {12,  "T"},  {15,  "P"},
    {18,  "E"},  {21,  "Z"},  {24,  "Y"},  {27,  "R"},  {30,  "Q"},
    {33,  "Qk"}, {36,  "QM"}, {39,  "QG"}, {42,  "QT"}, {45,  "QP"},
    {48,  "QE"}, {51,  "QZ"}, {54,  "QY"}, {57,  "QR"}, {60,  "QQ"},
  };
  return table;
}

// number / 10^exponent. Below 1e-300 the power of ten itself goes
// subnormal (or zero), so the scaling is split in two steps.
double scaleDown(double number, int exponent)
{
  if (exponent < -300)
    return (number * 1e300) / std::pow(10.0, exponent + 300);
  return number / std::pow(10.0, exponent);
}

bool isValidUtf8(std::string_view text)
{
  if (text.size() > static_cast<std::size_t>(std::numeric_limits<int32_t>::max()))
    return false;

  const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
  const auto length = static_cast<int32_t>(text.size());
  int32_t i = 0;
  while (i < length) {
    UChar32 c;
    // c < 0 for ill-formed sequences, overlong forms and surrogates
    U8_NEXT(bytes, i, length, c);
    if (c < 0)
      return false;
  }
  return true;
}

std::string describe(double number)
{
  if (std::isnan(number))
    return "nan";
  return number > 0 ? "inf" : "-inf";
}

struct ParameterNames {
  std::string_view function;
  std::string_view number;
  std::string_view unit;
  std::string_view places;
};

constexpr ParameterNames SI_FORM_NAMES{"siForm", "number", "unit", "roundToDecimalPlaces"};
constexpr ParameterNames ENGINEERING_FORM_NAMES{"engineeringForm", "number", "unit", "roundToDecimalPlaces"};
constexpr ParameterNames SIF_NAMES{"sif", "num", "uni", "prec"};
constexpr ParameterNames ENGF_NAMES{"engf", "num", "uni", "prec"};

void validateArguments(const ParameterNames& names, double number,
                       std::string_view unit, int places)
{
  if (!std::isfinite(number))
    throw ValidationError(names.function, names.number,
                          "must be finite, got " + describe(number));
  if (!isValidUtf8(unit))
    throw ValidationError(names.function, names.unit, "must be valid UTF-8 text");
  if (places < 0 || places > MAX_DECIMAL_PLACES)
    throw ValidationError(names.function, names.places,
                          "must be an integer from 0 to " + std::to_string(MAX_DECIMAL_PLACES) +
                          ", got " + std::to_string(places));
}

// Fixed point with exactly `places` decimals, trailing zeros kept.
std::string formatMantissa(double number, int exponent, int places)
{
  // -0.0 would print as "-0.000"
  const double mantissa = number == 0 ? 0.0 : scaleDown(number, exponent);

  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << std::fixed << std::setprecision(places) << mantissa;
  return oss.str();
}

std::string rstrip(std::string s)
{
  auto end = s.find_last_not_of(" \t\r\n");
  s.erase(end == std::string::npos ? 0 : end + 1);
  return s;
}

double parseNumberFor(std::string_view text, std::string_view function,
                      std::string_view parameter)
{
  const std::string shown(text);

  auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos)
    throw ValidationError(function, parameter, "expected a number, got empty text");
  auto end = text.find_last_not_of(" \t\r\n");
  std::string_view trimmed = text.substr(begin, end - begin + 1);

  // from_chars takes '-' but not '+'
  if (trimmed.front() == '+') {
    trimmed.remove_prefix(1);
    if (trimmed.empty() || trimmed.front() == '-' || trimmed.front() == '+')
      throw ValidationError(function, parameter, "not a number: '" + shown + "'");
  }

  // nan and inf are spelled out letters, a number never starts with one
  const char first = trimmed.front() == '-' && trimmed.size() > 1 ? trimmed[1] : trimmed.front();
  if (std::isalpha(static_cast<unsigned char>(first)))
    throw ValidationError(function, parameter, "not a number: '" + shown + "'");

  double value = 0.0;
  const char* last = trimmed.data() + trimmed.size();
  auto [ptr, ec] = std::from_chars(trimmed.data(), last, value);

  if (ec == std::errc::result_out_of_range)
    throw ValidationError(function, parameter, "out of range: '" + shown + "'");
  if (ec != std::errc() || ptr != last)
    throw ValidationError(function, parameter, "not a number: '" + shown + "'");
  if (!std::isfinite(value))
    throw ValidationError(function, parameter, "must be finite, got '" + shown + "'");

  return value;
}

std::string formatSi(double number, std::string_view unit, int places)
{
  const int exponent = engineeringExponent(number);
  std::string out = formatMantissa(number, exponent, places);

  if (auto prefix = siPrefix(exponent)) {
    out += ' ';
    out += *prefix;
  } else {
    // no table entry this far out, fall back to the literal exponent
    out += exponentString(exponent);
    out += ' ';
  }
  out += unit;
  return rstrip(std::move(out));
}

std::string formatEngineering(double number, std::string_view unit, int places)
{
  const int exponent = engineeringExponent(number);
  std::string out = formatMantissa(number, exponent, places) + exponentString(exponent);
  if (!unit.empty()) {
    out += ' ';
    out += unit;
  }
  return out;
}

} // namespace

ValidationError::ValidationError(std::string_view function, std::string_view parameter,
                                 const std::string& reason)
    : std::invalid_argument(std::string(function) + ": invalid parameter '" +
                            std::string(parameter) + "': " + reason),
      m_function(function),
      m_parameter(parameter)
{
}

int engineeringExponent(double number)
{
  if (!std::isfinite(number))
    throw ValidationError("engineeringExponent", "number",
                          "must be finite, got " + describe(number));
  if (number == 0)
    return 0;

  const double magnitude = std::fabs(number);
  int exponent = static_cast<int>(std::floor(std::log10(magnitude)));

  // log10 can land one off right next to an exact power of ten
  const double scaled = scaleDown(magnitude, exponent);
  if (scaled >= 10.0)
    ++exponent;
  else if (scaled < 1.0)
    --exponent;

  // round towards negative infinity to a multiple of 3
  exponent -= ((exponent % 3) + 3) % 3;
  return exponent;
}

std::optional<std::string_view> siPrefix(int exponent)
{
  const auto& table = prefixTable();
  auto it = table.find(exponent);
  if (it == table.end())
    return std::nullopt;
  return it->second;
}

std::string exponentString(int exponent)
{
  if (exponent > 0)
    return "E+" + std::to_string(exponent);
  if (exponent < 0)
    return "E" + std::to_string(exponent);
  return {};
}

std::string siForm(double number, std::string_view unit, int roundToDecimalPlaces)
{
  validateArguments(SI_FORM_NAMES, number, unit, roundToDecimalPlaces);
  return formatSi(number, unit, roundToDecimalPlaces);
}

std::string engineeringForm(double number, std::string_view unit, int roundToDecimalPlaces)
{
  validateArguments(ENGINEERING_FORM_NAMES, number, unit, roundToDecimalPlaces);
  return formatEngineering(number, unit, roundToDecimalPlaces);
}

std::string sif(double num, std::string_view uni, int prec)
{
  validateArguments(SIF_NAMES, num, uni, prec);
  return formatSi(num, uni, prec);
}

std::string engf(double num, std::string_view uni, int prec)
{
  validateArguments(ENGF_NAMES, num, uni, prec);
  return formatEngineering(num, uni, prec);
}

std::string siForm(std::string_view number, std::string_view unit, int roundToDecimalPlaces)
{
  const double value = parseNumberFor(number, SI_FORM_NAMES.function, SI_FORM_NAMES.number);
  return siForm(value, unit, roundToDecimalPlaces);
}

std::string engineeringForm(std::string_view number, std::string_view unit, int roundToDecimalPlaces)
{
  const double value =
      parseNumberFor(number, ENGINEERING_FORM_NAMES.function, ENGINEERING_FORM_NAMES.number);
  return engineeringForm(value, unit, roundToDecimalPlaces);
}

std::string sif(std::string_view num, std::string_view uni, int prec)
{
  return sif(parseNumberFor(num, SIF_NAMES.function, SIF_NAMES.number), uni, prec);
}

std::string engf(std::string_view num, std::string_view uni, int prec)
{
  return engf(parseNumberFor(num, ENGF_NAMES.function, ENGF_NAMES.number), uni, prec);
}

double parseNumber(std::string_view text, std::string_view function)
{
  return parseNumberFor(text, function, "number");
}

std::string format(double number, Notation notation, std::string_view unit,
                   int roundToDecimalPlaces)
{
  switch (notation) {
  case Notation::SI:
    return siForm(number, unit, roundToDecimalPlaces);
  case Notation::Engineering:
    return engineeringForm(number, unit, roundToDecimalPlaces);
  }
  throw ValidationError("format", "notation", "unknown notation");
}

Notation notationFromString(std::string_view name)
{
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "si")
    return Notation::SI;
  if (lower == "engineering" || lower == "eng")
    return Notation::Engineering;

  throw ValidationError("notationFromString", "notation",
                        "expected 'si' or 'engineering', got '" + std::string(name) + "'");
}

std::string_view toString(Notation notation)
{
  return notation == Notation::SI ? "si" : "engineering";
}

} // namespace EngNotation
