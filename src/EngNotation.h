// EngNotation.h
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace EngNotation {

constexpr int DEFAULT_DECIMAL_PLACES = 3;
// Upper bound for the decimal places of the mantissa
constexpr int MAX_DECIMAL_PLACES = 100;

enum class Notation { SI, Engineering };

// Thrown for every rejected argument. what() reads like
//   "siForm: invalid parameter 'number': must be finite, got nan"
class ValidationError : public std::invalid_argument {
public:
  ValidationError(std::string_view function, std::string_view parameter,
                  const std::string& reason);

  const std::string& function() const noexcept { return m_function; }
  const std::string& parameter() const noexcept { return m_parameter; }

private:
  std::string m_function;
  std::string m_parameter;
};

// Largest multiple of 3 such that 1 <= |number / 10^e| < 1000.
// Zero yields 0. Throws ValidationError for NaN and infinities.
//   engineeringExponent(15050.5)  -> 3
//   engineeringExponent(0.00099)  -> -6   (990 u, not 0.99 m)
int engineeringExponent(double number);

// Prefix token for a table exponent; "" for 0, std::nullopt outside the table.
std::optional<std::string_view> siPrefix(int exponent);

// "E+3", "E-6", "" for 0.
std::string exponentString(int exponent);

// Samples:
//   siForm(1000, "V")       -> "1.000 kV"
//   siForm(1e-9, "A", 2)    -> "1.00 nA"
//   siForm(12.5)            -> "12.500"
std::string siForm(double number, std::string_view unit = "",
                   int roundToDecimalPlaces = DEFAULT_DECIMAL_PLACES);

// Samples:
//   engineeringForm(1e15, "Ω")   -> "1.000E+15 Ω"
//   engineeringForm(-1e-11, "A") -> "-10.000E-12 A"
std::string engineeringForm(double number, std::string_view unit = "",
                            int roundToDecimalPlaces = DEFAULT_DECIMAL_PLACES);

// Short aliases
std::string sif(double num, std::string_view uni = "", int prec = DEFAULT_DECIMAL_PLACES);
std::string engf(double num, std::string_view uni = "", int prec = DEFAULT_DECIMAL_PLACES);

// Text front end: the number is parsed first, so siForm("abc") throws
// ValidationError for parameter "number".
std::string siForm(std::string_view number, std::string_view unit = "",
                   int roundToDecimalPlaces = DEFAULT_DECIMAL_PLACES);
std::string engineeringForm(std::string_view number, std::string_view unit = "",
                            int roundToDecimalPlaces = DEFAULT_DECIMAL_PLACES);
std::string sif(std::string_view num, std::string_view uni = "", int prec = DEFAULT_DECIMAL_PLACES);
std::string engf(std::string_view num, std::string_view uni = "", int prec = DEFAULT_DECIMAL_PLACES);

// Accepts "15050.504", " -1e-9 ", "+3". Rejects empty text, trailing
// characters, out of range literals and nan/inf spellings.
// Errors are reported for `function`, parameter "number".
double parseNumber(std::string_view text, std::string_view function = "parseNumber");

std::string format(double number, Notation notation, std::string_view unit = "",
                   int roundToDecimalPlaces = DEFAULT_DECIMAL_PLACES);

// "si", "engineering" or "eng", case insensitive
Notation notationFromString(std::string_view name);
std::string_view toString(Notation notation);

} // namespace EngNotation
