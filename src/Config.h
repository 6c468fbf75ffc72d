#ifndef CONFIG_H
#define CONFIG_H

#include <QString>
#include <QVector>
#include "EngNotation.h"

struct Sample {
  double value = 0.0;
  QString unit;
};

class Config
{
public:
  static Config& instance();

  QString defaultConfigPath() const;

  // Missing file is not an error, defaults stay in place.
  // Returns false (and keeps defaults) on parse or validation errors.
  bool load(const QString& path);

  QString configPath() const { return m_configPath; }

  EngNotation::Notation notation() const { return m_notation; }
  void setNotation(EngNotation::Notation notation) { m_notation = notation; }

  QString unit() const { return m_unit; }
  void setUnit(const QString& unit) { m_unit = unit; }

  int precision() const { return m_precision; }
  void setPrecision(int places) { m_precision = places; }

  // Values printed by the demo; [[samples]] replaces the built-in list
  const QVector<Sample>& samples() const { return m_samples; }
  static QVector<Sample> defaultSamples();

  // Formats with the current notation, unit and precision.
  // Throws EngNotation::ValidationError.
  QString format(double value) const;

private:
  Config();

  void reset();

  QString m_configPath;
  EngNotation::Notation m_notation = EngNotation::Notation::SI;
  QString m_unit;
  int m_precision = EngNotation::DEFAULT_DECIMAL_PLACES;
  QVector<Sample> m_samples;
};

#endif
