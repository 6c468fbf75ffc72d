#include "Config.h"
#include <QDir>
#include <QFile>
#include <QDebug>
#include <QStandardPaths>
#include <cmath>
#include <stdexcept>
#include <string>

#include <toml++/toml.h>

Config::Config()
{
    reset();
}

QString Config::defaultConfigPath() const
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::ConfigLocation);
    if (base.isEmpty())
        base = QDir::homePath() + "/.config";

    return QDir(base + "/eng-notation").filePath("config.toml");
}

Config& Config::instance()
{
    static Config cfg;
    return cfg;
}

QVector<Sample> Config::defaultSamples()
{
    return {
        {15050.504, "V"},
        {0, "Ω"},
        {-1, "Ω"},
        {0.00001234, "Ω"},
        {0.001234, "Ω"},
        {0.1234, "Ω"},
        {12.34, "Ω"},
        {1234, "Ω"},
        {123400000, "Ω"},
        {1000, "V"},
        {0.000000001, "A"},
        {-0.00000000001, "A"},
        {1000000000000000, "Ω"},
    };
}

void Config::reset()
{
    m_notation = EngNotation::Notation::SI;
    m_unit.clear();
    m_precision = EngNotation::DEFAULT_DECIMAL_PLACES;
    m_samples = defaultSamples();
}

QString Config::format(double value) const
{
    return QString::fromStdString(
        EngNotation::format(value, m_notation, m_unit.toStdString(), m_precision));
}

bool Config::load(const QString& path)
{
    m_configPath = path;
    reset();

    QFile f(path);
    if (!f.exists()) {
        qDebug() << "Config file does not exist, using defaults:" << path;
        return true;
    }

    try {
        auto tbl = toml::parse_file(path.toStdString());

        EngNotation::Notation notation = m_notation;
        QString unit = m_unit;
        int precision = m_precision;
        QVector<Sample> samples;

        // [format] section
        if (tbl.contains("format")) {
            auto* format = tbl["format"].as_table();
            if (!format)
                throw std::runtime_error("[format] must be a table");

            if (auto node = (*format)["notation"]) {
                auto name = node.value<std::string>();
                if (!name)
                    throw std::runtime_error("format.notation must be a string");
                notation = EngNotation::notationFromString(*name);
            }

            if (auto node = (*format)["unit"]) {
                auto u = node.value<std::string>();
                if (!u)
                    throw std::runtime_error("format.unit must be a string");
                unit = QString::fromStdString(*u);
            }

            if (auto node = (*format)["precision"]) {
                if (!node.is_integer())
                    throw std::runtime_error("format.precision must be an integer");
                auto p = *node.value<int64_t>();
                if (p < 0 || p > EngNotation::MAX_DECIMAL_PLACES)
                    throw std::runtime_error("format.precision out of range: " + std::to_string(p));
                precision = static_cast<int>(p);
            }
        }

        // [[samples]] array
        if (tbl.contains("samples")) {
            auto* arr = tbl["samples"].as_array();
            if (!arr)
                throw std::runtime_error("samples must be an array of tables");

            for (auto& node : *arr) {
                auto* t = node.as_table();
                if (!t)
                    throw std::runtime_error("samples entries must be tables");

                Sample sample;

                auto value = (*t)["value"];
                if (!value.is_number())
                    throw std::runtime_error("samples.value must be a number");
                sample.value = *value.value<double>();
                if (!std::isfinite(sample.value))
                    throw std::runtime_error("samples.value must be finite");

                if (auto u = (*t)["unit"]) {
                    if (!u.is_string())
                        throw std::runtime_error("samples.unit must be a string");
                    sample.unit = QString::fromStdString(*u.value<std::string>());
                }

                samples.append(sample);
            }
        }

        m_notation = notation;
        m_unit = unit;
        m_precision = precision;
        if (!samples.isEmpty())
            m_samples = samples;
    }
    catch (const toml::parse_error& e) {
        qWarning() << "Failed to parse" << path << ":"
                   << QString::fromStdString(std::string(e.description()))
                   << "(line" << e.source().begin.line << ")";
        return false;
    }
    catch (const std::exception& e) {
        qWarning() << "Invalid config" << path << ":" << e.what();
        return false;
    }

    return true;
}
