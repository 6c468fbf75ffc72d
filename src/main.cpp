#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QLocale>
#include <QLoggingCategory>
#include <QTextStream>
#include <nlohmann/json.hpp>

#include "Config.h"
#include "EngNotation.h"

using json = nlohmann::json;

Q_LOGGING_CATEGORY(lcEngNotation, "engnotation", QtWarningMsg)

namespace {

json describeValue(const QString& input, double value, const QString& unit, int precision)
{
    const std::string u = unit.toStdString();
    json j = json::object();
    j["input"] = input.toStdString();
    j["value"] = value;
    j["exponent"] = EngNotation::engineeringExponent(value);
    j["si"] = EngNotation::siForm(value, u, precision);
    j["engineering"] = EngNotation::engineeringForm(value, u, precision);
    return j;
}

QString shortest(double value)
{
    return QString::number(value, 'g', QLocale::FloatingPointShortest);
}

// Prints every configured sample in both notations.
// A sample that fails is reported and skipped. Returns false if any failed.
bool printDemo(const Config& cfg, QTextStream& out)
{
    bool ok = true;
    bool first = true;
    for (const auto& sample : cfg.samples()) {
        const QString unit = sample.unit.isEmpty() ? cfg.unit() : sample.unit;
        const std::string u = unit.toStdString();

        try {
            const QString si =
                QString::fromStdString(EngNotation::siForm(sample.value, u, cfg.precision()));
            const QString eng =
                QString::fromStdString(EngNotation::engineeringForm(sample.value, u, cfg.precision()));

            if (!first)
                out << Qt::endl;
            first = false;

            out << "Value:     " << shortest(sample.value) << Qt::endl;
            out << "SI Form:   " << si << Qt::endl;
            out << "Eng. Form: " << eng << Qt::endl;
        }
        catch (const EngNotation::ValidationError& e) {
            qCritical() << "Sample" << shortest(sample.value) << "failed:" << e.what();
            ok = false;
        }
    }
    return ok;
}

bool demoJson(const Config& cfg, json& arr)
{
    bool ok = true;
    for (const auto& sample : cfg.samples()) {
        const QString unit = sample.unit.isEmpty() ? cfg.unit() : sample.unit;
        try {
            arr.push_back(describeValue(shortest(sample.value), sample.value, unit, cfg.precision()));
        }
        catch (const EngNotation::ValidationError& e) {
            qCritical() << "Sample" << shortest(sample.value) << "failed:" << e.what();
            ok = false;
        }
    }
    return ok;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("engnotation");
    QCoreApplication::setApplicationVersion("1.2.1");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Formats numbers with SI prefixes (1.500 kV) or in engineering notation (1.500E+3 V).\n"
        "Use -- before negative values, e.g. engnotation -u A -- -1e-11\n"
        "Set QT_LOGGING_RULES=\"engnotation.debug=true\" to log the effective settings.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption notationOpt({"n", "notation"}, "Notation: si or engineering.", "notation");
    QCommandLineOption unitOpt({"u", "unit"}, "Unit appended after the prefix.", "unit");
    QCommandLineOption precisionOpt({"p", "precision"}, "Decimal places of the mantissa.", "places");
    QCommandLineOption configOpt({"c", "config"}, "TOML configuration file.", "path");
    QCommandLineOption jsonOpt("json", "Print results as JSON.");
    QCommandLineOption demoOpt("demo", "Print the sample values in both notations.");
    parser.addOptions({notationOpt, unitOpt, precisionOpt, configOpt, jsonOpt, demoOpt});
    parser.addPositionalArgument("values", "Numbers to format.", "[values...]");

    parser.process(app);

    Config& cfg = Config::instance();
    const QString configPath =
        parser.isSet(configOpt) ? parser.value(configOpt) : cfg.defaultConfigPath();
    if (!cfg.load(configPath)) {
        qCritical() << "Cannot load configuration" << configPath;
        return 2;
    }

    if (parser.isSet(notationOpt)) {
        try {
            cfg.setNotation(EngNotation::notationFromString(parser.value(notationOpt).toStdString()));
        }
        catch (const EngNotation::ValidationError& e) {
            qCritical() << e.what();
            return 1;
        }
    }

    if (parser.isSet(unitOpt))
        cfg.setUnit(parser.value(unitOpt));

    if (parser.isSet(precisionOpt)) {
        bool ok = false;
        const int places = parser.value(precisionOpt).toInt(&ok);
        if (!ok || places < 0 || places > EngNotation::MAX_DECIMAL_PLACES) {
            qCritical() << "Precision must be an integer from 0 to" << EngNotation::MAX_DECIMAL_PLACES
                        << "got" << parser.value(precisionOpt);
            return 1;
        }
        cfg.setPrecision(places);
    }

    const std::string_view notationName = EngNotation::toString(cfg.notation());
    qCDebug(lcEngNotation) << "Notation" << QString::fromUtf8(notationName.data(), notationName.size())
             << "unit" << cfg.unit() << "precision" << cfg.precision();

    QTextStream out(stdout);
    const QStringList values = parser.positionalArguments();
    const bool asJson = parser.isSet(jsonOpt);
    int exitCode = 0;

    if (values.isEmpty() || parser.isSet(demoOpt)) {
        bool ok = true;
        if (asJson) {
            json arr = json::array();
            ok = demoJson(cfg, arr);
            out << QString::fromStdString(arr.dump(4)) << Qt::endl;
        } else {
            ok = printDemo(cfg, out);
        }
        if (!ok)
            exitCode = 1;
    }

    json results = json::array();
    for (const QString& text : values) {
        try {
            const double value = EngNotation::parseNumber(text.toStdString(), "engnotation");
            if (asJson)
                results.push_back(describeValue(text, value, cfg.unit(), cfg.precision()));
            else
                out << cfg.format(value) << Qt::endl;
        }
        catch (const EngNotation::ValidationError& e) {
            qCritical() << e.what();
            exitCode = 1;
        }
    }

    if (asJson && !values.isEmpty())
        out << QString::fromStdString(results.dump(4)) << Qt::endl;

    return exitCode;
}
